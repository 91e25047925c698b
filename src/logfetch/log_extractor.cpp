#include "logfetch/log_extractor.hpp"

#include "io/file_info.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <optional>
#include <ostream>

namespace fs = std::filesystem;

namespace logfetch {

namespace {

constexpr const char kTraceDir[] = "trace";
constexpr const char kAlertPattern[] = "alert*.log";
constexpr const char kGenericPattern[] = "*.log";
constexpr size_t kTailChunk = 64 * 1024;

constexpr std::array<std::string_view, 3> kHighlightPatterns = {"error", "warn", "ora-"};

bool MatchesGlob(const char* pattern, const std::string& name) {
    return ::fnmatch(pattern, name.c_str(), FNM_PERIOD) == 0;
}

// Files matching `pattern` in directory listing order.
std::vector<fs::path> ListMatching(const fs::path& dir, const char* pattern, std::string& err) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = ec.message();
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            err = ec.message();
            break;
        }
        const fs::path& p = it->path();
        if (!MatchesGlob(pattern, p.filename().string())) continue;

        // Directories and other non-files never count. A link whose target
        // cannot be resolved is kept so the read failure gets reported.
        std::error_code sec;
        const fs::file_type type = it->status(sec).type();
        if (!sec && type != fs::file_type::regular && type != fs::file_type::not_found) {
            LogDebug("skipping %s: not a regular file", p.c_str());
            continue;
        }
        out.push_back(p);
    }
    return out;
}

} // namespace

bool IsHighlightLine(std::string_view line) {
    for (auto pattern : kHighlightPatterns) {
        if (ContainsIgnoreCase(line, pattern)) return true;
    }
    return false;
}

Result ReadTailLines(const std::string& path, size_t max_lines, std::vector<std::string>& out) {
    out.clear();

    FileReader reader;
    auto open_res = FileReader::Open(path, reader);
    if (!open_res.is_ok()) return open_res;

    const std::uint64_t size = reader.TotalSize().value_or(0);
    if (size == 0 || max_lines == 0) return Result::Ok();

    std::string tail;
    std::vector<std::uint8_t> buf(kTailChunk);
    std::uint64_t pos = size;
    size_t newlines = 0;
    bool done = false;
    bool at_end = true;

    while (pos > 0 && !done) {
        const size_t len = static_cast<size_t>(std::min<std::uint64_t>(kTailChunk, pos));
        pos -= len;

        size_t got = 0;
        while (got < len) {
            const ssize_t n = reader.ReadAt(std::span<std::uint8_t>(buf.data() + got, len - got), pos + got);
            if (n < 0) {
                const int err = errno;
                return Result::Fail(err, "read failed: " + path + " (" + std::strerror(err) + ")");
            }
            if (n == 0) {
                return Result::Fail(kUnreadableLog, "unexpected end of file: " + path);
            }
            got += static_cast<size_t>(n);
        }

        size_t keep_from = 0;
        for (size_t i = len; i-- > 0;) {
            if (buf[i] != '\n') continue;
            // The newline terminating the last line does not start a new one.
            if (at_end && pos + i == size - 1) continue;
            if (++newlines == max_lines) {
                keep_from = i + 1;
                done = true;
                break;
            }
        }
        at_end = false;
        tail.insert(0, reinterpret_cast<const char*>(buf.data()) + keep_from, len - keep_from);
    }

    out = SplitLines(tail);
    return Result::Ok();
}

Result ReadMatchingLines(const std::string& path, std::vector<std::string>& out) {
    out.clear();
    std::ifstream is(path);
    if (!is.good()) {
        const int err = errno;
        return Result::Fail(err ? err : kUnreadableLog,
                            "cannot open " + path + (err ? std::string(" (") + std::strerror(err) + ")" : ""));
    }
    std::string line;
    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (IsHighlightLine(line)) out.push_back(line);
    }
    if (is.bad()) {
        return Result::Fail(kUnreadableLog, "read failed: " + path);
    }
    return Result::Ok();
}

LogExtractor::LogExtractor(ExtractOptions opt, std::ostream& out, ILogStager* stager)
    : opt_(opt), out_(out), stager_(stager) {}

LogSelection LogExtractor::SelectLogs(const std::string& trace_dir) {
    LogSelection sel;

    std::error_code ec;
    if (!fs::is_directory(trace_dir, ec)) {
        return sel;
    }

    std::string err;
    auto alerts = ListMatching(trace_dir, kAlertPattern, err);
    if (!err.empty()) {
        LogWarn("cannot list %s: %s", trace_dir.c_str(), err.c_str());
        return sel;
    }
    if (!alerts.empty()) {
        std::sort(alerts.begin(), alerts.end());
        sel.source = LogSelection::Source::Alert;
        for (const auto& p : alerts) sel.files.push_back(p.string());
        return sel;
    }

    auto logs = ListMatching(trace_dir, kGenericPattern, err);
    if (!err.empty()) {
        LogWarn("cannot list %s: %s", trace_dir.c_str(), err.c_str());
        return sel;
    }
    if (logs.empty()) return sel;

    // Equal timestamps keep the earlier entry in listing order.
    size_t best = 0;
    std::optional<fs::file_time_type> best_time;
    for (size_t i = 0; i < logs.size(); ++i) {
        std::error_code tec;
        const auto t = fs::last_write_time(logs[i], tec);
        if (tec) continue;
        if (!best_time || t > *best_time) {
            best = i;
            best_time = t;
        }
    }

    sel.source = LogSelection::Source::Latest;
    sel.files.push_back(logs[best].string());
    return sel;
}

bool LogExtractor::RenderFile(const std::string& path) {
    std::vector<std::string> lines;
    auto r = ReadTailLines(path, opt_.tail_lines, lines);
    if (!r.is_ok()) {
        LogWarn("cannot read %s: %s [%s]", path.c_str(), r.msg.c_str(), DescribeAccess(path).c_str());
        return false;
    }

    out_ << "==> " << path << " <==\n";
    for (const auto& line : lines) out_ << line << "\n";

    if (opt_.filter) {
        std::vector<std::string> matches;
        auto fr = ReadMatchingLines(path, matches);
        if (!fr.is_ok()) {
            LogWarn("cannot filter %s: %s [%s]", path.c_str(), fr.msg.c_str(), DescribeAccess(path).c_str());
        } else {
            out_ << "--- matches (error|warn|ORA-) in " << path << " ---\n";
            for (const auto& line : matches) out_ << line << "\n";
        }
    }
    out_ << std::flush;
    return true;
}

void LogExtractor::StageFile(const std::string& path, ComponentSummary& summary) {
    const StageResult sr = stager_->Stage(path);
    if (sr.ok) {
        ++summary.files_staged;
        LogDebug("staged %s -> %s", path.c_str(), sr.dest.c_str());
        return;
    }

    ++summary.warnings;
    const std::string& dir = stager_->Dir();
    LogWarn("copy of %s to %s failed: %s [source: %s] [staging dir: %s, %s]",
            path.c_str(),
            dir.c_str(),
            sr.cause.c_str(),
            DescribeAccess(path).c_str(),
            DescribeAccess(dir).c_str(),
            ProbeWritable(dir).c_str());
}

Result LogExtractor::ExtractHome(const DiagnosticHome& home, ComponentSummary& summary) {
    const std::string trace_dir = (fs::path(home.path) / kTraceDir).string();
    const LogSelection sel = SelectLogs(trace_dir);
    if (sel.source == LogSelection::Source::None) {
        LogDebug("%s: nothing to extract", trace_dir.c_str());
        return Result::Ok();
    }

    for (const auto& file : sel.files) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            return Result::Fail(kCancelled, "interrupted");
        }

        if (RenderFile(file)) {
            ++summary.files_processed;
        } else {
            ++summary.warnings;
        }
        // A reader that went away (closed pipe) ends the run like an interrupt.
        if (!out_) {
            return Result::Fail(kCancelled, "output closed");
        }

        if (stager_) StageFile(file, summary);
    }
    return Result::Ok();
}

Result LogExtractor::ExtractComponent(ComponentKind kind,
                                      const std::vector<DiagnosticHome>& homes,
                                      ComponentSummary& summary) {
    summary = ComponentSummary{};
    summary.kind = kind;

    for (const auto& home : homes) {
        ++summary.homes;
        auto r = ExtractHome(home, summary);
        if (!r.is_ok()) return r;
    }

    if (summary.files_processed == 0) {
        LogWarn("no logs found for %s", ComponentName(kind));
    }
    return Result::Ok();
}

} // namespace logfetch
