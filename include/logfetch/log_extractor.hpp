#pragma once

#include "logfetch/component_kind.hpp"
#include "logfetch/environment.hpp"
#include "logfetch/stager.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace logfetch {

inline constexpr std::uint32_t kDefaultTailLines = 100;

struct LogSelection {
    enum class Source {
        None,
        Alert,   // every alert*.log in the trace directory
        Latest,  // newest *.log, no alert log present
    };

    Source source = Source::None;
    std::vector<std::string> files;
};

struct ExtractOptions {
    bool filter = false;
    std::uint32_t tail_lines = kDefaultTailLines;
};

struct ComponentSummary {
    ComponentKind kind = ComponentKind::Database;
    size_t homes = 0;
    size_t files_processed = 0;
    size_t files_staged = 0;
    size_t warnings = 0;
};

class LogExtractor {
  public:
    // `stager` may be null when archiving is off. `out` receives the rendered
    // log text; warnings go through the logger.
    LogExtractor(ExtractOptions opt, std::ostream& out, ILogStager* stager);

    // Fails only with kCancelled (interrupt, or `out` went bad); per-file and
    // per-home problems are warnings.
    Result ExtractComponent(ComponentKind kind,
                            const std::vector<DiagnosticHome>& homes,
                            ComponentSummary& summary);

    Result ExtractHome(const DiagnosticHome& home, ComponentSummary& summary);

    // Non-recursive. A missing trace directory yields Source::None.
    static LogSelection SelectLogs(const std::string& trace_dir);

  private:
    bool RenderFile(const std::string& path);
    void StageFile(const std::string& path, ComponentSummary& summary);

    ExtractOptions opt_;
    std::ostream& out_;
    ILogStager* stager_;
};

// Last `max_lines` lines of `path`, read backwards from the end.
Result ReadTailLines(const std::string& path, size_t max_lines, std::vector<std::string>& out);

// Every line containing "error", "warn" or "ORA-", case-insensitively.
Result ReadMatchingLines(const std::string& path, std::vector<std::string>& out);

bool IsHighlightLine(std::string_view line);

} // namespace logfetch
