#include "logfetch/log_collector.hpp"

#include "logfetch/environment_probe.hpp"
#include "logfetch/home_catalog.hpp"
#include "logfetch/selector.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <istream>
#include <optional>
#include <ostream>

namespace logfetch {

void RunConfig::ApplyProfile() {
    if (profile.tail_lines) tail_lines = *profile.tail_lines;
    if (!profile.archive_dir.empty()) archive_dir = profile.archive_dir;
}

LogCollector::LogCollector() : LogCollector(nullptr) {}

LogCollector::LogCollector(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {}

Result LogCollector::Run(const RunConfig& cfg,
                         std::istream& in,
                         std::ostream& out,
                         RunSummary& summary) const {
    summary = RunSummary{};
    g_cancel.store(false, std::memory_order_relaxed);

    EnvironmentProbe probe(runner_);
    if (system_path_) probe.SetSystemPath(*system_path_);

    Environment& env = summary.environment;
    auto probe_res = probe.Probe(cfg.identity, cfg.profile, env);
    if (!probe_res.is_ok()) {
        if (probe_res.err != kQueryFailed) return probe_res;
        LogWarn("%s; continuing with base %s", probe_res.msg.c_str(), env.base_dir.c_str());
    }

    Selection selection;
    auto sel_res = cfg.component ? Selector::Resolve(*cfg.component, env, selection)
                                 : Selector::RunMenu(env, in, out, selection);
    if (!sel_res.is_ok()) return sel_res;

    HomeCatalog catalog(runner_);
    std::vector<ComponentHomes> homes;
    for (ComponentKind kind : selection.kinds) {
        ComponentHomes entry;
        entry.kind = kind;
        auto r = catalog.ListHomes(ComponentRequest::Of(kind), env, entry.homes);
        if (!r.is_ok()) {
            LogWarn("cannot list %s homes: %s", ComponentName(kind), r.msg.c_str());
        }
        homes.push_back(std::move(entry));
    }

    auto coverage = Selector::CheckCoverage(homes);
    if (!coverage.is_ok()) return coverage;

    // From here on the staging area must be removed on every path out,
    // including an interrupt; the destructor takes care of early returns.
    // The handlers outlive the archive so cleanup itself is not cut short.
    std::optional<ScopedSignalHandlers> signals;
    ArchiveManager archive(staging_ops_);
    if (cfg.archive) {
        auto open_res = archive.Open(cfg.staging_base);
        if (!open_res.is_ok()) {
            LogWarn("cannot create staging area, archiving disabled: %s", open_res.msg.c_str());
        } else {
            signals.emplace();
        }
    }

    ExtractOptions xopt;
    xopt.filter = cfg.filter;
    xopt.tail_lines = cfg.tail_lines;
    LogExtractor extractor(xopt, out, archive.IsOpen() ? &archive : nullptr);

    for (const auto& entry : homes) {
        if (entry.homes.empty()) continue;

        ComponentSummary cs;
        auto r = extractor.ExtractComponent(entry.kind, entry.homes, cs);
        summary.components.push_back(cs);
        summary.files_processed += cs.files_processed;
        summary.files_staged += cs.files_staged;
        if (!r.is_ok()) return r;
    }

    if (archive.IsOpen()) {
        ArchiveManager::SealResult sealed;
        const std::time_t now = clock_ ? clock_() : std::time(nullptr);
        auto seal_res = archive.Seal(cfg.archive_dir, now, sealed);
        if (!seal_res.is_ok()) {
            LogWarn("%s", seal_res.msg.c_str());
        } else if (sealed.sealed) {
            summary.archive_path = sealed.archive_path;
        }
        archive.Close();
    }

    PrintSummary(summary, out);
    return Result::Ok();
}

void PrintSummary(const RunSummary& summary, std::ostream& out) {
    size_t homes = 0;
    for (const auto& c : summary.components) homes += c.homes;

    out << "Done: " << summary.components.size() << " component(s), " << homes << " home(s), "
        << summary.files_processed << " log file(s)";
    if (summary.archive_path) {
        out << ", archive " << *summary.archive_path;
    } else {
        out << ", no archive";
    }
    out << "\n" << std::flush;
}

} // namespace logfetch
