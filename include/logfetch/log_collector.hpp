#pragma once

#include "io/command_runner.hpp"
#include "logfetch/archive_manager.hpp"
#include "logfetch/component_kind.hpp"
#include "logfetch/environment.hpp"
#include "logfetch/log_extractor.hpp"
#include "util/profile.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <ctime>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace logfetch {

inline constexpr const char kDefaultArchiveDir[] = "/tmp";

// Everything one run needs, fixed before the run starts.
struct RunConfig {
    bool archive = false;
    bool filter = false;
    // Unset means: ask on the interactive menu.
    std::optional<ComponentRequest> component;

    Identity identity;
    Profile profile;

    std::uint32_t tail_lines = kDefaultTailLines;
    std::string archive_dir = kDefaultArchiveDir;
    std::string staging_base = kDefaultArchiveDir;

    // Fills tail_lines/archive_dir from the profile where it sets them.
    void ApplyProfile();
};

struct RunSummary {
    Environment environment;
    std::vector<ComponentSummary> components;
    std::optional<std::string> archive_path;
    size_t files_processed = 0;
    size_t files_staged = 0;
};

class LogCollector {
  public:
    LogCollector();
    explicit LogCollector(std::shared_ptr<const ICommandRunner> runner);

    void SetSystemPath(std::vector<std::string> dirs) { system_path_ = std::move(dirs); }
    void SetStagingOps(std::shared_ptr<const ArchiveManager::ISystemOps> ops) { staging_ops_ = std::move(ops); }
    void SetClock(std::time_t (*clock)()) { clock_ = clock; }

    // `in` feeds the interactive menu, `out` receives the menu, rendered logs
    // and the final summary. Fatal conditions come back as a failed Result.
    Result Run(const RunConfig& cfg, std::istream& in, std::ostream& out, RunSummary& summary) const;

  private:
    std::shared_ptr<const ICommandRunner> runner_;
    std::optional<std::vector<std::string>> system_path_;
    std::shared_ptr<const ArchiveManager::ISystemOps> staging_ops_;
    std::time_t (*clock_)() = nullptr;
};

void PrintSummary(const RunSummary& summary, std::ostream& out);

} // namespace logfetch
