#pragma once

#include "io/command_runner.hpp"
#include "logfetch/environment.hpp"
#include "util/profile.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logfetch {

inline constexpr const char kAdrciName[] = "adrci";
inline constexpr const char kProfileFileName[] = ".logfetch.json";

// Builds the adrci invocation for one ADRCI command, e.g. "show homes".
CommandSpec MakeAdrciCommand(const Environment& env, std::string_view adrci_command);

class EnvironmentProbe {
  public:
    EnvironmentProbe();
    explicit EnvironmentProbe(std::shared_ptr<const ICommandRunner> runner);

    // Loads `explicit_path`, or ~identity/.logfetch.json when empty. A missing
    // or broken profile is a warning: `out` is left empty and tool location
    // hints from it are lost. Environment variables are applied either way.
    static void LoadProfile(const Identity& identity,
                            const std::string& explicit_path,
                            Profile& out);

    // Fails with kToolUnavailable when adrci cannot be located (fatal), or with
    // kQueryFailed when a query did not succeed; in the latter case `out` is
    // still fully populated with fallbacks.
    Result Probe(const Identity& identity, const Profile& profile, Environment& out) const;

    Result LocateTool(const Profile& profile, std::string& out_path) const;

    // Replaces the $PATH directories searched last.
    void SetSystemPath(std::vector<std::string> dirs) { system_path_ = std::move(dirs); }

    // Extracts the directory from `ADR base is "/u01/app/oracle"`.
    static bool ParseShowBase(std::string_view output, std::string& out_base);

    static void ComputeCapabilities(std::string_view listing, Environment& env);

    static std::string FallbackBaseDir(const Identity& identity, const Profile& profile);

  private:
    std::shared_ptr<const ICommandRunner> runner_;
    std::vector<std::string> system_path_;
};

} // namespace logfetch
