#include "logfetch/environment_probe.hpp"

#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace logfetch {

namespace {

constexpr const char kDefaultBaseRoot[] = "/u01/app";

struct QueryOutcome {
    bool ok = false;
    std::string output;
    std::string error;
};

QueryOutcome RunAdrci(const ICommandRunner& runner, const Environment& env, std::string_view command) {
    QueryOutcome q;
    CommandOutput out;
    auto r = runner.Run(MakeAdrciCommand(env, command), out);
    if (!r.is_ok()) {
        q.error = r.msg;
        return q;
    }
    q.output = std::move(out.output);
    if (out.exit_code != 0) {
        q.error = "adrci exec=\"" + std::string(command) + "\" exited with status " +
                  std::to_string(out.exit_code);
        return q;
    }
    q.ok = true;
    return q;
}

} // namespace

CommandSpec MakeAdrciCommand(const Environment& env, std::string_view adrci_command) {
    CommandSpec spec;
    spec.argv = {env.adrci_path, "exec=" + std::string(adrci_command)};
    spec.env = env.tool_env;
    return spec;
}

EnvironmentProbe::EnvironmentProbe() : EnvironmentProbe(nullptr) {}

EnvironmentProbe::EnvironmentProbe(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {
    if (const char* path = std::getenv("PATH")) {
        system_path_ = SplitSearchPath(path);
    }
}

void EnvironmentProbe::LoadProfile(const Identity& identity,
                                   const std::string& explicit_path,
                                   Profile& out) {
    std::string path = explicit_path;
    if (path.empty() && !identity.home_dir.empty()) {
        path = (fs::path(identity.home_dir) / kProfileFileName).string();
    }

    if (path.empty()) {
        LogWarn("no home directory for %s; profile not loaded", identity.name.c_str());
        out = Profile{};
    } else {
        auto r = Profile::LoadFile(path, out);
        if (!r.is_ok() && r.err == ENOENT) {
            LogWarn("profile %s not found; tool location hints unavailable", path.c_str());
        } else if (!r.is_ok()) {
            LogWarn("ignoring profile: %s", r.msg.c_str());
        } else {
            LogDebug("loaded profile %s", path.c_str());
        }
    }

    out.ApplyEnvironment();
}

Result EnvironmentProbe::LocateTool(const Profile& profile, std::string& out_path) const {
    out_path.clear();

    if (!profile.adrci_path.empty()) {
        if (IsExecutableFile(profile.adrci_path)) {
            out_path = profile.adrci_path;
            return Result::Ok();
        }
        LogWarn("AdrciPath %s is not executable", profile.adrci_path.c_str());
    }

    std::vector<std::string> dirs;
    if (!profile.oracle_home.empty()) {
        dirs.push_back((fs::path(profile.oracle_home) / "bin").string());
    }
    dirs.insert(dirs.end(), profile.search_path.begin(), profile.search_path.end());
    dirs.insert(dirs.end(), system_path_.begin(), system_path_.end());

    out_path = FindExecutable(kAdrciName, dirs);
    if (out_path.empty()) {
        return Result::Fail(kToolUnavailable,
                            "adrci not found (set ORACLE_HOME, or OracleHome/AdrciPath in the profile)");
    }
    return Result::Ok();
}

bool EnvironmentProbe::ParseShowBase(std::string_view output, std::string& out_base) {
    constexpr std::string_view kMarker = "ADR base is";
    for (const auto& raw : SplitLines(output)) {
        std::string_view line = Trim(raw);
        const size_t pos = line.find(kMarker);
        if (pos == std::string_view::npos) continue;

        std::string_view rest = Trim(line.substr(pos + kMarker.size()));
        if (!rest.empty() && rest.front() == '"') {
            rest.remove_prefix(1);
            const size_t end = rest.find('"');
            if (end == std::string_view::npos) return false;
            rest = rest.substr(0, end);
        }
        if (rest.empty()) return false;
        out_base = std::string(rest);
        return true;
    }
    return false;
}

void EnvironmentProbe::ComputeCapabilities(std::string_view listing, Environment& env) {
    for (ComponentKind k : kAllComponentKinds) {
        env.Set(k, listing.find(ComponentListingMarker(k)) != std::string_view::npos);
    }
}

std::string EnvironmentProbe::FallbackBaseDir(const Identity& identity, const Profile& profile) {
    if (!profile.default_adr_base.empty()) return profile.default_adr_base;
    return (fs::path(kDefaultBaseRoot) / identity.name).string();
}

Result EnvironmentProbe::Probe(const Identity& identity, const Profile& profile, Environment& out) const {
    out = Environment{};
    out.base_dir = FallbackBaseDir(identity, profile);

    auto located = LocateTool(profile, out.adrci_path);
    if (!located.is_ok()) return located;
    LogDebug("adrci: %s", out.adrci_path.c_str());

    if (!profile.oracle_home.empty()) out.tool_env.emplace_back("ORACLE_HOME", profile.oracle_home);
    if (!profile.adr_base.empty()) out.tool_env.emplace_back("ADR_BASE", profile.adr_base);

    std::string failure;

    auto base_q = RunAdrci(*runner_, out, "show base");
    std::string reported_base;
    if (!base_q.ok) {
        failure = base_q.error;
    } else if (!ParseShowBase(base_q.output, reported_base)) {
        failure = "unexpected 'show base' output";
    }

    if (!profile.adr_base.empty()) {
        out.base_dir = profile.adr_base;
    } else if (!reported_base.empty()) {
        out.base_dir = reported_base;
    }

    auto homes_q = RunAdrci(*runner_, out, "show homes");
    if (!homes_q.ok && failure.empty()) {
        failure = homes_q.error;
    }
    // Partial output from a failed run still counts toward capabilities.
    out.homes_listing = std::move(homes_q.output);
    ComputeCapabilities(out.homes_listing, out);

    LogDebug("base=%s database=%d asm=%d crs=%d listener=%d",
             out.base_dir.c_str(),
             out.has_database, out.has_asm, out.has_crs, out.has_listener);

    if (!failure.empty()) {
        out.query_failed = true;
        return Result::Fail(kQueryFailed, "diagnostic query failed: " + failure);
    }
    return Result::Ok();
}

} // namespace logfetch
