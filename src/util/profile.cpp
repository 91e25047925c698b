#include "util/profile.hpp"

#include "util/config_json_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>

namespace logfetch {

std::expected<Profile, std::string> Profile::Parse(const std::string& json_input) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_input);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_object()) {
        return std::unexpected(std::string("profile must be a JSON object"));
    }

    Profile p;
    std::string err;
    if (!config::detail::FillProfileFromJson(j, p, err)) {
        return std::unexpected(err);
    }
    return p;
}

Result Profile::LoadFile(const std::string& path, Profile& out) {
    out = Profile{};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result::Fail(ENOENT, "profile not found: " + path);
    }

    nlohmann::json j;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(kGeneric, err);
    }
    if (!config::detail::FillProfileFromJson(j, out, err)) {
        out = Profile{};
        return Result::Fail(kGeneric, err + " in " + path);
    }
    return Result::Ok();
}

void Profile::ApplyEnvironment() {
    if (oracle_home.empty()) {
        if (const char* v = std::getenv("ORACLE_HOME"); v && *v) oracle_home = v;
    }
    if (adr_base.empty()) {
        if (const char* v = std::getenv("ADR_BASE"); v && *v) adr_base = v;
    }
}

} // namespace logfetch
