#include "util/config_json_utils.hpp"

#include <exception>
#include <fstream>

namespace logfetch::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU32IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint32_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v <= 0 || v > 1000000) {
        err = std::string(key) + " out of range";
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::vector<std::string>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillProfileFromJson(const nlohmann::json& j, Profile& profile, std::string& err) {
    if (!GetStringIfPresent(j, "OracleHome", profile.oracle_home, err)) return false;
    if (!GetStringIfPresent(j, "AdrciPath", profile.adrci_path, err)) return false;
    if (!GetStringArrayIfPresent(j, "SearchPath", profile.search_path, err)) return false;
    if (!GetStringIfPresent(j, "AdrBase", profile.adr_base, err)) return false;
    if (!GetStringIfPresent(j, "DefaultAdrBase", profile.default_adr_base, err)) return false;
    if (!GetStringIfPresent(j, "ArchiveDir", profile.archive_dir, err)) return false;
    if (!GetU32IfPresent(j, "TailLines", profile.tail_lines, err)) return false;

    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
        if (!level.empty()) {
            LogLevel lvl{};
            if (!ParseLogLevel(level, lvl)) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            profile.log_level = lvl;
        }
    }

    return true;
}

} // namespace logfetch::config::detail
