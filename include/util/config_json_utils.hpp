#pragma once

#include "util/profile.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace logfetch::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillProfileFromJson(const nlohmann::json& j, Profile& profile, std::string& err);

} // namespace logfetch::config::detail
