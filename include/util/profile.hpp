#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace logfetch {

// Per-identity settings, read from ~/.logfetch.json. Every key is optional.
struct Profile {
    std::string oracle_home;
    std::string adrci_path;
    std::vector<std::string> search_path;
    std::string adr_base;
    std::string default_adr_base;
    std::string archive_dir;
    std::optional<std::uint32_t> tail_lines;
    std::optional<LogLevel> log_level;

    static std::expected<Profile, std::string> Parse(const std::string& json_input);

    // A missing file fails with ENOENT so the caller can tell it apart from a
    // malformed one.
    static Result LoadFile(const std::string& path, Profile& out);

    // Fill unset keys from ORACLE_HOME / ADR_BASE.
    void ApplyEnvironment();
};

} // namespace logfetch
