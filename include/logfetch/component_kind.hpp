#pragma once

#include <array>
#include <string_view>

namespace logfetch {

enum class ComponentKind : int {
    Database = 0,
    Asm = 1,
    Crs = 2,
    Listener = 3,
};

inline constexpr std::array<ComponentKind, 4> kAllComponentKinds = {
    ComponentKind::Database,
    ComponentKind::Asm,
    ComponentKind::Crs,
    ComponentKind::Listener,
};

// What the caller asked for: one concrete kind, or every kind the
// environment has.
struct ComponentRequest {
    bool all = false;
    ComponentKind kind = ComponentKind::Database;

    static ComponentRequest All() { return {.all = true}; }
    static ComponentRequest Of(ComponentKind k) { return {.all = false, .kind = k}; }

    bool Accepts(ComponentKind k) const { return all || kind == k; }
};

// "database", "asm", "crs", "listener".
const char* ComponentName(ComponentKind kind);

// ADR family directory: "rdbms", "asm", "crs", "tnslsnr".
const char* ComponentFamily(ComponentKind kind);

// Substring looked for in the raw home listing, e.g. "diag/rdbms/".
const char* ComponentListingMarker(ComponentKind kind);

// Human readable role, used in capability mismatch errors.
const char* RequiredRole(ComponentKind kind);

bool ComponentFromFamily(std::string_view family, ComponentKind& out);

// Case-insensitive; accepts the four names and "all".
bool ParseComponentToken(std::string_view token, ComponentRequest& out);

} // namespace logfetch
