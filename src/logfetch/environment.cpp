#include "logfetch/environment.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace logfetch {

Result Identity::Current(Identity& out) {
    out = Identity{};

    if (const passwd* pw = ::getpwuid(::geteuid())) {
        if (pw->pw_name) out.name = pw->pw_name;
        if (pw->pw_dir) out.home_dir = pw->pw_dir;
    }
    if (out.name.empty()) {
        const char* user = std::getenv("USER");
        if (!user || !*user) user = std::getenv("LOGNAME");
        if (user && *user) out.name = user;
    }
    if (out.home_dir.empty()) {
        if (const char* home = std::getenv("HOME"); home && *home) out.home_dir = home;
    }

    if (out.name.empty()) {
        return Result::Fail(kGeneric, "cannot determine invoking user");
    }
    return Result::Ok();
}

bool Environment::Has(ComponentKind kind) const {
    switch (kind) {
        case ComponentKind::Database: return has_database;
        case ComponentKind::Asm:      return has_asm;
        case ComponentKind::Crs:      return has_crs;
        case ComponentKind::Listener: return has_listener;
    }
    return false;
}

void Environment::Set(ComponentKind kind, bool value) {
    switch (kind) {
        case ComponentKind::Database: has_database = value; break;
        case ComponentKind::Asm:      has_asm = value; break;
        case ComponentKind::Crs:      has_crs = value; break;
        case ComponentKind::Listener: has_listener = value; break;
    }
}

std::vector<ComponentKind> Environment::AvailableKinds() const {
    std::vector<ComponentKind> out;
    for (ComponentKind k : kAllComponentKinds) {
        if (Has(k)) out.push_back(k);
    }
    return out;
}

} // namespace logfetch
