#include "logfetch/component_kind.hpp"

#include "util/string_utils.hpp"

namespace logfetch {

const char* ComponentName(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Database: return "database";
        case ComponentKind::Asm:      return "asm";
        case ComponentKind::Crs:      return "crs";
        case ComponentKind::Listener: return "listener";
    }
    return "unknown";
}

const char* ComponentFamily(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Database: return "rdbms";
        case ComponentKind::Asm:      return "asm";
        case ComponentKind::Crs:      return "crs";
        case ComponentKind::Listener: return "tnslsnr";
    }
    return "";
}

const char* ComponentListingMarker(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Database: return "diag/rdbms/";
        case ComponentKind::Asm:      return "diag/asm/";
        case ComponentKind::Crs:      return "diag/crs/";
        case ComponentKind::Listener: return "diag/tnslsnr/";
    }
    return "";
}

const char* RequiredRole(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Database: return "Oracle Database environment";
        case ComponentKind::Asm:      return "Grid Infrastructure environment (ASM)";
        case ComponentKind::Crs:      return "Grid Infrastructure environment";
        case ComponentKind::Listener: return "Oracle Net listener environment";
    }
    return "";
}

bool ComponentFromFamily(std::string_view family, ComponentKind& out) {
    for (ComponentKind k : kAllComponentKinds) {
        if (family == ComponentFamily(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

bool ParseComponentToken(std::string_view token, ComponentRequest& out) {
    if (EqualsIgnoreCase(token, "all")) {
        out = ComponentRequest::All();
        return true;
    }
    for (ComponentKind k : kAllComponentKinds) {
        if (EqualsIgnoreCase(token, ComponentName(k))) {
            out = ComponentRequest::Of(k);
            return true;
        }
    }
    return false;
}

} // namespace logfetch
