#pragma once

#include "logfetch/component_kind.hpp"
#include "util/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace logfetch {

struct Identity {
    std::string name;
    std::string home_dir;

    // Effective user from the password database, falling back to
    // $USER/$LOGNAME and $HOME.
    static Result Current(Identity& out);
};

// Probed once per run; read-only afterwards.
struct Environment {
    std::string base_dir;
    bool has_database = false;
    bool has_asm = false;
    bool has_crs = false;
    bool has_listener = false;

    std::string adrci_path;
    // Exported to every adrci invocation (ORACLE_HOME, ADR_BASE).
    std::vector<std::pair<std::string, std::string>> tool_env;
    std::string homes_listing;
    bool query_failed = false;

    bool Has(ComponentKind kind) const;
    void Set(ComponentKind kind, bool value);
    std::vector<ComponentKind> AvailableKinds() const;
};

struct DiagnosticHome {
    ComponentKind kind = ComponentKind::Database;
    // As reported by adrci, e.g. "diag/rdbms/orcl/orcl".
    std::string relative_path;
    std::string path;
};

} // namespace logfetch
