#pragma once

#include "io/command_runner.hpp"
#include "logfetch/component_kind.hpp"
#include "logfetch/environment.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logfetch {

struct ComponentHomes {
    ComponentKind kind = ComponentKind::Database;
    std::vector<DiagnosticHome> homes;
};

class HomeCatalog {
  public:
    HomeCatalog();
    explicit HomeCatalog(std::shared_ptr<const ICommandRunner> runner);

    // Runs "show homes" again and keeps the homes `request` accepts, in the
    // order adrci reported them. Repeated paths are kept.
    Result ListHomes(const ComponentRequest& request,
                     const Environment& env,
                     std::vector<DiagnosticHome>& out) const;

    static std::vector<DiagnosticHome> ClassifyListing(std::string_view listing,
                                                       const ComponentRequest& request,
                                                       const std::string& base_dir);

    // Matches diag/<family>/<instance>/<instance id> exactly.
    static bool ClassifyHomePath(std::string_view relative_path, ComponentKind& out);

  private:
    std::shared_ptr<const ICommandRunner> runner_;
};

} // namespace logfetch
