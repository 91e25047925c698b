#include "logfetch/home_catalog.hpp"

#include "logfetch/environment_probe.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <filesystem>

namespace logfetch {

HomeCatalog::HomeCatalog() : HomeCatalog(nullptr) {}

HomeCatalog::HomeCatalog(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {}

bool HomeCatalog::ClassifyHomePath(std::string_view relative_path, ComponentKind& out) {
    if (relative_path.empty() || relative_path.front() == '/') return false;

    const auto parts = SplitPath(relative_path);
    if (parts.size() != 4) return false;
    if (parts[0] != "diag") return false;
    return ComponentFromFamily(parts[1], out);
}

std::vector<DiagnosticHome> HomeCatalog::ClassifyListing(std::string_view listing,
                                                         const ComponentRequest& request,
                                                         const std::string& base_dir) {
    std::vector<DiagnosticHome> out;
    for (const auto& raw : SplitLines(listing)) {
        const std::string_view line = Trim(raw);
        ComponentKind kind{};
        if (!ClassifyHomePath(line, kind)) continue;
        if (!request.Accepts(kind)) continue;

        DiagnosticHome home;
        home.kind = kind;
        home.relative_path = std::string(line);
        home.path = (std::filesystem::path(base_dir) / home.relative_path).string();
        out.push_back(std::move(home));
    }
    return out;
}

Result HomeCatalog::ListHomes(const ComponentRequest& request,
                              const Environment& env,
                              std::vector<DiagnosticHome>& out) const {
    out.clear();
    if (env.adrci_path.empty()) {
        return Result::Fail(kToolUnavailable, "adrci location unknown");
    }

    CommandOutput cmd_out;
    auto r = runner_->Run(MakeAdrciCommand(env, "show homes"), cmd_out);
    if (!r.is_ok()) {
        return Result::Fail(kQueryFailed, "show homes: " + r.msg);
    }
    if (cmd_out.exit_code != 0) {
        return Result::Fail(kQueryFailed,
                            "show homes exited with status " + std::to_string(cmd_out.exit_code));
    }

    out = ClassifyListing(cmd_out.output, request, env.base_dir);
    LogDebug("%s: %zu home(s)",
             request.all ? "all" : ComponentName(request.kind),
             out.size());
    return Result::Ok();
}

} // namespace logfetch
