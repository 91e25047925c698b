#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace logfetch {

struct CommandSpec {
    // argv[0] must be an absolute or relative path; no PATH lookup is done.
    std::vector<std::string> argv;
    // Added to (or overriding) the inherited environment of the child.
    std::vector<std::pair<std::string, std::string>> env;
};

struct CommandOutput {
    int exit_code = -1;
    // stdout and stderr, interleaved as the child wrote them.
    std::string output;
};

class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;

    // Fails only when the child could not be started or reaped; a non-zero
    // exit status is reported through out.exit_code.
    virtual Result Run(const CommandSpec& spec, CommandOutput& out) const = 0;
};

class PosixCommandRunner final : public ICommandRunner {
  public:
    Result Run(const CommandSpec& spec, CommandOutput& out) const override;
};

std::shared_ptr<const ICommandRunner> DefaultCommandRunner();

bool IsExecutableFile(const std::string& path);

// First directory in `dirs` holding an executable `name`, or empty.
std::string FindExecutable(const std::string& name, const std::vector<std::string>& dirs);

// Split a PATH-style list on ':'; empty elements are dropped.
std::vector<std::string> SplitSearchPath(const std::string& path_list);

} // namespace logfetch
