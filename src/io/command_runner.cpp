#include "io/command_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace logfetch {

namespace {

std::string Describe(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s.push_back(' ');
        s += a;
    }
    return s;
}

} // namespace

Result PosixCommandRunner::Run(const CommandSpec& spec, CommandOutput& out) const {
    out = CommandOutput{};
    if (spec.argv.empty()) return Result::Fail(kGeneric, "empty command");

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, "pipe failed: " + std::string(std::strerror(err)));
    }
    Fd read_end(fds[0]);
    Fd write_end(fds[1]);

    // Build argv before forking; the child only calls async-signal-safe code
    // plus setenv.
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    LogDebug("exec: %s", Describe(spec.argv).c_str());

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        return Result::Fail(err, "fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        ::dup2(write_end.Get(), STDOUT_FILENO);
        ::dup2(write_end.Get(), STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        for (const auto& [k, v] : spec.env) {
            ::setenv(k.c_str(), v.c_str(), 1);
        }
        ::execv(argv[0], argv.data());
        _exit(127);
    }

    write_end.Close();

    char buf[4096];
    while (true) {
        const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
        if (n > 0) {
            out.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    read_end.Close();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            const int err = errno;
            return Result::Fail(err, "waitpid failed: " + std::string(std::strerror(err)));
        }
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    }
    LogDebug("exit %d: %s", out.exit_code, spec.argv[0].c_str());
    return Result::Ok();
}

std::shared_ptr<const ICommandRunner> DefaultCommandRunner() {
    static const std::shared_ptr<const ICommandRunner> kDefault =
        std::make_shared<PosixCommandRunner>();
    return kDefault;
}

bool IsExecutableFile(const std::string& path) {
    if (path.empty()) return false;
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::string FindExecutable(const std::string& name, const std::vector<std::string>& dirs) {
    for (const auto& dir : dirs) {
        if (dir.empty()) continue;
        const std::string candidate = (std::filesystem::path(dir) / name).string();
        if (IsExecutableFile(candidate)) return candidate;
    }
    return {};
}

std::vector<std::string> SplitSearchPath(const std::string& path_list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) end = path_list.size();
        if (end > start) out.push_back(path_list.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

} // namespace logfetch
