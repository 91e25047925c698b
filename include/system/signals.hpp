#pragma once

#include <array>
#include <atomic>
#include <csignal>
#include <cstddef>

namespace logfetch {

// Set by SIGINT/SIGTERM/SIGHUP while a ScopedSignalHandlers is alive.
extern std::atomic_bool g_cancel;

// Routes SIGINT, SIGTERM and SIGHUP to g_cancel and ignores SIGPIPE for its
// lifetime, so a write to a closed pipe fails with EPIPE instead of killing
// the process. The previous dispositions are restored afterwards. Outside
// that window the default dispositions apply.
class ScopedSignalHandlers {
  public:
    ScopedSignalHandlers();
    ~ScopedSignalHandlers();

    ScopedSignalHandlers(const ScopedSignalHandlers&) = delete;
    ScopedSignalHandlers& operator=(const ScopedSignalHandlers&) = delete;

    bool Installed() const { return count_ == saved_.size(); }

  private:
    struct Saved {
        int signo = 0;
        struct sigaction prev{};
    };

    void Restore();

    std::array<Saved, 4> saved_{};
    std::size_t count_ = 0;
};

} // namespace logfetch
