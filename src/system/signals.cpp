// signals.cpp - Cancel flag and the scoped signal dispositions.

#include "system/signals.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace logfetch {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

ScopedSignalHandlers::ScopedSignalHandlers() {
    struct sigaction cancel{};
    cancel.sa_handler = HandleSignal;
    sigemptyset(&cancel.sa_mask);
    // System calls interrupted by these are retried where they happen; the
    // flag itself is polled between log files.
    cancel.sa_flags = 0;

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);

    const std::array<std::pair<int, const struct sigaction*>, 4> wanted = {{
        {SIGINT, &cancel},
        {SIGTERM, &cancel},
        {SIGHUP, &cancel},
        {SIGPIPE, &ignore},
    }};

    for (const auto& [signo, action] : wanted) {
        Saved& slot = saved_[count_];
        if (::sigaction(signo, action, &slot.prev) != 0) {
            LogWarn("cannot install handler for signal %d: %s", signo, std::strerror(errno));
            Restore();
            return;
        }
        slot.signo = signo;
        ++count_;
    }
}

ScopedSignalHandlers::~ScopedSignalHandlers() { Restore(); }

void ScopedSignalHandlers::Restore() {
    while (count_ > 0) {
        --count_;
        ::sigaction(saved_[count_].signo, &saved_[count_].prev, nullptr);
    }
}

} // namespace logfetch
