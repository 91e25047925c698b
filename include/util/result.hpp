#pragma once
#include <string>
#include <utility>

namespace logfetch {

// Error codes carried in Result::err. Positive values are errno values from
// raw system calls; the negative range belongs to the tool.
enum ErrorCode : int {
    kGeneric = -1,
    kUsage = -2,
    kToolUnavailable = -3,
    kQueryFailed = -4,
    kCapabilityMismatch = -5,
    kNoComponents = -6,
    kNoSelection = -7,
    kNoHomesFound = -8,
    kUnreadableLog = -9,
    kCopyFailure = -10,
    kArchiveFailure = -11,
    kCancelled = -12,
};

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace logfetch
