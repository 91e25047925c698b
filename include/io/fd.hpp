#pragma once

#include "util/result.hpp"

#include <string>

namespace logfetch {

// Owning file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // O_CLOEXEC is always added to `flags`.
    static Result Open(const std::string& path, int flags, Fd& out, unsigned mode = 0);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    void Close();

    // Close for descriptors that were written to; deferred write errors
    // (ENOSPC, EIO on NFS) only show up here.
    Result CloseChecked();

  private:
    int fd_{-1};
};

} // namespace logfetch
