#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace logfetch {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    auto open_res = Fd::Open(out.path_, O_RDONLY, out.fd_);
    if (!open_res.is_ok()) return open_res;
    const int fd = out.fd_.Get();

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        out.fd_.Close();
        return Result::Fail(err, "fstat failed: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        out.fd_.Close();
        return Result::Fail(EISDIR, "Is a directory: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

ssize_t FileReader::ReadAt(std::span<std::uint8_t> out, std::uint64_t offset) {
    while (true) {
        ssize_t n = ::pread(fd_.Get(), out.data(), out.size(), static_cast<off_t>(offset));
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace logfetch
