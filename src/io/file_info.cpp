#include "io/file_info.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace logfetch {

std::string PermissionString(unsigned mode) {
    std::string s(10, '-');
    if (S_ISDIR(mode)) s[0] = 'd';
    else if (S_ISLNK(mode)) s[0] = 'l';
    else if (!S_ISREG(mode)) s[0] = '?';

    static constexpr unsigned kBits[9] = {
        S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP, S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH,
    };
    static constexpr char kChars[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & kBits[i]) s[static_cast<size_t>(i) + 1] = kChars[i];
    }
    return s;
}

std::string DescribeAccess(const std::string& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::string("missing (") + std::strerror(errno) + ")";
    }
    std::string s = PermissionString(st.st_mode);
    s += " uid=" + std::to_string(st.st_uid);
    s += " gid=" + std::to_string(st.st_gid);
    s += " size=" + std::to_string(static_cast<long long>(st.st_size));
    return s;
}

std::string ProbeWritable(const std::string& dir) {
    if (::access(dir.c_str(), W_OK) == 0) return "writable";
    return std::string("not writable (") + std::strerror(errno) + ")";
}

} // namespace logfetch
