#pragma once

#include <string>

namespace logfetch {

// "-rw-r----- uid=54321 gid=54322 size=1024" or "missing (No such file or directory)".
// Does not follow a final symlink, so a dangling link is still described.
std::string DescribeAccess(const std::string& path);

// "writable" or "not writable (<reason>)" for the calling process.
std::string ProbeWritable(const std::string& dir);

std::string PermissionString(unsigned mode);

} // namespace logfetch
