#pragma once

#include <string>

namespace logfetch {

struct StageResult {
    bool ok = false;
    int err = 0;
    std::string dest;
    std::string cause;
};

// The one capability the extractor gets from the archive side.
class ILogStager {
  public:
    virtual ~ILogStager() = default;

    // Copies `source` byte for byte under its base name. Never throws.
    virtual StageResult Stage(const std::string& source) = 0;

    virtual const std::string& Dir() const = 0;
};

} // namespace logfetch
