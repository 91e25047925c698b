#pragma once

#include "logfetch/stager.hpp"
#include "util/result.hpp"

#include <ctime>
#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace logfetch {

inline constexpr const char kStagingPrefix[] = "logfetch-";
inline constexpr const char kArchivePrefix[] = "logs_";
inline constexpr const char kArchiveExtension[] = ".tar.gz";

// "logs_20240131_235959.tar.gz" in local time.
std::string ArchiveFileName(std::time_t now);

// Owns the staging directory for one run. The directory is removed by Close()
// or, failing that, by the destructor, whatever happened in between.
class ArchiveManager final : public ILogStager {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateStagingDir(std::string_view base_dir,
                                        std::string_view prefix,
                                        std::string& out_dir) const = 0;
        virtual Result SetPermissions(std::string_view dir, mode_t mode) const = 0;
        virtual Result RemoveTree(std::string_view dir) const = 0;
    };

    struct SealResult {
        bool sealed = false;
        std::string archive_path;
        std::vector<std::string> entries;
    };

    ArchiveManager();
    explicit ArchiveManager(std::shared_ptr<const ISystemOps> system_ops);
    ArchiveManager(const ArchiveManager&) = delete;
    ArchiveManager& operator=(const ArchiveManager&) = delete;
    ArchiveManager(ArchiveManager&& other) noexcept;
    ArchiveManager& operator=(ArchiveManager&& other) noexcept;
    ~ArchiveManager() override;

    // Creates a process-unique, world-writable directory under `base_dir`.
    // Failing to widen the permissions is only a warning.
    Result Open(std::string_view base_dir = "/tmp");

    // Copies into a fresh file created next to the destination and renamed
    // over it, so an entry planted under the same name is replaced, never
    // written through. A failed copy leaves any earlier copy in place.
    StageResult Stage(const std::string& source) override;

    // Compresses the files Stage() reported as staged into
    // <out_dir>/logs_<timestamp>.tar.gz; nothing else in the directory is
    // read. An empty area is skipped with a warning (Ok, sealed=false). A
    // staged name that is no longer a regular file, or a failed write, leaves
    // no archive behind and returns kArchiveFailure.
    Result Seal(const std::string& out_dir, std::time_t now, SealResult& out) const;

    // Idempotent.
    void Close();

    bool IsOpen() const { return !dir_.empty(); }
    const std::string& Dir() const override { return dir_; }

    // Base names staged so far, in first-staged order.
    const std::vector<std::string>& Staged() const { return staged_; }

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
    std::vector<std::string> staged_;
};

} // namespace logfetch
