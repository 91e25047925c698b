#include "logfetch/archive_manager.hpp"

#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <span>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace logfetch {

namespace {

constexpr size_t kCopyBuffer = 64 * 1024;
constexpr const char kPartialSuffix[] = ".partial";

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = a ? archive_error_string(a) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

class PosixSystemOps final : public ArchiveManager::ISystemOps {
  public:
    Result CreateStagingDir(std::string_view base_dir,
                            std::string_view prefix,
                            std::string& out_dir) const override {
        const fs::path base = base_dir.empty() ? fs::path("/tmp") : fs::path(base_dir);
        std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int err = errno;
            return Result::Fail(err, "mkdtemp failed: " + std::string(std::strerror(err)));
        }

        out_dir = created;
        return Result::Ok();
    }

    Result SetPermissions(std::string_view dir, mode_t mode) const override {
        if (::chmod(std::string(dir).c_str(), mode) != 0) {
            const int err = errno;
            return Result::Fail(err, "chmod failed: " + std::string(std::strerror(err)));
        }
        return Result::Ok();
    }

    Result RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            return Result::Fail(ec.value(), "remove failed: " + ec.message());
        }
        return Result::Ok();
    }
};

// Writes `partial` with O_EXCL|O_NOFOLLOW and renames it over `dest`.
// `partial` is gone afterwards whatever happened.
Result CopyFileBytes(const std::string& source, const std::string& partial, const std::string& dest) {
    FileReader reader;
    auto open_res = FileReader::Open(source, reader);
    if (!open_res.is_ok()) return open_res;

    if (::unlink(partial.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        return Result::Fail(err, "cannot clear " + partial + " (" + std::strerror(err) + ")");
    }

    Fd out;
    auto create_res = Fd::Open(partial, O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, out, 0644);
    if (!create_res.is_ok()) return create_res;

    auto fail = [&partial](Result r) {
        ::unlink(partial.c_str());
        return r;
    };

    std::vector<std::uint8_t> buf(kCopyBuffer);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) {
            const int err = errno;
            return fail(Result::Fail(err, "read failed: " + source + " (" + std::strerror(err) + ")"));
        }
        if (n == 0) break;

        size_t off = 0;
        while (off < static_cast<size_t>(n)) {
            const ssize_t w = ::write(out.Get(), buf.data() + off, static_cast<size_t>(n) - off);
            if (w < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                return fail(Result::Fail(err, "write failed: " + partial + " (" + std::strerror(err) + ")"));
            }
            off += static_cast<size_t>(w);
        }
    }

    auto close_res = out.CloseChecked();
    if (!close_res.is_ok()) {
        return fail(Result::Fail(close_res.err, partial + ": " + close_res.msg));
    }

    // rename() replaces a symlink at `dest` rather than following it.
    if (::rename(partial.c_str(), dest.c_str()) != 0) {
        const int err = errno;
        return fail(Result::Fail(err, "cannot move into place: " + dest + " (" + std::strerror(err) + ")"));
    }
    return Result::Ok();
}

Result AppendFile(archive* aw, const fs::path& file, const std::string& entry_name) {
    Fd in;
    auto open_res = Fd::Open(file.string(), O_RDONLY | O_NOFOLLOW, in);
    if (!open_res.is_ok()) {
        return Result::Fail(kArchiveFailure, "staged entry " + entry_name + ": " + open_res.msg);
    }

    struct stat st{};
    if (::fstat(in.Get(), &st) != 0) {
        const int err = errno;
        return Result::Fail(kArchiveFailure, "fstat failed: " + file.string() + " (" + std::strerror(err) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(kArchiveFailure, "staged entry " + entry_name + " is not a regular file");
    }

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Result::Fail(kArchiveFailure, "archive_entry_new failed");
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), entry_name.c_str());

    if (archive_write_header(aw, entry.get()) != ARCHIVE_OK) {
        return Result::Fail(kArchiveFailure, "archive_write_header: " + ArchiveErr(aw));
    }

    std::vector<std::uint8_t> buf(kCopyBuffer);
    while (true) {
        const ssize_t n = ::read(in.Get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(kArchiveFailure, "read failed: " + file.string());
        }
        if (n == 0) break;
        if (archive_write_data(aw, buf.data(), static_cast<size_t>(n)) < 0) {
            return Result::Fail(kArchiveFailure, "archive_write_data: " + ArchiveErr(aw));
        }
    }

    if (archive_write_finish_entry(aw) != ARCHIVE_OK) {
        return Result::Fail(kArchiveFailure, "archive_write_finish_entry: " + ArchiveErr(aw));
    }
    return Result::Ok();
}

Result WriteArchive(const std::string& archive_path,
                    const fs::path& staging_dir,
                    const std::vector<std::string>& names) {
    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(kArchiveFailure, "archive_write_new failed");

    if (archive_write_add_filter_gzip(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(kArchiveFailure, "gzip filter: " + ArchiveErr(aw.get()));
    }
    if (archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(kArchiveFailure, "tar format: " + ArchiveErr(aw.get()));
    }
    if (archive_write_open_filename(aw.get(), archive_path.c_str()) != ARCHIVE_OK) {
        return Result::Fail(kArchiveFailure, "open " + archive_path + ": " + ArchiveErr(aw.get()));
    }

    for (const auto& name : names) {
        auto r = AppendFile(aw.get(), staging_dir / name, name);
        if (!r.is_ok()) return r;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(kArchiveFailure, "archive_write_close: " + ArchiveErr(aw.get()));
    }
    return Result::Ok();
}

} // namespace

std::string ArchiveFileName(std::time_t now) {
    std::tm tm{};
    char stamp[32]{};
    if (localtime_r(&now, &tm) == nullptr ||
        std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm) == 0) {
        return std::string(kArchivePrefix) + std::to_string(static_cast<long long>(now)) + kArchiveExtension;
    }
    return std::string(kArchivePrefix) + stamp + kArchiveExtension;
}

std::shared_ptr<const ArchiveManager::ISystemOps> ArchiveManager::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

ArchiveManager::ArchiveManager() : system_ops_(DefaultSystemOps()) {}

ArchiveManager::ArchiveManager(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

ArchiveManager::ArchiveManager(ArchiveManager&& other) noexcept
    : system_ops_(std::move(other.system_ops_)),
      dir_(std::move(other.dir_)),
      staged_(std::move(other.staged_)) {
    other.dir_.clear();
    other.staged_.clear();
    other.system_ops_ = DefaultSystemOps();
}

ArchiveManager& ArchiveManager::operator=(ArchiveManager&& other) noexcept {
    if (this == &other)
        return *this;
    Close();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    staged_ = std::move(other.staged_);
    other.dir_.clear();
    other.staged_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

ArchiveManager::~ArchiveManager() { Close(); }

Result ArchiveManager::Open(std::string_view base_dir) {
    Close();

    auto create_result = system_ops_->CreateStagingDir(base_dir, kStagingPrefix, dir_);
    if (!create_result.is_ok()) {
        dir_.clear();
        return create_result;
    }

    // The copy may run under a different effective user than the archiver.
    auto perm_result = system_ops_->SetPermissions(dir_, 0777);
    if (!perm_result.is_ok()) {
        LogWarn("cannot make %s world-writable: %s", dir_.c_str(), perm_result.msg.c_str());
    }

    LogDebug("staging area %s", dir_.c_str());
    return Result::Ok();
}

StageResult ArchiveManager::Stage(const std::string& source) {
    StageResult sr;
    if (dir_.empty()) {
        sr.err = kCopyFailure;
        sr.cause = "staging area is not open";
        return sr;
    }

    const std::string name = fs::path(source).filename().string();
    if (name.empty() || name == "." || name == "..") {
        sr.err = kCopyFailure;
        sr.cause = "source has no file name";
        return sr;
    }
    sr.dest = (fs::path(dir_) / name).string();
    const std::string partial = (fs::path(dir_) / ("." + name + kPartialSuffix)).string();

    try {
        auto r = CopyFileBytes(source, partial, sr.dest);
        if (!r.is_ok()) {
            sr.err = r.err;
            sr.cause = r.msg;
            return sr;
        }
    } catch (const std::exception& e) {
        std::error_code rm_ec;
        fs::remove(partial, rm_ec);
        sr.err = kCopyFailure;
        sr.cause = e.what();
        return sr;
    }

    if (std::find(staged_.begin(), staged_.end(), name) != staged_.end()) {
        LogWarn("%s replaces an earlier staged file with the same name", name.c_str());
    } else {
        staged_.push_back(name);
    }

    sr.ok = true;
    return sr;
}

Result ArchiveManager::Seal(const std::string& out_dir, std::time_t now, SealResult& out) const {
    out = SealResult{};
    if (dir_.empty()) {
        return Result::Fail(kArchiveFailure, "staging area is not open");
    }

    if (staged_.empty()) {
        LogWarn("nothing staged; archive skipped");
        return Result::Ok();
    }
    out.entries = staged_;
    std::sort(out.entries.begin(), out.entries.end());

    const std::string archive_path = (fs::path(out_dir) / ArchiveFileName(now)).string();
    auto r = WriteArchive(archive_path, dir_, out.entries);
    if (!r.is_ok()) {
        std::error_code rm_ec;
        fs::remove(archive_path, rm_ec);
        out.entries.clear();
        return Result::Fail(kArchiveFailure, "cannot write " + archive_path + ": " + r.msg);
    }

    out.sealed = true;
    out.archive_path = archive_path;
    LogInfo("archive written: %s (%zu file(s))", archive_path.c_str(), out.entries.size());
    return Result::Ok();
}

void ArchiveManager::Close() {
    if (dir_.empty())
        return;

    auto r = system_ops_->RemoveTree(dir_);
    if (!r.is_ok()) {
        LogWarn("cannot remove staging area %s: %s", dir_.c_str(), r.msg.c_str());
    } else {
        LogDebug("removed staging area %s", dir_.c_str());
    }
    dir_.clear();
    staged_.clear();
}

} // namespace logfetch
