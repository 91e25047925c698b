#include <gtest/gtest.h>

#include "logfetch/archive_manager.hpp"
#include "testing.hpp"

#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <utility>

namespace fs = std::filesystem;

namespace logfetch {
namespace {

using testutil::CountingStagingOps;

TEST(ArchiveManagerTest, OpenCreatesWorldWritableDir) {
    testutil::TemporaryDirectory tmp;
    ArchiveManager area;
    auto r = area.Open(tmp.Path());
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_TRUE(area.IsOpen());

    EXPECT_EQ(fs::path(area.Dir()).parent_path(), fs::path(tmp.Path()));
    EXPECT_EQ(fs::path(area.Dir()).filename().string().rfind(kStagingPrefix, 0), 0U);

    struct stat st{};
    ASSERT_EQ(::stat(area.Dir().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0777U);
}

TEST(ArchiveManagerTest, EachOpenIsUnique) {
    testutil::TemporaryDirectory tmp;
    ArchiveManager a;
    ArchiveManager b;
    ASSERT_TRUE(a.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(b.Open(tmp.Path()).is_ok());
    EXPECT_NE(a.Dir(), b.Dir());
}

TEST(ArchiveManagerTest, PermissionFailureIsNotFatal) {
    testutil::TemporaryDirectory tmp;
    auto ops = std::make_shared<CountingStagingOps>();
    ops->perm_result = Result::Fail(EPERM, "chmod failed");
    ArchiveManager area(ops);

    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    EXPECT_TRUE(area.IsOpen());
    EXPECT_EQ(ops->perm_calls, 1);
    EXPECT_EQ(ops->last_mode, 0777U);
}

TEST(ArchiveManagerTest, CreateFailureLeavesClosed) {
    auto ops = std::make_shared<CountingStagingOps>();
    ops->create_result = Result::Fail(ENOSPC, "mkdtemp failed");
    ArchiveManager area(ops);

    auto r = area.Open("/tmp");
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOSPC);
    EXPECT_FALSE(area.IsOpen());
    EXPECT_EQ(ops->perm_calls, 0);
}

TEST(ArchiveManagerTest, StageCopiesBytes) {
    testutil::TemporaryDirectory tmp;
    const auto source = fs::path(tmp.Path()) / "trace" / "alert_orcl.log";
    testutil::WriteTextFile(source, "line 1\nline 2\n");

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    auto sr = area.Stage(source.string());
    ASSERT_TRUE(sr.ok) << sr.cause;
    EXPECT_EQ(sr.dest, (fs::path(area.Dir()) / "alert_orcl.log").string());
    EXPECT_EQ(testutil::ReadTextFile(sr.dest), "line 1\nline 2\n");
    // The source is left alone.
    EXPECT_EQ(testutil::ReadTextFile(source), "line 1\nline 2\n");
}

TEST(ArchiveManagerTest, StageMissingSourceFails) {
    testutil::TemporaryDirectory tmp;
    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());

    auto sr = area.Stage(tmp.Path() + "/nope.log");
    EXPECT_FALSE(sr.ok);
    EXPECT_EQ(sr.err, ENOENT);
    EXPECT_FALSE(sr.cause.empty());
    EXPECT_FALSE(fs::exists(fs::path(area.Dir()) / "nope.log"));
}

TEST(ArchiveManagerTest, StageBeforeOpenFails) {
    ArchiveManager area;
    auto sr = area.Stage("/etc/hostname");
    EXPECT_FALSE(sr.ok);
    EXPECT_EQ(sr.err, kCopyFailure);
}

TEST(ArchiveManagerTest, SameNameReplacesEarlierCopy) {
    testutil::TemporaryDirectory tmp;
    const auto first = fs::path(tmp.Path()) / "one" / "alert_x.log";
    const auto second = fs::path(tmp.Path()) / "two" / "alert_x.log";
    testutil::WriteTextFile(first, "first\n");
    testutil::WriteTextFile(second, "second\n");

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(area.Stage(first.string()).ok);
    auto sr = area.Stage(second.string());
    ASSERT_TRUE(sr.ok) << sr.cause;
    EXPECT_EQ(testutil::ReadTextFile(sr.dest), "second\n");
}

TEST(ArchiveManagerTest, FailedRestageKeepsEarlierCopy) {
    testutil::TemporaryDirectory tmp;
    const auto first = fs::path(tmp.Path()) / "one" / "alert_x.log";
    testutil::WriteTextFile(first, "first\n");

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(area.Stage(first.string()).ok);
    auto sr = area.Stage((fs::path(tmp.Path()) / "two" / "alert_x.log").string());
    ASSERT_FALSE(sr.ok);
    EXPECT_EQ(sr.err, ENOENT);

    EXPECT_EQ(testutil::ReadTextFile(fs::path(area.Dir()) / "alert_x.log"), "first\n");
    ASSERT_EQ(area.Staged().size(), 1U);

    const auto out_dir = fs::path(tmp.Path()) / "out";
    fs::create_directories(out_dir);
    ArchiveManager::SealResult sealed;
    ASSERT_TRUE(area.Seal(out_dir.string(), std::time(nullptr), sealed).is_ok());
    auto contents = testutil::ReadArchive(sealed.archive_path);
    ASSERT_EQ(contents.size(), 1U);
    EXPECT_EQ(contents["alert_x.log"], "first\n");
}

TEST(ArchiveManagerTest, StageReplacesPlantedSymlink) {
    testutil::TemporaryDirectory tmp;
    const auto source = fs::path(tmp.Path()) / "trace" / "alert_orcl.log";
    const auto victim = fs::path(tmp.Path()) / "victim.txt";
    testutil::WriteTextFile(source, "log text\n");
    testutil::WriteTextFile(victim, "untouched\n");

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    const auto dest = fs::path(area.Dir()) / "alert_orcl.log";
    fs::create_symlink(victim, dest);
    // The temporary name used during the copy is planted too.
    fs::create_symlink(victim, fs::path(area.Dir()) / ".alert_orcl.log.partial");

    auto sr = area.Stage(source.string());
    ASSERT_TRUE(sr.ok) << sr.cause;
    EXPECT_EQ(testutil::ReadTextFile(victim), "untouched\n");
    EXPECT_FALSE(fs::is_symlink(dest));
    EXPECT_EQ(testutil::ReadTextFile(dest), "log text\n");
    EXPECT_FALSE(fs::exists(fs::symlink_status(fs::path(area.Dir()) / ".alert_orcl.log.partial")));
}

TEST(ArchiveManagerTest, StagedTracksNamesInOrder) {
    testutil::TemporaryDirectory tmp;
    const auto b = fs::path(tmp.Path()) / "src" / "b.log";
    const auto a = fs::path(tmp.Path()) / "src" / "a.log";
    testutil::WriteTextFile(a, "a\n");
    testutil::WriteTextFile(b, "b\n");

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(area.Stage(b.string()).ok);
    ASSERT_TRUE(area.Stage(a.string()).ok);
    ASSERT_TRUE(area.Stage(b.string()).ok);
    ASSERT_EQ(area.Staged().size(), 2U);
    EXPECT_EQ(area.Staged()[0], "b.log");
    EXPECT_EQ(area.Staged()[1], "a.log");

    area.Close();
    EXPECT_TRUE(area.Staged().empty());
}

TEST(ArchiveManagerTest, SealWritesCompressedTar) {
    testutil::TemporaryDirectory tmp;
    const auto a = fs::path(tmp.Path()) / "src" / "alert_a.log";
    const auto b = fs::path(tmp.Path()) / "src" / "listener.log";
    testutil::WriteTextFile(a, "alpha\n");
    testutil::WriteTextFile(b, "bravo\n");
    const auto out_dir = fs::path(tmp.Path()) / "out";
    fs::create_directories(out_dir);

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(area.Stage(a.string()).ok);
    ASSERT_TRUE(area.Stage(b.string()).ok);

    const std::time_t now = std::time(nullptr);
    ArchiveManager::SealResult sealed;
    auto r = area.Seal(out_dir.string(), now, sealed);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_TRUE(sealed.sealed);
    EXPECT_EQ(sealed.archive_path, (out_dir / ArchiveFileName(now)).string());
    ASSERT_EQ(sealed.entries.size(), 2U);
    EXPECT_EQ(sealed.entries[0], "alert_a.log");

    auto contents = testutil::ReadArchive(sealed.archive_path);
    ASSERT_EQ(contents.size(), 2U);
    EXPECT_EQ(contents["alert_a.log"], "alpha\n");
    EXPECT_EQ(contents["listener.log"], "bravo\n");
}

TEST(ArchiveManagerTest, SealIgnoresEntriesItDidNotStage) {
    testutil::TemporaryDirectory tmp;
    const auto source = fs::path(tmp.Path()) / "src" / "alert_a.log";
    const auto secret = fs::path(tmp.Path()) / "secret.txt";
    testutil::WriteTextFile(source, "alpha\n");
    testutil::WriteTextFile(secret, "do not pack\n");
    const auto out_dir = fs::path(tmp.Path()) / "out";
    fs::create_directories(out_dir);

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(area.Stage(source.string()).ok);
    fs::create_symlink(secret, fs::path(area.Dir()) / "planted.log");
    testutil::WriteTextFile(fs::path(area.Dir()) / "extra.log", "extra\n");

    ArchiveManager::SealResult sealed;
    auto r = area.Seal(out_dir.string(), std::time(nullptr), sealed);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_EQ(sealed.entries.size(), 1U);
    EXPECT_EQ(sealed.entries[0], "alert_a.log");

    auto contents = testutil::ReadArchive(sealed.archive_path);
    ASSERT_EQ(contents.size(), 1U);
    EXPECT_EQ(contents["alert_a.log"], "alpha\n");
}

TEST(ArchiveManagerTest, SealRefusesStagedNameSwappedForSymlink) {
    testutil::TemporaryDirectory tmp;
    const auto source = fs::path(tmp.Path()) / "src" / "alert_a.log";
    const auto secret = fs::path(tmp.Path()) / "secret.txt";
    testutil::WriteTextFile(source, "alpha\n");
    testutil::WriteTextFile(secret, "do not pack\n");
    const auto out_dir = fs::path(tmp.Path()) / "out";
    fs::create_directories(out_dir);

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    auto sr = area.Stage(source.string());
    ASSERT_TRUE(sr.ok);
    fs::remove(sr.dest);
    fs::create_symlink(secret, sr.dest);

    const std::time_t now = std::time(nullptr);
    ArchiveManager::SealResult sealed;
    auto r = area.Seal(out_dir.string(), now, sealed);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, kArchiveFailure);
    EXPECT_FALSE(sealed.sealed);
    EXPECT_FALSE(fs::exists(out_dir / ArchiveFileName(now)));
}

TEST(ArchiveManagerTest, EmptyAreaIsNotSealed) {
    testutil::TemporaryDirectory tmp;
    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());

    ArchiveManager::SealResult sealed;
    auto r = area.Seal(tmp.Path(), std::time(nullptr), sealed);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_FALSE(sealed.sealed);
    EXPECT_TRUE(sealed.archive_path.empty());

    for (const auto& entry : fs::directory_iterator(tmp.Path())) {
        EXPECT_EQ(entry.path().string().find(kArchiveExtension), std::string::npos);
    }
}

TEST(ArchiveManagerTest, SealIntoMissingDirFails) {
    testutil::TemporaryDirectory tmp;
    const auto source = fs::path(tmp.Path()) / "alert_a.log";
    testutil::WriteTextFile(source, "a\n");

    ArchiveManager area;
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    ASSERT_TRUE(area.Stage(source.string()).ok);

    ArchiveManager::SealResult sealed;
    auto r = area.Seal(tmp.Path() + "/no/such/dir", std::time(nullptr), sealed);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, kArchiveFailure);
    EXPECT_FALSE(sealed.sealed);
}

TEST(ArchiveManagerTest, CloseIsIdempotent) {
    testutil::TemporaryDirectory tmp;
    auto ops = std::make_shared<CountingStagingOps>();
    ArchiveManager area(ops);
    ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
    const std::string dir = area.Dir();

    area.Close();
    area.Close();
    EXPECT_FALSE(area.IsOpen());
    EXPECT_EQ(ops->remove_calls, 1);
    EXPECT_FALSE(fs::exists(dir));
}

TEST(ArchiveManagerTest, DestructorRemovesStagingArea) {
    testutil::TemporaryDirectory tmp;
    auto ops = std::make_shared<CountingStagingOps>();
    std::string dir;
    {
        ArchiveManager area(ops);
        ASSERT_TRUE(area.Open(tmp.Path()).is_ok());
        dir = area.Dir();
        testutil::WriteTextFile(fs::path(dir) / "leftover.log", "x\n");
    }
    EXPECT_EQ(ops->remove_calls, 1);
    EXPECT_FALSE(fs::exists(dir));
}

TEST(ArchiveManagerTest, MoveTransfersOwnership) {
    testutil::TemporaryDirectory tmp;
    auto ops = std::make_shared<CountingStagingOps>();
    ArchiveManager a(ops);
    ASSERT_TRUE(a.Open(tmp.Path()).is_ok());
    const std::string dir = a.Dir();

    ArchiveManager b(std::move(a));
    EXPECT_FALSE(a.IsOpen());
    EXPECT_EQ(b.Dir(), dir);

    b.Close();
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(ArchiveFileNameTest, UsesLocalTimeStamp) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 31;
    tm.tm_hour = 23;
    tm.tm_min = 59;
    tm.tm_sec = 58;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    EXPECT_EQ(ArchiveFileName(t), "logs_20240131_235958.tar.gz");
}

} // namespace
} // namespace logfetch
