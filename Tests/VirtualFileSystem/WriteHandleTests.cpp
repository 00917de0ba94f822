#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "VaultCore.h"
#include "VFSTestHelpers.h"

using namespace VaultEngine::Core;
using namespace VaultEngine::Core::IO;
using vault::test_helpers::ScopedTempDir;
using vault::test_helpers::ScopedVfsEnv;
using vault::test_helpers::ScopedLogCapture;
using vault::test_helpers::readAllBytes;
using vault::test_helpers::writeFile;
using vault::test_helpers::bytes;
using vault::test_helpers::FailingCloseBackend;
using vault::test_helpers::channelOpenCount;

TEST(WriteHandle, WriteCloseAndReadBack) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("a.txt").string();

    auto h1 = env.vfs().openWritable(path);
    ASSERT_NE(h1, nullptr);
    EXPECT_TRUE(h1->isOpen());
    EXPECT_EQ(h1->position(), 0u);

    auto data = bytes({1, 2, 3});
    auto w = h1->write(data);
    ASSERT_EQ(w.status(), FileOpStatus::Complete) << w.errorInfo().message;
    EXPECT_EQ(w.bytesWritten(), 3u);
    EXPECT_EQ(h1->position(), 3u);

    ASSERT_TRUE(h1->close().succeeded());
    EXPECT_FALSE(h1->isOpen());

    EXPECT_EQ(readAllBytes(path), std::string("\x01\x02\x03", 3));
}

TEST(WriteHandle, CursorAdvancesByBytesWrittenAndSeekSetsIt) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto h = env.vfs().openWritable(tmp.join("cursor.bin").string());
    ASSERT_NE(h, nullptr);

    auto first = h->write(std::string_view("hello"));
    ASSERT_TRUE(first.succeeded());
    EXPECT_EQ(h->position(), 5u);

    auto second = h->write(std::string_view(" world"));
    ASSERT_TRUE(second.succeeded());
    EXPECT_EQ(h->position(), 11u);

    ASSERT_TRUE(h->position(2).succeeded());
    EXPECT_EQ(h->position(), 2u);
    ASSERT_TRUE(h->position(1'000'000).succeeded());
    EXPECT_EQ(h->position(), 1'000'000u);
    ASSERT_TRUE(h->position(0).succeeded());
    EXPECT_EQ(h->position(), 0u);

    ASSERT_TRUE(h->write(std::string_view("J")).succeeded());
    EXPECT_EQ(h->position(), 1u);
    ASSERT_TRUE(h->close().succeeded());
    EXPECT_EQ(readAllBytes(tmp.join("cursor.bin")), "Jello world");
}

TEST(WriteHandle, WritePastEndLeavesZeroFilledHole) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("sparse.bin");
    auto h = env.vfs().openWritable(path.string());
    ASSERT_NE(h, nullptr);

    ASSERT_TRUE(h->position(4).succeeded());
    auto w = h->write(std::string_view("x"));
    ASSERT_TRUE(w.succeeded()) << w.errorInfo().message;
    EXPECT_EQ(h->position(), 5u);
    ASSERT_TRUE(h->close().succeeded());

    EXPECT_EQ(readAllBytes(path), std::string("\0\0\0\0x", 5));
}

TEST(WriteHandle, TruncateKeepsCursor) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("trunc.txt");
    auto h = env.vfs().openWritable(path.string());
    ASSERT_NE(h, nullptr);

    ASSERT_TRUE(h->write(std::string_view("hello")).succeeded());
    auto t = h->truncate();
    ASSERT_TRUE(t.succeeded()) << t.errorInfo().message;
    EXPECT_EQ(h->position(), 5u);
    EXPECT_EQ(std::filesystem::file_size(path), 0u);

    ASSERT_TRUE(h->write(std::string_view("!")).succeeded());
    ASSERT_TRUE(h->close().succeeded());
    EXPECT_EQ(readAllBytes(path), std::string("\0\0\0\0\0!", 6));
}

TEST(WriteHandle, OpeningDoesNotCreateOrTruncateExistingFile) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto missing = tmp.join("lazy.txt");
    auto existing = tmp.join("existing.txt");
    writeFile(existing, "keep me");

    {
        auto h = env.vfs().openWritable(missing.string());
        ASSERT_NE(h, nullptr);
        EXPECT_FALSE(h->channelBound());
        EXPECT_FALSE(std::filesystem::exists(missing));
        ASSERT_TRUE(h->close().succeeded());
        EXPECT_FALSE(std::filesystem::exists(missing));
    }

    auto h = env.vfs().openWritable(existing.string());
    ASSERT_NE(h, nullptr);
    ASSERT_TRUE(h->write(std::string_view("K")).succeeded());
    EXPECT_TRUE(h->channelBound());
    ASSERT_TRUE(h->close().succeeded());
    EXPECT_EQ(readAllBytes(existing), "Keep me");
}

TEST(WriteHandle, SetLastModifiedUpdatesTimestamp) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("stamp.txt").string();
    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);

    // 2020-01-01T00:00:00Z
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(1577836800));
    auto r = h->setLastModified(when);
    ASSERT_TRUE(r.succeeded()) << r.errorInfo().message;
    EXPECT_TRUE(h->channelBound());
    ASSERT_TRUE(h->close().succeeded());

    auto meta = env.vfs().getMetadata(path);
    ASSERT_TRUE(meta.succeeded());
    ASSERT_TRUE(meta.metadata().has_value());
    ASSERT_TRUE(meta.metadata()->lastModified.has_value());
    auto secs = std::chrono::floor<std::chrono::seconds>(*meta.metadata()->lastModified);
    EXPECT_EQ(secs.time_since_epoch().count(), 1577836800);
}

TEST(WriteHandle, OperationsAfterCloseFailWithHandleClosed) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("closed.txt").string();
    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);
    ASSERT_TRUE(h->write(std::string_view("abc")).succeeded());
    ASSERT_TRUE(h->close().succeeded());

    auto w = h->write(std::string_view("more"));
    EXPECT_EQ(w.status(), FileOpStatus::Failed);
    EXPECT_EQ(w.errorInfo().code, FileError::HandleClosed);
    EXPECT_NE(w.errorInfo().message.find("already closed"), std::string::npos);
    EXPECT_EQ(h->position(), 3u);

    EXPECT_EQ(h->position(10).errorInfo().code, FileError::HandleClosed);
    EXPECT_EQ(h->position(), 3u);
    EXPECT_EQ(h->truncate().errorInfo().code, FileError::HandleClosed);
    EXPECT_EQ(h->setLastModified(std::chrono::system_clock::now()).errorInfo().code, FileError::HandleClosed);
    EXPECT_EQ(h->remove().errorInfo().code, FileError::HandleClosed);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(readAllBytes(path), "abc");
}

TEST(WriteHandle, CloseTwiceReleasesLockOnce) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("twice.txt").string();
    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);

    auto lock = env.locks().lockFor(h->normalizedKey());
    EXPECT_TRUE(lock->isHeld());
    EXPECT_EQ(lock->acquisitions(), 1u);

    ASSERT_TRUE(h->write(std::string_view("x")).succeeded());
    EXPECT_TRUE(h->close().succeeded());
    EXPECT_FALSE(lock->isHeld());
    EXPECT_EQ(lock->releases(), 1u);

    EXPECT_TRUE(h->close().succeeded());
    EXPECT_EQ(lock->releases(), 1u);
    EXPECT_EQ(lock->acquisitions(), 1u);
}

TEST(WriteHandle, RemoveDeletesFileAndReleasesLock) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("doomed.txt").string();
    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);
    ASSERT_TRUE(h->write(std::string_view("bye")).succeeded());

    auto r = h->remove();
    ASSERT_TRUE(r.succeeded()) << r.errorInfo().message;
    EXPECT_FALSE(h->isOpen());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(env.locks().isLocked(h->normalizedKey()));

    // A new writer can take the identity immediately
    auto again = env.vfs().tryOpenWritable(path, std::chrono::milliseconds(0));
    ASSERT_NE(again, nullptr);
    EXPECT_TRUE(again->close().succeeded());
}

TEST(WriteHandle, RemoveMissingFileFailsButStillReleasesLock) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("never_written.txt").string();
    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);
    auto lock = env.locks().lockFor(h->normalizedKey());

    auto r = h->remove();
    EXPECT_EQ(r.status(), FileOpStatus::Failed);
    EXPECT_EQ(r.errorInfo().code, FileError::FileNotFound);
    EXPECT_FALSE(h->isOpen());
    EXPECT_FALSE(lock->isHeld());
    EXPECT_EQ(lock->releases(), 1u);

    EXPECT_TRUE(h->close().succeeded());
    EXPECT_EQ(lock->releases(), 1u);
}

TEST(WriteHandle, DestroyingOpenHandleClosesWithWarning) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("dropped.txt").string();
    std::string key;
    {
        ScopedLogCapture capture(Logging::LogLevel::Warning);
        {
            auto h = env.vfs().openWritable(path);
            ASSERT_NE(h, nullptr);
            key = h->normalizedKey();
            ASSERT_TRUE(h->write(std::string_view("data")).succeeded());
        }
        EXPECT_TRUE(capture.sink().contains(Logging::LogLevel::Warning, "destroyed while open"));
    }
    EXPECT_FALSE(env.locks().isLocked(key));
    EXPECT_EQ(env.vfs().channelRegistry().referenceCount(key), 0u);
    EXPECT_EQ(readAllBytes(path), "data");
}

TEST(WriteHandle, WriteToDirectoryPathFailsAndLeavesHandleOpen) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto dir = tmp.join("subdir");
    std::filesystem::create_directory(dir);

    auto h = env.vfs().openWritable(dir.string());
    ASSERT_NE(h, nullptr);
    auto w = h->write(std::string_view("nope"));
    EXPECT_EQ(w.status(), FileOpStatus::Failed);
    EXPECT_EQ(w.errorInfo().code, FileError::InvalidPath);
    ASSERT_TRUE(w.errorInfo().systemError.has_value());
    EXPECT_EQ(w.errorInfo().systemError->value(), EISDIR);
    EXPECT_TRUE(h->isOpen());
    EXPECT_FALSE(h->channelBound());
    EXPECT_EQ(h->position(), 0u);
    EXPECT_TRUE(h->close().succeeded());
}

TEST(WriteHandle, CreateParentDirsConfigCreatesMissingParents) {
    VirtualFileSystem::Config cfg;
    cfg.defaultCreateParentDirs = true;
    ScopedVfsEnv env(cfg);
    ScopedTempDir tmp;
    auto path = tmp.join("deep/nested/file.txt");

    auto h = env.vfs().openWritable(path.string());
    ASSERT_NE(h, nullptr);
    auto w = h->write(std::string_view("nested"));
    ASSERT_TRUE(w.succeeded()) << w.errorInfo().message;
    ASSERT_TRUE(h->close().succeeded());
    EXPECT_EQ(readAllBytes(path), "nested");
}

TEST(WriteHandle, MissingParentWithoutConfigFailsWithFileNotFound) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto h = env.vfs().openWritable(tmp.join("absent/file.txt").string());
    ASSERT_NE(h, nullptr);
    auto w = h->write(std::string_view("x"));
    EXPECT_EQ(w.errorInfo().code, FileError::FileNotFound);
    EXPECT_TRUE(h->isOpen());
    EXPECT_TRUE(h->close().succeeded());
}

TEST(WriteHandle, SyncOnCloseWritesThrough) {
    VirtualFileSystem::Config cfg;
    cfg.syncOnClose = true;
    ScopedVfsEnv env(cfg);
    ScopedTempDir tmp;
    auto path = tmp.join("synced.txt");

    auto h = env.vfs().openWritable(path.string());
    ASSERT_NE(h, nullptr);
    ASSERT_TRUE(h->write(std::string_view("durable")).succeeded());
    auto c = h->close();
    ASSERT_TRUE(c.succeeded()) << c.errorInfo().message;
    EXPECT_EQ(readAllBytes(path), "durable");
}

TEST(WriteHandle, DescribeNamesThePath) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("named.txt").string();
    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(h->describe(), "WriteHandle(" + path + ")");
    EXPECT_EQ(h->path(), path);
    EXPECT_EQ(h->fileSystem(), &env.vfs());
    EXPECT_TRUE(h->close().succeeded());
}

TEST(WriteHandle, CloseReleasesLockWhenChannelCloseFails) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto backend = std::make_shared<FailingCloseBackend>();
    env.vfs().setDefaultBackend(backend);
    auto path = tmp.join("flaky.txt").string();
    backend->failCloseFor(path);

    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);
    auto lock = env.locks().lockFor(h->normalizedKey());
    ASSERT_TRUE(h->write(std::string_view("data")).succeeded());
    EXPECT_EQ(channelOpenCount(env.vfs(), *h), 1u);

    ScopedLogCapture capture(Logging::LogLevel::Warning);
    auto c = h->close();
    EXPECT_EQ(c.status(), FileOpStatus::Failed);
    EXPECT_EQ(c.errorInfo().code, FileError::IOError);
    ASSERT_TRUE(c.errorInfo().systemError.has_value());
    EXPECT_EQ(c.errorInfo().systemError->value(), EIO);
    EXPECT_TRUE(capture.sink().contains(Logging::LogLevel::Warning, "Channel close failed"));

    EXPECT_FALSE(h->isOpen());
    EXPECT_FALSE(h->channelBound());
    EXPECT_EQ(channelOpenCount(env.vfs(), *h), 0u);
    EXPECT_FALSE(lock->isHeld());
    EXPECT_EQ(lock->releases(), 1u);

    EXPECT_TRUE(h->close().succeeded());
    EXPECT_EQ(lock->releases(), 1u);
    EXPECT_EQ(readAllBytes(path), "data");
}

TEST(WriteHandle, RemoveSkipsDeleteWhenChannelCloseFails) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto backend = std::make_shared<FailingCloseBackend>();
    env.vfs().setDefaultBackend(backend);
    auto path = tmp.join("sticky.txt").string();
    backend->failCloseFor(path);

    auto h = env.vfs().openWritable(path);
    ASSERT_NE(h, nullptr);
    auto lock = env.locks().lockFor(h->normalizedKey());
    ASSERT_TRUE(h->write(std::string_view("kept")).succeeded());

    auto r = h->remove();
    EXPECT_EQ(r.status(), FileOpStatus::Failed);
    EXPECT_EQ(r.errorInfo().code, FileError::IOError);
    EXPECT_FALSE(h->isOpen());
    EXPECT_FALSE(h->channelBound());
    EXPECT_EQ(channelOpenCount(env.vfs(), *h), 0u);
    EXPECT_FALSE(lock->isHeld());
    EXPECT_EQ(lock->releases(), 1u);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(readAllBytes(path), "kept");
}
