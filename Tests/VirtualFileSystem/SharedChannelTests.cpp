#include <gtest/gtest.h>

#include <array>
#include <cstddef>
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

TEST(SharedChannel, OpensLazilyAndClosesOnLastRelease) {
    ScopedTempDir tmp;
    auto path = tmp.join("channel.bin");
    auto backend = std::make_shared<LocalFileSystemBackend>();
    SharedChannel channel(backend, path.string());

    EXPECT_FALSE(channel.isOpen());
    EXPECT_FALSE(std::filesystem::exists(path));

    ASSERT_TRUE(channel.open(OpenMode::Write).succeeded());
    ASSERT_TRUE(channel.open(OpenMode::Write).succeeded());
    EXPECT_TRUE(channel.isOpen());
    EXPECT_EQ(channel.openCount(), 2u);

    auto w = channel.writeFully(0, std::as_bytes(std::span<const char>("abcd", 4)));
    ASSERT_TRUE(w.succeeded()) << w.errorInfo().message;
    EXPECT_EQ(w.bytesWritten(), 4u);

    ASSERT_TRUE(channel.close().succeeded());
    EXPECT_TRUE(channel.isOpen());
    EXPECT_EQ(channel.openCount(), 1u);

    ASSERT_TRUE(channel.close().succeeded());
    EXPECT_FALSE(channel.isOpen());
    EXPECT_EQ(channel.openCount(), 0u);
    EXPECT_EQ(readAllBytes(path), "abcd");
}

TEST(SharedChannel, CloseWithoutOpenIsAnError) {
    ScopedTempDir tmp;
    SharedChannel channel(std::make_shared<LocalFileSystemBackend>(), tmp.join("x").string());

    ScopedLogCapture capture(Logging::LogLevel::Error);
    auto c = channel.close();
    EXPECT_EQ(c.status(), FileOpStatus::Failed);
    EXPECT_EQ(c.errorInfo().code, FileError::IOError);
    EXPECT_EQ(channel.openCount(), 0u);
    EXPECT_TRUE(capture.sink().contains(Logging::LogLevel::Error, "not open"));
}

TEST(SharedChannel, IOOnClosedChannelFails) {
    ScopedTempDir tmp;
    SharedChannel channel(std::make_shared<LocalFileSystemBackend>(), tmp.join("y").string());

    EXPECT_EQ(channel.writeFully(0, {}).errorInfo().code, FileError::IOError);
    EXPECT_EQ(channel.truncate(0).errorInfo().code, FileError::IOError);
    std::error_code ec;
    EXPECT_EQ(channel.size(ec), 0u);
    EXPECT_TRUE(ec);
}

TEST(SharedChannel, ReadOpenIsUpgradedForWrite) {
    ScopedTempDir tmp;
    auto path = tmp.join("upgrade.txt");
    writeFile(path, "0123456789");
    SharedChannel channel(std::make_shared<LocalFileSystemBackend>(), path.string());

    ASSERT_TRUE(channel.open(OpenMode::Read).succeeded());
    auto denied = channel.writeFully(0, std::as_bytes(std::span<const char>("X", 1)));
    EXPECT_EQ(denied.errorInfo().code, FileError::AccessDenied);

    ASSERT_TRUE(channel.open(OpenMode::Write).succeeded());
    EXPECT_EQ(channel.openCount(), 2u);
    ASSERT_TRUE(channel.writeFully(2, std::as_bytes(std::span<const char>("XY", 2))).succeeded());

    std::array<std::byte, 16> buffer{};
    auto r = channel.readFully(0, buffer);
    ASSERT_TRUE(r.succeeded());
    EXPECT_EQ(r.bytesRead(), 10u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buffer.data()), r.bytesRead()), "01XY456789");

    std::error_code ec;
    EXPECT_EQ(channel.size(ec), 10u);
    EXPECT_FALSE(ec);

    ASSERT_TRUE(channel.truncate(4).succeeded());
    EXPECT_EQ(channel.size(ec), 4u);

    ASSERT_TRUE(channel.close().succeeded());
    ASSERT_TRUE(channel.close().succeeded());
    EXPECT_EQ(readAllBytes(path), "01XY");
}

TEST(SharedChannel, ReadOpenOfMissingFileFails) {
    ScopedTempDir tmp;
    SharedChannel channel(std::make_shared<LocalFileSystemBackend>(), tmp.join("missing").string());
    auto o = channel.open(OpenMode::Read);
    EXPECT_EQ(o.errorInfo().code, FileError::FileNotFound);
    EXPECT_FALSE(channel.isOpen());
    EXPECT_EQ(channel.openCount(), 0u);
}

TEST(ChannelRegistry, CountsReferencesAndDropsEntryAtZero) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<LocalFileSystemBackend>();
    ChannelRegistry registry;
    auto path = tmp.join("shared.txt").string();

    auto first = registry.acquire("k", backend, path);
    auto second = registry.acquire("k", backend, path);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(registry.referenceCount("k"), 2u);
    EXPECT_EQ(registry.size(), 1u);

    registry.release("k");
    EXPECT_EQ(registry.referenceCount("k"), 1u);
    registry.release("k");
    EXPECT_EQ(registry.referenceCount("k"), 0u);
    EXPECT_EQ(registry.size(), 0u);

    // A fresh acquire after the entry is gone builds a new channel
    auto third = registry.acquire("k", backend, path);
    EXPECT_NE(third.get(), first.get());
    registry.release("k");
}

TEST(ChannelRegistry, UnmatchedReleaseIsLogged) {
    ChannelRegistry registry;
    ScopedLogCapture capture(Logging::LogLevel::Error);
    registry.release("nobody");
    EXPECT_TRUE(capture.sink().contains(Logging::LogLevel::Error, "without matching acquire"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ChannelRegistry, HandlesOfOneIdentityShareAChannelInTurn) {
    ScopedVfsEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("turns.txt").string();

    auto first = env.vfs().openWritable(path);
    ASSERT_NE(first, nullptr);
    auto key = first->normalizedKey();
    EXPECT_EQ(env.vfs().channelRegistry().referenceCount(key), 1u);
    ASSERT_TRUE(first->write(std::string_view("one")).succeeded());
    ASSERT_TRUE(first->close().succeeded());

    // Closed but not yet destroyed: the reference is still counted
    EXPECT_EQ(env.vfs().channelRegistry().referenceCount(key), 1u);

    auto second = env.vfs().openWritable(path);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(env.vfs().channelRegistry().referenceCount(key), 2u);
    ASSERT_TRUE(second->position(3).succeeded());
    ASSERT_TRUE(second->write(std::string_view("two")).succeeded());
    ASSERT_TRUE(second->close().succeeded());

    first.reset();
    second.reset();
    EXPECT_EQ(env.vfs().channelRegistry().referenceCount(key), 0u);
    EXPECT_EQ(readAllBytes(path), "onetwo");
}
