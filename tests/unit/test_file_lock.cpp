#include <gtest/gtest.h>
#include "mcpconf/file_lock.hpp"
#include "mcpconf/error.hpp"
#include "test_support.hpp"
#include <chrono>

using namespace mcpconf;
using mcpconf::testing::TempDir;
using namespace std::chrono_literals;

TEST(FileLock, LockPathAppendsSuffix) {
    EXPECT_EQ(FileLock::lock_path_for("/x/config.json"), std::filesystem::path("/x/config.json.lock"));
}

TEST(FileLock, AcquireAndRelease) {
    TempDir dir;
    auto target = dir / "config.json";
    {
        FileLock lock(target, 100ms);
        EXPECT_TRUE(std::filesystem::exists(lock.lock_path()));
    }
    // Released on destruction, so a second acquisition succeeds at once.
    EXPECT_NO_THROW(FileLock(target, 0ms));
}

TEST(FileLock, ContentionTimesOut) {
    TempDir dir;
    auto target = dir / "config.json";
    FileLock held(target, 100ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(FileLock(target, 150ms), LockTimeoutError);
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_GE(waited, 150ms);
}

TEST(FileLock, DifferentTargetsDoNotContend) {
    TempDir dir;
    FileLock a(dir / "a.json", 50ms);
    EXPECT_NO_THROW(FileLock(dir / "b.json", 0ms));
}
