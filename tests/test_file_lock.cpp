#include "test_helpers.hpp"
#include <platform/file_lock.hpp>
#include <managers/lock_manager.hpp>
#include <chrono>
#include <limits>
#include <thread>

class FileLockTest : public TempDirTest {
protected:
    std::string lock_path() const { return (test_dir / ".pyre" / "client.lock").string(); }
};

TEST_F(FileLockTest, CreatesFileAndParents) {
    FileLock lock(lock_path(), LockMode::NonBlocking);
    EXPECT_TRUE(lock.held());
    EXPECT_EQ(lock.error(), LockError::None);
    EXPECT_TRUE(fs::exists(lock_path()));
}

TEST_F(FileLockTest, NonBlockingBusyWhenHeld) {
    FileLock first(lock_path(), LockMode::NonBlocking);
    ASSERT_TRUE(first.held());

    FileLock second(lock_path(), LockMode::NonBlocking);
    EXPECT_FALSE(second.held());
    EXPECT_EQ(second.error(), LockError::Busy);
    EXPECT_NE(second.reason().find(lock_path()), std::string::npos);
}

TEST_F(FileLockTest, ReleasedOnScopeExit) {
    {
        FileLock lock(lock_path(), LockMode::NonBlocking);
        ASSERT_TRUE(lock.held());
    }
    FileLock again(lock_path(), LockMode::NonBlocking);
    EXPECT_TRUE(again.held());
}

TEST_F(FileLockTest, ReleaseEarlyIsIdempotent) {
    FileLock lock(lock_path(), LockMode::NonBlocking);
    ASSERT_TRUE(lock.held());
    lock.release();
    lock.release();
    EXPECT_FALSE(lock.held());

    FileLock again(lock_path(), LockMode::NonBlocking);
    EXPECT_TRUE(again.held());
}

TEST_F(FileLockTest, MoveTransfersOwnership) {
    FileLock outer;
    {
        FileLock inner(lock_path(), LockMode::NonBlocking);
        ASSERT_TRUE(inner.held());
        outer = std::move(inner);
        EXPECT_FALSE(inner.held());
    }
    // inner is gone but the lock moved out with it
    EXPECT_TRUE(outer.held());
    FileLock contender(lock_path(), LockMode::NonBlocking);
    EXPECT_EQ(contender.error(), LockError::Busy);
}

TEST_F(FileLockTest, LeavesContentsAlone) {
    write_file(lock_path(), "marker");
    {
        FileLock lock(lock_path(), LockMode::NonBlocking);
        ASSERT_TRUE(lock.held());
    }
    EXPECT_EQ(read_file(lock_path()), "marker");
}

TEST_F(FileLockTest, UnavailableWhenParentIsAFile) {
    write_file(test_dir / ".pyre", "not a directory");
    FileLock lock(lock_path(), LockMode::NonBlocking);
    EXPECT_FALSE(lock.held());
    EXPECT_EQ(lock.error(), LockError::Unavailable);
    EXPECT_FALSE(lock.reason().empty());
}

TEST_F(FileLockTest, UnavailableWhenPathIsADirectory) {
    fs::create_directories(lock_path());
    FileLock lock(lock_path(), LockMode::Blocking);
    EXPECT_FALSE(lock.held());
    EXPECT_EQ(lock.error(), LockError::Unavailable);
}

TEST_F(FileLockTest, BlockingWaitsForHolder) {
    auto holder = std::make_unique<FileLock>(lock_path(), LockMode::NonBlocking);
    ASSERT_TRUE(holder->held());

    std::thread releaser([&holder] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        holder.reset();
    });

    auto start = std::chrono::steady_clock::now();
    FileLock waiter(lock_path(), LockMode::Blocking);
    auto waited = std::chrono::steady_clock::now() - start;
    releaser.join();

    EXPECT_TRUE(waiter.held());
    EXPECT_GE(waited, std::chrono::milliseconds(150));
}

TEST_F(FileLockTest, BoundedWaitTimesOut) {
    FileLock holder(lock_path(), LockMode::NonBlocking);
    ASSERT_TRUE(holder.held());

    FileLock waiter(lock_path(), LockMode::Blocking, 100);
    EXPECT_FALSE(waiter.held());
    EXPECT_EQ(waiter.error(), LockError::Timeout);
}

TEST_F(FileLockTest, BoundedWaitSucceedsWhenFree) {
    FileLock lock(lock_path(), LockMode::Blocking, 100);
    EXPECT_TRUE(lock.held());
}

TEST_F(FileLockTest, FailedCarriesError) {
    FileLock lock = FileLock::failed(lock_path(), LockError::Busy, "held");
    EXPECT_FALSE(lock.held());
    EXPECT_EQ(lock.error(), LockError::Busy);
    EXPECT_EQ(lock.reason(), "held");
    EXPECT_EQ(lock.path(), lock_path());
    EXPECT_FALSE(fs::exists(lock_path()));
}

TEST(LockErrorName, Names) {
    EXPECT_STREQ(lock_error_name(LockError::None), "none");
    EXPECT_STREQ(lock_error_name(LockError::Busy), "busy");
    EXPECT_STREQ(lock_error_name(LockError::Unavailable), "unavailable");
    EXPECT_STREQ(lock_error_name(LockError::Timeout), "timeout");
}

// ── FileLockManager ─────────────────────────────────────────

TEST_F(FileLockTest, ManagerNonBlockingIgnoresTimeout) {
    FileLockManager locks(5);
    FileLock holder = locks.acquire(lock_path(), LockMode::NonBlocking);
    ASSERT_TRUE(holder.held());

    auto start = std::chrono::steady_clock::now();
    FileLock busy = locks.acquire(lock_path(), LockMode::NonBlocking);
    EXPECT_EQ(busy.error(), LockError::Busy);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST_F(FileLockTest, ManagerBlockingHonorsTimeout) {
    FileLockManager locks(1);
    FileLock holder = locks.acquire(lock_path(), LockMode::NonBlocking);
    ASSERT_TRUE(holder.held());

    FileLock waiter = locks.acquire(lock_path(), LockMode::Blocking);
    EXPECT_EQ(waiter.error(), LockError::Timeout);
    EXPECT_EQ(waiter.mode(), LockMode::Blocking);
}

TEST_F(FileLockTest, ManagerTimeoutConversion) {
    EXPECT_EQ(FileLockManager().wait_timeout_ms(), -1);
    EXPECT_EQ(FileLockManager(0).wait_timeout_ms(), -1);
    EXPECT_EQ(FileLockManager(3).wait_timeout_ms(), 3000);
    // Large values saturate instead of wrapping to an indefinite wait
    EXPECT_EQ(FileLockManager(2147484).wait_timeout_ms(), std::numeric_limits<int>::max());
    EXPECT_EQ(FileLockManager(std::numeric_limits<int>::max()).wait_timeout_ms(),
              std::numeric_limits<int>::max());
}
