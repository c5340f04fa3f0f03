#include <gtest/gtest.h>
#include "core/instance_lock.hpp"
#include "test_base.hpp"
#include <fcntl.h>
#include <future>
#include <sys/file.h>
#include <sys/wait.h>

using namespace std::chrono_literals;

namespace
{
    // pid of a process that has already exited
    pid_t deadPid()
    {
        pid_t pid = fork();
        if (pid == 0)
        {
            _exit(0);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        return pid;
    }
}

class InstanceLockTest : public TestBase
{
protected:
    void writeRecord(pid_t pid, double heartbeat, const std::string &hostname)
    {
        InstanceLockRecord record;
        record.pid = pid;
        record.started_at = heartbeat;
        record.heartbeat = heartbeat;
        record.hostname = hostname;
        writeFile("run/videoconverter.lock", record.toJson().dump());
    }

    std::string lockPath() const
    {
        return path("run/videoconverter.lock");
    }

    RecordingEventSink events;
};

TEST_F(InstanceLockTest, AcquireWritesRecordAndReleaseRemovesIt)
{
    InstanceLock lock(lockPath(), 24h, events);
    ASSERT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
    EXPECT_TRUE(lock.isHeld());

    auto record = lock.readRecord();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->pid, getpid());
    EXPECT_EQ(record->hostname, InstanceLock::currentHostname());
    EXPECT_NEAR(record->started_at, InstanceLock::nowSeconds(), 5.0);

    lock.release();
    EXPECT_FALSE(lock.isHeld());
    EXPECT_FALSE(fs::exists(lockPath()));
    EXPECT_EQ(events.count("lock", "Lock released"), 1u);
}

TEST_F(InstanceLockTest, SecondInstanceIsRefusedWhileFirstIsAlive)
{
    InstanceLock first(lockPath(), 24h, events);
    ASSERT_EQ(first.acquire(), LockAcquireResult::ACQUIRED);

    InstanceLock second(lockPath(), 24h, events);
    EXPECT_EQ(second.acquire(), LockAcquireResult::ALREADY_RUNNING);
    EXPECT_FALSE(second.isHeld());
    EXPECT_NE(second.lastError().find(std::to_string(getpid())), std::string::npos);

    // The refused instance must not remove the owner's record
    second.release();
    EXPECT_TRUE(fs::exists(lockPath()));
}

TEST_F(InstanceLockTest, DeadOwnerOnThisHostIsReclaimed)
{
    writeRecord(deadPid(), InstanceLock::nowSeconds(), InstanceLock::currentHostname());

    InstanceLock lock(lockPath(), 24h, events);
    EXPECT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
    EXPECT_EQ(lock.readRecord()->pid, getpid());
    EXPECT_EQ(events.count("lock", "Stale lock reclaimed"), 1u);
}

TEST_F(InstanceLockTest, OldHeartbeatIsReclaimedEvenIfPidIsAlive)
{
    writeRecord(getppid(), InstanceLock::nowSeconds() - 3600, InstanceLock::currentHostname());

    InstanceLock lock(lockPath(), 60s, events);
    EXPECT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
}

TEST_F(InstanceLockTest, LiveOwnerWithFreshHeartbeatBlocks)
{
    writeRecord(getppid(), InstanceLock::nowSeconds(), InstanceLock::currentHostname());

    InstanceLock lock(lockPath(), 60s, events);
    EXPECT_EQ(lock.acquire(), LockAcquireResult::ALREADY_RUNNING);
}

TEST_F(InstanceLockTest, OtherHostIsJudgedByHeartbeatOnly)
{
    writeRecord(deadPid(), InstanceLock::nowSeconds(), "some-other-host.example");

    InstanceLock lock(lockPath(), 60s, events);
    EXPECT_EQ(lock.acquire(), LockAcquireResult::ALREADY_RUNNING);
}

TEST_F(InstanceLockTest, OldGarbageRecordIsReclaimed)
{
    writeFile("run/videoconverter.lock", "not json at all");
    fs::last_write_time(lockPath(), fs::file_time_type::clock::now() - 1h);

    InstanceLock lock(lockPath(), 24h, events);
    EXPECT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
    EXPECT_EQ(lock.readRecord()->pid, getpid());
}

TEST_F(InstanceLockTest, FreshlyCreatedEmptyRecordBlocks)
{
    // Another starter that has created the file but not yet written its record
    fs::create_directories(path("run"));
    int fd = open(lockPath().c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    ASSERT_GE(fd, 0);

    InstanceLock lock(lockPath(), 24h, events);
    EXPECT_EQ(lock.acquire(), LockAcquireResult::ALREADY_RUNNING);
    EXPECT_FALSE(lock.isHeld());
    EXPECT_TRUE(fs::exists(lockPath()));
    EXPECT_EQ(events.count("lock", "Stale lock reclaimed"), 0u);
    close(fd);
}

TEST_F(InstanceLockTest, AcquireWaitsForGuardHolder)
{
    writeRecord(deadPid(), InstanceLock::nowSeconds(), InstanceLock::currentHostname());

    InstanceLock lock(lockPath(), 24h, events);
    int guard = open(lock.guardPath().c_str(), O_RDWR | O_CREAT, 0644);
    ASSERT_GE(guard, 0);
    ASSERT_EQ(flock(guard, LOCK_EX), 0);

    auto result = std::async(std::launch::async, [&lock]()
                             { return lock.acquire(); });
    EXPECT_EQ(result.wait_for(200ms), std::future_status::timeout);
    // The stale record is untouched while the guard is held elsewhere
    EXPECT_NE(lock.readRecord()->pid, getpid());

    flock(guard, LOCK_UN);
    close(guard);
    EXPECT_EQ(result.get(), LockAcquireResult::ACQUIRED);
    EXPECT_EQ(lock.readRecord()->pid, getpid());
}

TEST_F(InstanceLockTest, RefreshAdvancesHeartbeat)
{
    InstanceLock lock(lockPath(), 24h, events);
    ASSERT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
    double before = lock.readRecord()->heartbeat;

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(lock.refresh());
    auto after = lock.readRecord();
    ASSERT_TRUE(after.has_value());
    EXPECT_GT(after->heartbeat, before);
    EXPECT_DOUBLE_EQ(after->started_at, before);
}

TEST_F(InstanceLockTest, RefreshFailsWhenRecordWasTakenOver)
{
    InstanceLock lock(lockPath(), 24h, events);
    ASSERT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
    writeRecord(getppid(), InstanceLock::nowSeconds(), InstanceLock::currentHostname());

    EXPECT_FALSE(lock.refresh());
    lock.release();
    // Release leaves someone else's record alone
    EXPECT_TRUE(fs::exists(lockPath()));
}

TEST_F(InstanceLockTest, DestructorReleases)
{
    {
        InstanceLock lock(lockPath(), 24h, events);
        ASSERT_EQ(lock.acquire(), LockAcquireResult::ACQUIRED);
    }
    EXPECT_FALSE(fs::exists(lockPath()));
}

TEST(InstanceLockRecordTest, ParsesAndRejects)
{
    auto record = InstanceLockRecord::fromJson(R"({"pid": 42, "started_at": 1700000000.5, "heartbeat": 1700000060.25, "hostname": "box"})");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->pid, 42);
    EXPECT_DOUBLE_EQ(record->heartbeat, 1700000060.25);

    EXPECT_FALSE(InstanceLockRecord::fromJson("{}").has_value());
    EXPECT_FALSE(InstanceLockRecord::fromJson(R"({"pid": 0, "started_at": 1})").has_value());
    EXPECT_FALSE(InstanceLockRecord::fromJson("").has_value());
}
