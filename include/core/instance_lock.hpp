#pragma once

#include "logging/event_sink.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>

/**
 * @brief Persisted owner record of the instance lock
 */
struct InstanceLockRecord
{
    pid_t pid = 0;
    double started_at = 0.0; // seconds since the epoch
    double heartbeat = 0.0;
    std::string hostname;

    nlohmann::json toJson() const;
    static std::optional<InstanceLockRecord> fromJson(const std::string &text);
};

enum class LockAcquireResult
{
    ACQUIRED,
    ALREADY_RUNNING,
    ERROR
};

/**
 * @brief Lock file that allows one live process per lock path.
 *
 * The record is created with O_CREAT|O_EXCL. An existing record is
 * reclaimed when its pid is gone on this host, its heartbeat is older
 * than stale_after, or it has been unparsable for longer than
 * UNREADABLE_GRACE. Create, inspect and reclaim all run under flock() on
 * "<lock_path>.guard", so two starters never both win. The destructor
 * releases the lock if this object still owns it.
 */
class InstanceLock
{
public:
    // An empty or partial record younger than this belongs to a writer that is still starting
    static constexpr std::chrono::seconds UNREADABLE_GRACE{10};

    InstanceLock(std::string lock_path, std::chrono::milliseconds stale_after, EventSink &events);
    ~InstanceLock();

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

    LockAcquireResult acquire();

    /**
     * @brief Rewrite the heartbeat timestamp
     * @return false if the lock is not held or the record now belongs to someone else
     */
    bool refresh();

    void release();

    bool isHeld() const { return held_; }
    const std::string &path() const { return lock_path_; }
    std::string guardPath() const { return lock_path_ + ".guard"; }
    const std::string &lastError() const { return last_error_; }

    std::optional<InstanceLockRecord> readRecord() const;

    static bool isProcessAlive(pid_t pid);
    static std::string currentHostname();
    static double nowSeconds();

private:
    bool isStale(const std::optional<InstanceLockRecord> &record, std::string &reason) const;
    bool writeAll(int fd, const std::string &data);

    const std::string lock_path_;
    const std::chrono::milliseconds stale_after_;
    EventSink &events_;

    bool held_{false};
    double started_at_{0.0};
    std::string last_error_;
};
