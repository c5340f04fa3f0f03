#include "core/instance_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
    const char *COMPONENT = "lock";

    // Exclusive flock() on the guard file for the lifetime of the object
    class GuardLock
    {
    public:
        explicit GuardLock(const std::string &guard_path)
        {
            fd_ = open(guard_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
            if (fd_ < 0)
            {
                error_ = std::string("Cannot open lock guard: ") + std::strerror(errno);
                return;
            }
            while (flock(fd_, LOCK_EX) != 0)
            {
                if (errno != EINTR)
                {
                    error_ = std::string("Cannot lock guard: ") + std::strerror(errno);
                    close(fd_);
                    fd_ = -1;
                    return;
                }
            }
        }

        ~GuardLock()
        {
            if (fd_ >= 0)
            {
                flock(fd_, LOCK_UN);
                close(fd_);
            }
        }

        GuardLock(const GuardLock &) = delete;
        GuardLock &operator=(const GuardLock &) = delete;

        bool locked() const { return fd_ >= 0; }
        const std::string &error() const { return error_; }

    private:
        int fd_{-1};
        std::string error_;
    };
}

nlohmann::json InstanceLockRecord::toJson() const
{
    return nlohmann::json{{"pid", pid}, {"started_at", started_at}, {"heartbeat", heartbeat}, {"hostname", hostname}};
}

std::optional<InstanceLockRecord> InstanceLockRecord::fromJson(const std::string &text)
{
    try
    {
        auto j = nlohmann::json::parse(text);
        InstanceLockRecord record;
        record.pid = j.at("pid").get<pid_t>();
        record.started_at = j.at("started_at").get<double>();
        record.heartbeat = j.value("heartbeat", record.started_at);
        record.hostname = j.value("hostname", std::string());
        if (record.pid <= 0)
        {
            return std::nullopt;
        }
        return record;
    }
    catch (const nlohmann::json::exception &)
    {
        return std::nullopt;
    }
}

InstanceLock::InstanceLock(std::string lock_path, std::chrono::milliseconds stale_after, EventSink &events)
    : lock_path_(std::move(lock_path)), stale_after_(stale_after), events_(events)
{
}

InstanceLock::~InstanceLock()
{
    release();
}

bool InstanceLock::isProcessAlive(pid_t pid)
{
    if (pid <= 0)
    {
        return false;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}

std::string InstanceLock::currentHostname()
{
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0)
    {
        return "localhost";
    }
    return std::string(buffer);
}

double InstanceLock::nowSeconds()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::optional<InstanceLockRecord> InstanceLock::readRecord() const
{
    std::ifstream file(lock_path_);
    if (!file.is_open())
    {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return InstanceLockRecord::fromJson(buffer.str());
}

bool InstanceLock::isStale(const std::optional<InstanceLockRecord> &record, std::string &reason) const
{
    if (!record)
    {
        struct stat st
        {
        };
        if (stat(lock_path_.c_str(), &st) != 0)
        {
            reason = "lock record vanished";
            return true;
        }
        double modified = static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
        double age = nowSeconds() - modified;
        if (age < std::chrono::duration<double>(UNREADABLE_GRACE).count())
        {
            reason = "lock record is still being written";
            return false;
        }
        reason = "unreadable lock record";
        return true;
    }
    if (record->hostname == currentHostname() && !isProcessAlive(record->pid))
    {
        reason = "process " + std::to_string(record->pid) + " is not running";
        return true;
    }
    double age = nowSeconds() - record->heartbeat;
    double limit = std::chrono::duration<double>(stale_after_).count();
    if (age > limit)
    {
        reason = "heartbeat is " + std::to_string(static_cast<long long>(age)) + "s old";
        return true;
    }
    return false;
}

bool InstanceLock::writeAll(int fd, const std::string &data)
{
    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            last_error_ = std::string("write failed: ") + std::strerror(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return fsync(fd) == 0 || errno == EINVAL;
}

LockAcquireResult InstanceLock::acquire()
{
    if (held_)
    {
        return LockAcquireResult::ACQUIRED;
    }

    std::error_code ec;
    auto parent = std::filesystem::path(lock_path_).parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }

    GuardLock guard(guardPath());
    if (!guard.locked())
    {
        last_error_ = guard.error();
        events_.error(COMPONENT, "Lock acquisition failed", {{"path", lock_path_}, {"error", last_error_}});
        return LockAcquireResult::ERROR;
    }

    for (int attempt = 0; attempt < 3; ++attempt)
    {
        int fd = open(lock_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0)
        {
            InstanceLockRecord record;
            record.pid = getpid();
            record.started_at = nowSeconds();
            record.heartbeat = record.started_at;
            record.hostname = currentHostname();

            bool ok = writeAll(fd, record.toJson().dump() + "\n");
            close(fd);
            if (!ok)
            {
                unlink(lock_path_.c_str());
                events_.error(COMPONENT, "Could not write lock record", {{"path", lock_path_}, {"error", last_error_}});
                return LockAcquireResult::ERROR;
            }
            held_ = true;
            started_at_ = record.started_at;
            events_.info(COMPONENT, "Lock acquired", {{"path", lock_path_}, {"pid", record.pid}});
            return LockAcquireResult::ACQUIRED;
        }

        if (errno != EEXIST)
        {
            last_error_ = std::string("Cannot create lock file: ") + std::strerror(errno);
            events_.error(COMPONENT, "Lock acquisition failed", {{"path", lock_path_}, {"error", last_error_}});
            return LockAcquireResult::ERROR;
        }

        auto existing = readRecord();
        std::string reason;
        if (!isStale(existing, reason))
        {
            if (!existing)
            {
                last_error_ = "Another instance is starting (" + reason + ")";
                events_.warn(COMPONENT, "Lock held by another instance", {{"path", lock_path_}, {"reason", reason}});
                return LockAcquireResult::ALREADY_RUNNING;
            }
            last_error_ = "Another instance is running (pid " + std::to_string(existing->pid) + ")";
            events_.warn(COMPONENT, "Lock held by another instance",
                         {{"path", lock_path_}, {"pid", existing->pid}, {"hostname", existing->hostname}});
            return LockAcquireResult::ALREADY_RUNNING;
        }

        events_.warn(COMPONENT, "Stale lock reclaimed", {{"path", lock_path_}, {"reason", reason}});
        if (unlink(lock_path_.c_str()) != 0 && errno != ENOENT)
        {
            last_error_ = std::string("Cannot remove stale lock: ") + std::strerror(errno);
            events_.error(COMPONENT, "Lock acquisition failed", {{"path", lock_path_}, {"error", last_error_}});
            return LockAcquireResult::ERROR;
        }
    }

    last_error_ = "Lock file keeps reappearing";
    return LockAcquireResult::ERROR;
}

bool InstanceLock::refresh()
{
    if (!held_)
    {
        return false;
    }
    GuardLock guard(guardPath());
    if (!guard.locked())
    {
        last_error_ = guard.error();
        events_.warn(COMPONENT, "Lock heartbeat failed", {{"path", lock_path_}, {"error", last_error_}});
        return false;
    }
    auto current = readRecord();
    if (!current || current->pid != getpid())
    {
        events_.error(COMPONENT, "Lock record no longer ours", {{"path", lock_path_}});
        return false;
    }

    InstanceLockRecord record = *current;
    record.heartbeat = nowSeconds();

    // Write beside the lock and rename so readers never see a partial record
    std::string tmp_path = lock_path_ + ".tmp." + std::to_string(getpid());
    int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        last_error_ = std::string("Cannot write heartbeat: ") + std::strerror(errno);
        events_.warn(COMPONENT, "Lock heartbeat failed", {{"path", lock_path_}, {"error", last_error_}});
        return false;
    }
    bool ok = writeAll(fd, record.toJson().dump() + "\n");
    close(fd);
    if (!ok || rename(tmp_path.c_str(), lock_path_.c_str()) != 0)
    {
        if (ok)
        {
            last_error_ = std::string("Cannot replace lock record: ") + std::strerror(errno);
        }
        unlink(tmp_path.c_str());
        events_.warn(COMPONENT, "Lock heartbeat failed", {{"path", lock_path_}, {"error", last_error_}});
        return false;
    }
    return true;
}

void InstanceLock::release()
{
    if (!held_)
    {
        return;
    }
    held_ = false;
    GuardLock guard(guardPath());
    if (!guard.locked())
    {
        events_.warn(COMPONENT, "Could not remove lock file", {{"path", lock_path_}, {"error", guard.error()}});
        return;
    }
    auto current = readRecord();
    if (current && current->pid == getpid())
    {
        if (unlink(lock_path_.c_str()) != 0 && errno != ENOENT)
        {
            events_.warn(COMPONENT, "Could not remove lock file", {{"path", lock_path_}, {"error", std::strerror(errno)}});
            return;
        }
        events_.info(COMPONENT, "Lock released", {{"path", lock_path_}});
    }
}
