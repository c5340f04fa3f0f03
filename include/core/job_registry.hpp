#pragma once

#include "core/conversion_job.hpp"
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Owner of every ConversionJob in the process.
 *
 * All status and attempt changes go through this class under a single
 * mutex. It enforces the one-active-job-per-path rule and the Running
 * limit, and reports each transition to an optional listener.
 */
class JobRegistry
{
public:
    using TransitionListener = std::function<void(const ConversionJob &)>;

    explicit JobRegistry(size_t max_running);

    /**
     * @brief Create a Pending job for a source path
     * @return The new job id, or nullopt if the path already has a
     *         non-terminal job or an unchanged Succeeded/Failed one
     */
    std::optional<JobId> create(const std::string &source_path, const std::string &watch_root,
                                uint64_t size, std::time_t mtime);

    bool markStabilizing(JobId id);
    bool markQueued(JobId id, const std::string &destination_path);

    /**
     * @brief Queued -> Running; increments the attempt count
     * @return Snapshot of the job, or nullopt if it is not Queued or the
     *         Running limit is reached
     */
    std::optional<ConversionJob> markRunning(JobId id);

    bool markSucceeded(JobId id);
    bool markFailed(JobId id, ErrorKind kind, const std::string &message);

    // Running -> Queued after a retryable failure
    bool markRetryPending(JobId id, ErrorKind kind, const std::string &message);

    bool markAbandoned(JobId id, const std::string &reason);

    // Refresh the recorded size/mtime once the file has stabilized
    void updateSourceMetadata(JobId id, uint64_t size, std::time_t mtime);

    std::optional<ConversionJob> get(JobId id) const;
    std::optional<ConversionJob> findByPath(const std::string &source_path) const;

    size_t runningCount() const;
    size_t peakRunningCount() const;
    size_t countWithStatus(JobStatus status) const;
    size_t activeCount() const;

    void setTransitionListener(TransitionListener listener);

private:
    bool transition(JobId id, std::initializer_list<JobStatus> allowed_from, JobStatus to,
                    const std::function<void(ConversionJob &)> &mutate = nullptr);
    void notify(const ConversionJob &job);

    const size_t max_running_;
    mutable std::mutex mutex_;
    JobId next_id_{1};
    std::map<JobId, ConversionJob> jobs_;
    std::unordered_map<std::string, JobId> latest_by_path_;
    size_t running_{0};
    size_t peak_running_{0};
    TransitionListener listener_;
};
