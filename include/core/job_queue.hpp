#pragma once

#include "core/conversion_job.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @brief Unbounded FIFO of queued job ids shared by producers and workers
 */
class JobQueue
{
public:
    JobQueue() = default;
    JobQueue(const JobQueue &) = delete;
    JobQueue &operator=(const JobQueue &) = delete;

    /**
     * @brief Append a job id
     * @return false once the queue has been closed
     */
    bool push(JobId id);

    /**
     * @brief Block until a job id is available or the queue is closed
     * @return The next id, or nullopt after close()
     */
    std::optional<JobId> pop();

    /**
     * @brief Like pop() but gives up after timeout
     */
    std::optional<JobId> popFor(std::chrono::milliseconds timeout);

    /**
     * @brief Stop accepting and handing out work; wakes every waiting worker
     * @return Ids that were still waiting in the queue
     */
    std::deque<JobId> close();

    bool isClosed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::deque<JobId> queue_;
    bool closed_{false};
};
