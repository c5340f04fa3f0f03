#pragma once

#include "core/job_queue.hpp"
#include "core/job_registry.hpp"
#include "core/retry_manager.hpp"
#include "core/transcode_executor.hpp"
#include "logging/event_sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Fixed set of worker threads draining the JobQueue
 */
class WorkerPool
{
public:
    using ProfileProvider = std::function<EncoderProfile()>;

    WorkerPool(size_t workers, JobQueue &queue, JobRegistry &registry, JobExecutor &executor,
               RetryManager &retry, ProfileProvider profile, EventSink &events);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void start();

    /**
     * @brief Wait for in-flight conversions to finish
     * @return true if every worker became idle before the timeout
     */
    bool awaitIdle(std::chrono::milliseconds timeout);

    // Ask running subprocesses to terminate; their jobs end Abandoned
    void cancelRunning();

    // Join all threads; the queue must have been closed first
    void join();

private:
    void workerLoop(size_t index);
    void runJob(JobId id);

    const size_t worker_count_;
    JobQueue &queue_;
    JobRegistry &registry_;
    JobExecutor &executor_;
    RetryManager &retry_;
    ProfileProvider profile_;
    EventSink &events_;

    std::vector<std::thread> threads_;
    std::atomic<bool> cancel_{false};

    mutable std::mutex busy_mutex_;
    std::condition_variable busy_cv_;
    size_t busy_{0};
};
