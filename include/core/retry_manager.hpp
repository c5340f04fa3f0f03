#pragma once

#include "core/job_registry.hpp"
#include "core/service_config.hpp"
#include "core/transcode_executor.hpp"
#include "logging/event_sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

enum class RetryAction
{
    SUCCEED,
    RETRY,
    FAIL,
    ABANDON
};

struct RetryDecision
{
    RetryAction action = RetryAction::FAIL;
    std::chrono::milliseconds delay{0};
    ErrorKind kind = ErrorKind::RETRYABLE;
    std::string message;
};

struct RetryPolicy
{
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{std::chrono::seconds(60)};
    RetryBackoff backoff = RetryBackoff::FIXED;
    std::chrono::milliseconds retry_delay_max{std::chrono::hours(1)};
    bool delete_original = true;
};

/**
 * @brief Turns a conversion outcome into the job's next status.
 *
 * A job is retried while its attempt count is below max_retries, so a
 * persistently failing job runs max_retries times in total. Delayed
 * re-enqueues wait on a scheduler thread; stop() abandons them.
 */
class RetryManager
{
public:
    using Requeue = std::function<bool(JobId)>;

    RetryManager(RetryPolicy policy, JobRegistry &registry, Requeue requeue, EventSink &events);
    ~RetryManager();

    RetryManager(const RetryManager &) = delete;
    RetryManager &operator=(const RetryManager &) = delete;

    RetryDecision decide(const ConversionJob &job, const TranscodeOutcome &outcome) const;

    /**
     * @brief Record the decision in the registry and act on it
     * (delete the source, re-enqueue now or later)
     */
    void apply(const ConversionJob &job, const RetryDecision &decision);

    std::chrono::milliseconds delayFor(int attempt) const;

    void start();

    // Stop the scheduler; jobs still waiting for their retry end Abandoned
    void stop();

    size_t pendingCount() const;

private:
    void schedulerLoop();
    void requeueOrAbandon(JobId id);

    const RetryPolicy policy_;
    JobRegistry &registry_;
    Requeue requeue_;
    EventSink &events_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<std::chrono::steady_clock::time_point, JobId> pending_;
    std::thread scheduler_;
    bool running_{false};
};
