#include "core/retry_manager.hpp"
#include <algorithm>
#include <filesystem>

namespace
{
    const char *COMPONENT = "retry";
}

RetryManager::RetryManager(RetryPolicy policy, JobRegistry &registry, Requeue requeue, EventSink &events)
    : policy_(policy), registry_(registry), requeue_(std::move(requeue)), events_(events)
{
}

RetryManager::~RetryManager()
{
    stop();
}

std::chrono::milliseconds RetryManager::delayFor(int attempt) const
{
    if (policy_.backoff == RetryBackoff::FIXED || attempt <= 1)
    {
        return policy_.retry_delay;
    }
    auto delay = policy_.retry_delay;
    for (int i = 1; i < attempt && delay < policy_.retry_delay_max; ++i)
    {
        delay *= 2;
    }
    return std::min(delay, policy_.retry_delay_max);
}

RetryDecision RetryManager::decide(const ConversionJob &job, const TranscodeOutcome &outcome) const
{
    RetryDecision decision;
    if (outcome.success)
    {
        decision.action = RetryAction::SUCCEED;
        decision.message = outcome.message;
        return decision;
    }

    decision.kind = outcome.error_kind.value_or(ErrorKind::RETRYABLE);
    decision.message = outcome.message;

    if (outcome.cancelled)
    {
        decision.action = RetryAction::ABANDON;
        return decision;
    }
    if (decision.kind == ErrorKind::FATAL || decision.kind == ErrorKind::STARTUP_FATAL)
    {
        decision.action = RetryAction::FAIL;
        return decision;
    }
    if (job.attempt_count < policy_.max_retries)
    {
        decision.action = RetryAction::RETRY;
        decision.delay = delayFor(job.attempt_count);
        return decision;
    }
    decision.action = RetryAction::FAIL;
    decision.message = "Retries exhausted after " + std::to_string(job.attempt_count) + " attempts: " + outcome.message;
    return decision;
}

void RetryManager::apply(const ConversionJob &job, const RetryDecision &decision)
{
    switch (decision.action)
    {
    case RetryAction::SUCCEED:
    {
        if (!registry_.markSucceeded(job.id))
        {
            return;
        }
        events_.info(COMPONENT, "Job succeeded",
                     {{"job", job.id}, {"source", job.source_path}, {"destination", decision.message},
                      {"attempts", job.attempt_count}});
        if (policy_.delete_original)
        {
            std::error_code ec;
            std::filesystem::remove(job.source_path, ec);
            if (ec)
            {
                events_.warn(COMPONENT, "Could not delete original",
                             {{"job", job.id}, {"source", job.source_path}, {"error", ec.message()}});
            }
            else
            {
                events_.info(COMPONENT, "Original deleted", {{"job", job.id}, {"source", job.source_path}});
            }
        }
        return;
    }
    case RetryAction::FAIL:
        if (registry_.markFailed(job.id, decision.kind, decision.message))
        {
            events_.error(COMPONENT, "Job failed",
                          {{"job", job.id}, {"source", job.source_path}, {"kind", ErrorKinds::toString(decision.kind)},
                           {"attempts", job.attempt_count}, {"error", decision.message}});
        }
        return;
    case RetryAction::ABANDON:
        if (registry_.markAbandoned(job.id, decision.message))
        {
            events_.warn(COMPONENT, "Job abandoned", {{"job", job.id}, {"source", job.source_path}});
        }
        return;
    case RetryAction::RETRY:
        break;
    }

    if (!registry_.markRetryPending(job.id, decision.kind, decision.message))
    {
        return;
    }
    events_.warn(COMPONENT, "Job retry scheduled",
                 {{"job", job.id}, {"source", job.source_path}, {"attempt", job.attempt_count},
                  {"max_retries", policy_.max_retries}, {"delay_ms", decision.delay.count()},
                  {"error", decision.message}});

    if (decision.delay.count() <= 0)
    {
        requeueOrAbandon(job.id);
        return;
    }

    bool scheduled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_)
        {
            pending_.emplace(std::chrono::steady_clock::now() + decision.delay, job.id);
            scheduled = true;
        }
    }
    if (scheduled)
    {
        cv_.notify_all();
    }
    else
    {
        registry_.markAbandoned(job.id, "Shutdown before retry");
    }
}

void RetryManager::requeueOrAbandon(JobId id)
{
    if (!requeue_ || !requeue_(id))
    {
        registry_.markAbandoned(id, "Queue closed before retry");
    }
}

void RetryManager::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_)
    {
        return;
    }
    running_ = true;
    scheduler_ = std::thread(&RetryManager::schedulerLoop, this);
}

void RetryManager::stop()
{
    std::multimap<std::chrono::steady_clock::time_point, JobId> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        dropped.swap(pending_);
    }
    cv_.notify_all();
    if (scheduler_.joinable())
    {
        scheduler_.join();
    }
    for (const auto &[when, id] : dropped)
    {
        registry_.markAbandoned(id, "Shutdown before retry");
    }
}

size_t RetryManager::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void RetryManager::schedulerLoop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_)
    {
        if (pending_.empty())
        {
            cv_.wait(lock);
            continue;
        }
        auto next = pending_.begin()->first;
        if (std::chrono::steady_clock::now() < next)
        {
            cv_.wait_until(lock, next);
            continue;
        }
        JobId id = pending_.begin()->second;
        pending_.erase(pending_.begin());

        lock.unlock();
        requeueOrAbandon(id);
        lock.lock();
    }
}
