#include "core/worker_pool.hpp"

namespace
{
    const char *COMPONENT = "worker";
}

WorkerPool::WorkerPool(size_t workers, JobQueue &queue, JobRegistry &registry, JobExecutor &executor,
                       RetryManager &retry, ProfileProvider profile, EventSink &events)
    : worker_count_(workers), queue_(queue), registry_(registry), executor_(executor), retry_(retry),
      profile_(std::move(profile)), events_(events)
{
}

WorkerPool::~WorkerPool()
{
    if (!threads_.empty())
    {
        cancelRunning();
        queue_.close();
        join();
    }
}

void WorkerPool::start()
{
    if (!threads_.empty())
    {
        return;
    }
    threads_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i)
    {
        threads_.emplace_back(&WorkerPool::workerLoop, this, i);
    }
    events_.info(COMPONENT, "Worker pool started", {{"workers", worker_count_}});
}

void WorkerPool::workerLoop(size_t index)
{
    while (auto id = queue_.pop())
    {
        {
            std::lock_guard<std::mutex> lock(busy_mutex_);
            busy_++;
        }
        runJob(*id);
        {
            std::lock_guard<std::mutex> lock(busy_mutex_);
            busy_--;
        }
        busy_cv_.notify_all();
    }
    events_.debug(COMPONENT, "Worker exiting", {{"worker", index}});
}

void WorkerPool::runJob(JobId id)
{
    auto job = registry_.markRunning(id);
    if (!job)
    {
        // Abandoned while waiting in the queue, or no longer runnable
        return;
    }

    TranscodeOutcome outcome;
    try
    {
        outcome = executor_.execute(*job, profile_(), &cancel_);
    }
    catch (const std::exception &e)
    {
        outcome.success = false;
        outcome.error_kind = ErrorKind::RETRYABLE;
        outcome.message = std::string("Executor error: ") + e.what();
    }
    if (cancel_.load() && !outcome.success)
    {
        outcome.cancelled = true;
    }

    RetryDecision decision = retry_.decide(*job, outcome);
    retry_.apply(*job, decision);
}

bool WorkerPool::awaitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(busy_mutex_);
    return busy_cv_.wait_for(lock, timeout, [this]
                             { return busy_ == 0; });
}

void WorkerPool::cancelRunning()
{
    cancel_.store(true);
}

void WorkerPool::join()
{
    for (auto &thread : threads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
    threads_.clear();
}
