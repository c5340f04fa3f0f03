#include "core/job_queue.hpp"

bool JobQueue::push(JobId id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
        {
            return false;
        }
        queue_.push_back(id);
    }
    queue_cv_.notify_one();
    return true;
}

std::optional<JobId> JobQueue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    queue_cv_.wait(lock, [this]
                   { return closed_ || !queue_.empty(); });
    if (closed_)
    {
        return std::nullopt;
    }
    JobId id = queue_.front();
    queue_.pop_front();
    return id;
}

std::optional<JobId> JobQueue::popFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!queue_cv_.wait_for(lock, timeout, [this]
                            { return closed_ || !queue_.empty(); }))
    {
        return std::nullopt;
    }
    if (closed_)
    {
        return std::nullopt;
    }
    JobId id = queue_.front();
    queue_.pop_front();
    return id;
}

std::deque<JobId> JobQueue::close()
{
    std::deque<JobId> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        remaining.swap(queue_);
    }
    queue_cv_.notify_all();
    return remaining;
}

bool JobQueue::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t JobQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
