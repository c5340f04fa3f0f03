#include "core/job_registry.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <initializer_list>

JobRegistry::JobRegistry(size_t max_running)
    : max_running_(max_running)
{
}

std::optional<JobId> JobRegistry::create(const std::string &source_path, const std::string &watch_root,
                                         uint64_t size, std::time_t mtime)
{
    ConversionJob created;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto existing = latest_by_path_.find(source_path);
        if (existing != latest_by_path_.end())
        {
            const ConversionJob &previous = jobs_.at(existing->second);
            if (!previous.isTerminal())
            {
                return std::nullopt;
            }
            // A finished conversion of the very same file is not repeated
            if ((previous.status == JobStatus::SUCCEEDED || previous.status == JobStatus::FAILED) &&
                previous.source_size == size && previous.source_mtime == mtime)
            {
                return std::nullopt;
            }
        }

        auto now = std::chrono::system_clock::now();
        created.id = next_id_++;
        created.source_path = source_path;
        created.watch_root = watch_root;
        created.status = JobStatus::PENDING;
        created.created_at = now;
        created.updated_at = now;
        created.source_size = size;
        created.source_mtime = mtime;

        jobs_[created.id] = created;
        latest_by_path_[source_path] = created.id;
    }
    notify(created);
    return created.id;
}

bool JobRegistry::markStabilizing(JobId id)
{
    return transition(id, {JobStatus::PENDING}, JobStatus::STABILIZING);
}

bool JobRegistry::markQueued(JobId id, const std::string &destination_path)
{
    return transition(id, {JobStatus::STABILIZING}, JobStatus::QUEUED,
                      [&destination_path](ConversionJob &job)
                      { job.destination_path = destination_path; });
}

std::optional<ConversionJob> JobRegistry::markRunning(JobId id)
{
    ConversionJob snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.status != JobStatus::QUEUED)
        {
            return std::nullopt;
        }
        if (running_ >= max_running_)
        {
            Logger::error("Refusing to start job " + std::to_string(id) + ": " +
                          std::to_string(running_) + " jobs already running");
            return std::nullopt;
        }
        ConversionJob &job = it->second;
        job.status = JobStatus::RUNNING;
        job.attempt_count++;
        job.updated_at = std::chrono::system_clock::now();
        running_++;
        peak_running_ = std::max(peak_running_, running_);
        snapshot = job;
    }
    notify(snapshot);
    return snapshot;
}

bool JobRegistry::markSucceeded(JobId id)
{
    return transition(id, {JobStatus::RUNNING}, JobStatus::SUCCEEDED,
                      [](ConversionJob &job)
                      {
                          job.last_error_kind.reset();
                          job.last_error_message.clear();
                      });
}

bool JobRegistry::markFailed(JobId id, ErrorKind kind, const std::string &message)
{
    return transition(id, {JobStatus::RUNNING}, JobStatus::FAILED,
                      [kind, &message](ConversionJob &job)
                      {
                          job.last_error_kind = kind;
                          job.last_error_message = message;
                      });
}

bool JobRegistry::markRetryPending(JobId id, ErrorKind kind, const std::string &message)
{
    return transition(id, {JobStatus::RUNNING}, JobStatus::QUEUED,
                      [kind, &message](ConversionJob &job)
                      {
                          job.last_error_kind = kind;
                          job.last_error_message = message;
                      });
}

bool JobRegistry::markAbandoned(JobId id, const std::string &reason)
{
    return transition(id,
                      {JobStatus::PENDING, JobStatus::STABILIZING, JobStatus::QUEUED, JobStatus::RUNNING},
                      JobStatus::ABANDONED,
                      [&reason](ConversionJob &job)
                      { job.last_error_message = reason; });
}

void JobRegistry::updateSourceMetadata(JobId id, uint64_t size, std::time_t mtime)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end())
    {
        it->second.source_size = size;
        it->second.source_mtime = mtime;
    }
}

bool JobRegistry::transition(JobId id, std::initializer_list<JobStatus> allowed_from, JobStatus to,
                             const std::function<void(ConversionJob &)> &mutate)
{
    ConversionJob snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end())
        {
            return false;
        }
        ConversionJob &job = it->second;
        if (std::find(allowed_from.begin(), allowed_from.end(), job.status) == allowed_from.end())
        {
            Logger::warn("Job " + std::to_string(id) + ": illegal transition " +
                         JobStatuses::toString(job.status) + " -> " + JobStatuses::toString(to));
            return false;
        }
        if (job.status == JobStatus::RUNNING)
        {
            running_--;
        }
        job.status = to;
        job.updated_at = std::chrono::system_clock::now();
        if (mutate)
        {
            mutate(job);
        }
        snapshot = job;
    }
    notify(snapshot);
    return true;
}

void JobRegistry::notify(const ConversionJob &job)
{
    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener)
    {
        listener(job);
    }
}

std::optional<ConversionJob> JobRegistry::get(JobId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ConversionJob> JobRegistry::findByPath(const std::string &source_path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_by_path_.find(source_path);
    if (it == latest_by_path_.end())
    {
        return std::nullopt;
    }
    return jobs_.at(it->second);
}

size_t JobRegistry::runningCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t JobRegistry::peakRunningCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_running_;
}

size_t JobRegistry::countWithStatus(JobStatus status) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(),
                                             [status](const auto &entry)
                                             { return entry.second.status == status; }));
}

size_t JobRegistry::activeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(),
                                             [](const auto &entry)
                                             { return !entry.second.isTerminal(); }));
}

void JobRegistry::setTransitionListener(TransitionListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}
