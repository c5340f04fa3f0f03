#include "core/conversion_orchestrator.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <thread>

namespace
{
    const char *COMPONENT = "orchestrator";
    constexpr std::chrono::hours LOG_PRUNE_INTERVAL{1};
}

ConversionOrchestrator::ConversionOrchestrator(ServiceConfig config, EventSink &events, ShutdownManager &shutdown,
                                               OrchestratorDependencies deps)
    : config_(std::move(config)), events_(events), shutdown_(shutdown),
      ffmpeg_available_(deps.ffmpeg_available ? deps.ffmpeg_available : &PosixProcessRunner::isExecutableAvailable),
      owned_runner_(deps.runner ? nullptr : std::make_unique<PosixProcessRunner>()),
      runner_(deps.runner ? *deps.runner : *owned_runner_),
      owned_probe_(deps.probe || deps.executor ? nullptr : std::make_unique<LibavStreamProbe>()),
      probe_(deps.probe ? deps.probe : owned_probe_.get()),
      owned_executor_(deps.executor ? nullptr
                                    : std::make_unique<TranscodeExecutor>(executorSettings(config_), runner_, probe_, events)),
      executor_(deps.executor ? *deps.executor : *owned_executor_),
      registry_(static_cast<size_t>(config_.max_workers)),
      lock_(config_.lockfile, config_.lock_stale_after, events),
      detector_(runner_, events, config_.ffmpeg_path, config_.encoder, conversionSettings(config_),
                config_.probe_timeout),
      retry_(retryPolicy(config_), registry_, [this](JobId id)
             { return queue_.push(id); }, events),
      pool_(static_cast<size_t>(config_.max_workers), queue_, registry_, executor_, retry_, [this]()
            { return detector_.detect(); }, events),
      gate_(StabilitySettings{config_.stability_check_interval, config_.stability_check_duration,
                              config_.stability_required_samples},
            config_.stability_check_threads, events),
      watcher_(config_.watch_paths, config_.output_dir, config_.rescan_interval, events)
{
    registry_.setTransitionListener([this](const ConversionJob &job)
                                    { onTransition(job); });
}

ConversionOrchestrator::~ConversionOrchestrator()
{
    shutdown();
}

ConversionSettings ConversionOrchestrator::conversionSettings(const ServiceConfig &config)
{
    ConversionSettings settings;
    settings.codec = config.codec;
    settings.quality = config.quality;
    settings.audio_codec = config.audio_codec;
    settings.audio_bitrate = config.audio_bitrate;
    settings.vaapi_device = config.vaapi_device;
    return settings;
}

ExecutorSettings ConversionOrchestrator::executorSettings(const ServiceConfig &config)
{
    ExecutorSettings settings;
    settings.ffmpeg_path = config.ffmpeg_path;
    settings.container = config.container;
    settings.output_dir = config.output_dir;
    settings.conversion_timeout = config.conversion_timeout;
    settings.preserve_permissions = config.preserve_permissions;
    settings.preserve_timestamps = config.preserve_timestamps;
    return settings;
}

RetryPolicy ConversionOrchestrator::retryPolicy(const ServiceConfig &config)
{
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.retry_delay = config.retry_delay;
    policy.backoff = config.retry_backoff;
    policy.retry_delay_max = config.retry_delay_max;
    policy.delete_original = config.delete_original;
    return policy;
}

ExitCode ConversionOrchestrator::startup()
{
    LockAcquireResult lock_result = lock_.acquire();
    if (lock_result == LockAcquireResult::ALREADY_RUNNING)
    {
        events_.error(COMPONENT, "Another instance holds the lock, exiting",
                      {{"lockfile", config_.lockfile}, {"error", lock_.lastError()},
                       {"kind", ErrorKinds::toString(ErrorKind::STARTUP_FATAL)}});
        return ExitCode::LOCK_HELD;
    }
    if (lock_result == LockAcquireResult::ERROR)
    {
        events_.error(COMPONENT, "Cannot create instance lock, exiting",
                      {{"lockfile", config_.lockfile}, {"error", lock_.lastError()},
                       {"kind", ErrorKinds::toString(ErrorKind::STARTUP_FATAL)}});
        return ExitCode::LOCK_HELD;
    }

    if (!ffmpeg_available_(config_.ffmpeg_path))
    {
        events_.error(COMPONENT, "ffmpeg binary not found",
                      {{"ffmpeg_path", config_.ffmpeg_path}, {"kind", ErrorKinds::toString(ErrorKind::STARTUP_FATAL)}});
        lock_.release();
        return ExitCode::FFMPEG_MISSING;
    }

    if (!config_.state_db.empty())
    {
        DBOpResult opened = ledger_.open(config_.state_db);
        if (!opened.success)
        {
            events_.warn(COMPONENT, "Continuing without conversion ledger", {{"error", opened.error_message}});
        }
    }

    EncoderProfile profile = detector_.detect();
    events_.info(COMPONENT, "Service ready",
                 {{"encoder", profile.name}, {"workers", config_.max_workers},
                  {"watch_paths", config_.watch_paths.size()}});
    started_ = true;
    return ExitCode::CLEAN;
}

bool ConversionOrchestrator::startProcessing()
{
    if (!started_ || processing_)
    {
        return processing_;
    }
    retry_.start();
    pool_.start();
    if (!watcher_.start([this](const DiscoveredFile &file)
                        { onDiscovered(file); }))
    {
        events_.error(COMPONENT, "Directory watcher failed to start");
        return false;
    }
    processing_ = true;
    return true;
}

ExitCode ConversionOrchestrator::run()
{
    ExitCode code = startup();
    if (code != ExitCode::CLEAN)
    {
        return code;
    }
    if (!startProcessing())
    {
        shutdown_.requestShutdown("Processing could not start");
    }

    auto next_prune = std::chrono::steady_clock::now() + LOG_PRUNE_INTERVAL;
    while (!shutdown_.waitForShutdownFor(config_.lock_refresh_interval))
    {
        if (!lock_.refresh())
        {
            events_.warn(COMPONENT, "Lock heartbeat not written", {{"error", lock_.lastError()}});
        }
        if (std::chrono::steady_clock::now() >= next_prune)
        {
            Logger::pruneExpired(config_.log_dir, config_.log_retention_days);
            next_prune = std::chrono::steady_clock::now() + LOG_PRUNE_INTERVAL;
        }
    }

    shutdown();
    return ExitCode::CLEAN;
}

void ConversionOrchestrator::onDiscovered(const DiscoveredFile &file)
{
    if (ledger_.isKnownOutput(file.path))
    {
        events_.debug(COMPONENT, "Skipping conversion output", {{"path", file.path}});
        return;
    }

    auto metadata = FileUtils::getFileMetadata(file.path);
    if (!metadata)
    {
        watcher_.forget(file.path);
        return;
    }

    if (ledger_.isSettled(file.path, metadata->file_size, metadata->modification_time))
    {
        events_.debug(COMPONENT, "Already converted, unchanged", {{"path", file.path}});
        // A later modification must be able to report the path again
        watcher_.forget(file.path);
        return;
    }

    auto id = registry_.create(file.path, file.watch_root, metadata->file_size, metadata->modification_time);
    if (!id)
    {
        auto existing = registry_.findByPath(file.path);
        if (existing && existing->isTerminal())
        {
            watcher_.forget(file.path);
        }
        events_.debug(COMPONENT, "Duplicate discovery ignored", {{"path", file.path}});
        return;
    }

    events_.info(COMPONENT, "File discovered", {{"job", *id}, {"path", file.path}, {"size", metadata->file_size}});
    registry_.markStabilizing(*id);
    JobId job_id = *id;
    gate_.submit(file.path, [this, job_id](const std::string &path, StabilityResult result, uint64_t)
                 { onStable(job_id, path, result); });
}

void ConversionOrchestrator::onStable(JobId id, const std::string &path, StabilityResult result)
{
    switch (result)
    {
    case StabilityResult::STABLE:
        break;
    case StabilityResult::STILL_WRITING:
        registry_.markAbandoned(id, "File still being written");
        return;
    case StabilityResult::VANISHED:
        registry_.markAbandoned(id, "File vanished before it stabilized");
        return;
    case StabilityResult::CANCELLED:
        registry_.markAbandoned(id, "Shutdown during stability check");
        return;
    }

    auto job = registry_.get(id);
    auto metadata = FileUtils::getFileMetadata(path);
    if (!job || !metadata)
    {
        registry_.markAbandoned(id, "File vanished before it was queued");
        return;
    }
    registry_.updateSourceMetadata(id, metadata->file_size, metadata->modification_time);

    std::string destination = TranscodeExecutor::destinationFor(path, job->watch_root, config_.output_dir,
                                                                config_.container);
    // The converted file may land in a watched directory
    watcher_.ignore(destination);

    if (!registry_.markQueued(id, destination))
    {
        return;
    }
    if (!queue_.push(id))
    {
        registry_.markAbandoned(id, "Queue closed");
        return;
    }
    events_.info(COMPONENT, "File queued",
                 {{"job", id}, {"path", path}, {"destination", destination}, {"queue_size", queue_.size()}});
}

void ConversionOrchestrator::onTransition(const ConversionJob &job)
{
    switch (job.status)
    {
    case JobStatus::SUCCEEDED:
    case JobStatus::FAILED:
    {
        if (ledger_.isOpen())
        {
            DBOpResult stored = ledger_.record(job);
            if (!stored.success)
            {
                events_.warn(COMPONENT, "Could not record outcome", {{"job", job.id}, {"error", stored.error_message}});
            }
        }
        // Rediscovery is filtered by the registry, which skips unchanged files
        watcher_.forget(job.source_path);
        break;
    }
    case JobStatus::ABANDONED:
        events_.debug(COMPONENT, "Job abandoned", {{"job", job.id}, {"path", job.source_path}, {"reason", job.last_error_message}});
        watcher_.forget(job.source_path);
        break;
    default:
        break;
    }
}

bool ConversionOrchestrator::waitUntilIdle(std::chrono::milliseconds timeout) const
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (registry_.activeCount() == 0 && queue_.size() == 0)
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return registry_.activeCount() == 0 && queue_.size() == 0;
}

void ConversionOrchestrator::shutdown()
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;
    if (!started_)
    {
        return;
    }

    events_.info(COMPONENT, "Shutting down", {{"running", registry_.runningCount()}, {"queued", queue_.size()}});

    watcher_.stop();
    gate_.cancel();
    gate_.wait();
    retry_.stop();

    for (JobId id : queue_.close())
    {
        registry_.markAbandoned(id, "Shutdown before start");
    }

    if (!pool_.awaitIdle(config_.shutdown_grace_period))
    {
        events_.warn(COMPONENT, "Grace period elapsed, terminating running conversions",
                     {{"running", registry_.runningCount()}});
        pool_.cancelRunning();
    }
    pool_.join();

    ledger_.close();
    lock_.release();

    events_.info(COMPONENT, "Shutdown complete",
                 {{"succeeded", registry_.countWithStatus(JobStatus::SUCCEEDED)},
                  {"failed", registry_.countWithStatus(JobStatus::FAILED)},
                  {"abandoned", registry_.countWithStatus(JobStatus::ABANDONED)}});
}
