#pragma once

#include "core/directory_watcher.hpp"
#include "core/encoder_detector.hpp"
#include "core/instance_lock.hpp"
#include "core/job_queue.hpp"
#include "core/job_registry.hpp"
#include "core/process_runner.hpp"
#include "core/retry_manager.hpp"
#include "core/service_config.hpp"
#include "core/shutdown_manager.hpp"
#include "core/stability_gate.hpp"
#include "core/stream_probe.hpp"
#include "core/transcode_executor.hpp"
#include "core/worker_pool.hpp"
#include "database/conversion_ledger.hpp"
#include "logging/event_sink.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

/**
 * @brief Process exit codes of the daemon
 */
enum class ExitCode : int
{
    CLEAN = 0,
    LOCK_HELD = 1,
    CONFIG_ERROR = 2,
    FFMPEG_MISSING = 3
};

/**
 * @brief Replacements for the real collaborators, used by tests.
 *
 * Null members fall back to the production implementations.
 */
struct OrchestratorDependencies
{
    ProcessRunner *runner = nullptr;
    StreamProbe *probe = nullptr;
    JobExecutor *executor = nullptr;
    std::function<bool(const std::string &)> ffmpeg_available;
};

/**
 * @brief Owns and wires every component of the conversion service.
 *
 * Constructed once in main. Nothing here is global: each component
 * receives references to the ones it needs. Lifecycle:
 * startup() acquires the lock, checks ffmpeg, opens the ledger and
 * detects the encoder; startProcessing() starts the retry scheduler,
 * workers and watcher; shutdown() stops them in reverse order.
 *
 * Error Handling Policy:
 * - Startup failures are returned as ExitCode values before any job runs.
 * - Job errors are recorded on the job and logged, never thrown.
 * - Path problems are logged by the watcher and do not stop other paths.
 */
class ConversionOrchestrator
{
public:
    ConversionOrchestrator(ServiceConfig config, EventSink &events, ShutdownManager &shutdown,
                           OrchestratorDependencies deps = {});
    ~ConversionOrchestrator();

    ConversionOrchestrator(const ConversionOrchestrator &) = delete;
    ConversionOrchestrator &operator=(const ConversionOrchestrator &) = delete;

    /**
     * @brief Acquire the lock and prepare the engine
     * @return ExitCode::CLEAN when processing may start
     */
    ExitCode startup();

    // Start workers, retry scheduler and watcher; startup() must have succeeded
    bool startProcessing();

    /**
     * @brief startup(), startProcessing(), lock heartbeat until shutdown is requested, shutdown()
     */
    ExitCode run();

    // Graceful stop; safe to call more than once
    void shutdown();

    /**
     * @brief Wait until no job is pending, stabilizing, queued or running
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    const ServiceConfig &config() const { return config_; }
    JobRegistry &registry() { return registry_; }
    JobQueue &queue() { return queue_; }
    DirectoryWatcher &watcher() { return watcher_; }
    InstanceLock &lock() { return lock_; }
    EncoderDetector &detector() { return detector_; }
    ConversionLedger &ledger() { return ledger_; }

private:
    void onDiscovered(const DiscoveredFile &file);
    void onStable(JobId id, const std::string &path, StabilityResult result);
    void onTransition(const ConversionJob &job);

    static ConversionSettings conversionSettings(const ServiceConfig &config);
    static ExecutorSettings executorSettings(const ServiceConfig &config);
    static RetryPolicy retryPolicy(const ServiceConfig &config);

    const ServiceConfig config_;
    EventSink &events_;
    ShutdownManager &shutdown_;
    std::function<bool(const std::string &)> ffmpeg_available_;

    std::unique_ptr<ProcessRunner> owned_runner_;
    ProcessRunner &runner_;
    std::unique_ptr<StreamProbe> owned_probe_;
    StreamProbe *probe_;
    std::unique_ptr<JobExecutor> owned_executor_;
    JobExecutor &executor_;

    JobRegistry registry_;
    JobQueue queue_;
    ConversionLedger ledger_;
    InstanceLock lock_;
    EncoderDetector detector_;
    RetryManager retry_;
    WorkerPool pool_;
    StabilityGate gate_;
    DirectoryWatcher watcher_;

    bool started_{false};
    bool processing_{false};
    bool stopped_{false};
};
