#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Stop request shared by the watcher, gate, workers and heartbeat loop.
 * One instance is created in main and handed to the orchestrator; SIGINT,
 * SIGTERM and SIGQUIT are funnelled into it once installSignalHandlers()
 * has run.
 */
class ShutdownManager
{
public:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Registers the handlers and starts the flag polling thread
    void installSignalHandlers();

    // First caller wins; later reasons are ignored. Not for use inside a signal handler.
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    // Heartbeat and retry loops sleep here; true once a stop was requested
    bool waitForShutdownFor(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Tests only
    void reset() noexcept;

    // Only stores into the sig_atomic_t flags below
    static void handleSignal(int sig) noexcept;

private:
    // Polls the signal flags and calls requestShutdown() outside signal context
    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    // Process-wide, written from handleSignal()
    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
