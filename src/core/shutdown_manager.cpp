#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <csignal>
#include <unistd.h>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action
    {
    };
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGQUIT, &action, nullptr);

    // ffmpeg children write to pipes we may close early
    signal(SIGPIPE, SIG_IGN);

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        for (;;)
        {
            if (!watcher_running_.load())
            {
                break;
            }

            if (signal_flag_)
            {
                // Capture and clear asap
                int sig = signal_num_;
                signal_flag_ = 0;
                last_signal_.store(sig);
                requestShutdown("Signal received", sig);
            }

            if (shutdown_requested_.load())
            {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    watcher_running_.store(false);

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdownFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);
    watcher_running_.store(false);

    signal_flag_ = 0;
    signal_num_ = 0;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
    }
}
