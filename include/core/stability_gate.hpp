#pragma once

#include "logging/event_sink.hpp"
#include <tbb/task_arena.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

enum class StabilityResult
{
    STABLE,
    STILL_WRITING,
    VANISHED,
    CANCELLED
};

struct StabilitySettings
{
    std::chrono::milliseconds interval{std::chrono::seconds(2)};
    std::chrono::milliseconds duration{std::chrono::seconds(5)};
    int required_samples = 2;
};

/**
 * @brief Decides whether a file has stopped growing.
 *
 * The size is sampled every interval until required_samples consecutive
 * samples agree on the same non-zero size, or until duration elapses.
 * Checks submitted with submit() are enqueued into a dedicated TBB arena
 * so a slow writer never holds up discovery.
 */
class StabilityGate
{
public:
    using SizeProbe = std::function<std::optional<uint64_t>(const std::string &)>;
    using Completion = std::function<void(const std::string &path, StabilityResult result, uint64_t size)>;

    StabilityGate(StabilitySettings settings, int threads, EventSink &events, SizeProbe probe = nullptr);
    ~StabilityGate();

    StabilityGate(const StabilityGate &) = delete;
    StabilityGate &operator=(const StabilityGate &) = delete;

    /**
     * @brief Run a check on the calling thread
     * @param final_size Receives the last sampled size when not null
     */
    StabilityResult awaitStable(const std::string &path, uint64_t *final_size = nullptr);

    // Run a check in the gate's arena and report the outcome to done
    void submit(const std::string &path, Completion done);

    // Interrupt every pending and future check with CANCELLED
    void cancel();

    // Block until every submitted check has completed
    void wait();

    size_t inFlight() const { return in_flight_.load(); }

    static std::string toString(StabilityResult result);

private:
    bool sleepFor(std::chrono::milliseconds duration);

    const StabilitySettings settings_;
    EventSink &events_;
    SizeProbe probe_;

    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> in_flight_{0};
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
    std::mutex done_mutex_;
    std::condition_variable done_cv_;

    tbb::task_arena arena_;
};
