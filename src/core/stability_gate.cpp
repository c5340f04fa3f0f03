#include "core/stability_gate.hpp"
#include "core/file_utils.hpp"
#include <algorithm>

namespace
{
    const char *COMPONENT = "stability";
}

StabilityGate::StabilityGate(StabilitySettings settings, int threads, EventSink &events, SizeProbe probe)
    : settings_(settings), events_(events), probe_(std::move(probe)),
      arena_(std::max(1, threads), 0)
{
    if (!probe_)
    {
        probe_ = [](const std::string &path) -> std::optional<uint64_t>
        {
            auto metadata = FileUtils::getFileMetadata(path);
            if (!metadata)
            {
                return std::nullopt;
            }
            return metadata->file_size;
        };
    }
}

StabilityGate::~StabilityGate()
{
    cancel();
    wait();
}

StabilityResult StabilityGate::awaitStable(const std::string &path, uint64_t *final_size)
{
    const auto deadline = std::chrono::steady_clock::now() + settings_.duration;
    const int required = std::max(1, settings_.required_samples);

    auto sample = probe_(path);
    if (!sample)
    {
        return StabilityResult::VANISHED;
    }
    uint64_t last = *sample;
    int matching = last > 0 ? 1 : 0;
    if (final_size)
    {
        *final_size = last;
    }

    for (;;)
    {
        if (matching >= required)
        {
            return StabilityResult::STABLE;
        }
        if (cancelled_.load())
        {
            return StabilityResult::CANCELLED;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return StabilityResult::STILL_WRITING;
        }
        if (!sleepFor(settings_.interval))
        {
            return StabilityResult::CANCELLED;
        }

        sample = probe_(path);
        if (!sample)
        {
            return StabilityResult::VANISHED;
        }
        if (*sample == last && *sample > 0)
        {
            matching++;
        }
        else
        {
            last = *sample;
            matching = last > 0 ? 1 : 0;
        }
        if (final_size)
        {
            *final_size = last;
        }
    }
}

void StabilityGate::submit(const std::string &path, Completion done)
{
    in_flight_++;
    arena_.enqueue([this, path, done = std::move(done)]()
                   {
        uint64_t size = 0;
        StabilityResult result = awaitStable(path, &size);
        switch (result)
        {
        case StabilityResult::STABLE:
            events_.debug(COMPONENT, "File stable", {{"path", path}, {"size", size}});
            break;
        case StabilityResult::STILL_WRITING:
            events_.warn(COMPONENT, "File dropped, still being written",
                         {{"path", path}, {"size", size}});
            break;
        case StabilityResult::VANISHED:
            events_.debug(COMPONENT, "File vanished during stability check", {{"path", path}});
            break;
        case StabilityResult::CANCELLED:
            events_.debug(COMPONENT, "Stability check cancelled", {{"path", path}});
            break;
        }
        if (done)
        {
            try
            {
                done(path, result, size);
            }
            catch (const std::exception &e)
            {
                events_.error(COMPONENT, "Stability completion failed", {{"path", path}, {"error", e.what()}});
            }
        }
        std::lock_guard<std::mutex> lock(done_mutex_);
        in_flight_--;
        done_cv_.notify_all(); });
}

void StabilityGate::cancel()
{
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        cancelled_.store(true);
    }
    sleep_cv_.notify_all();
}

void StabilityGate::wait()
{
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this]
                  { return in_flight_.load() == 0; });
}

bool StabilityGate::sleepFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    return !sleep_cv_.wait_for(lock, duration, [this]
                               { return cancelled_.load(); });
}

std::string StabilityGate::toString(StabilityResult result)
{
    switch (result)
    {
    case StabilityResult::STABLE:
        return "STABLE";
    case StabilityResult::STILL_WRITING:
        return "STILL_WRITING";
    case StabilityResult::VANISHED:
        return "VANISHED";
    case StabilityResult::CANCELLED:
        return "CANCELLED";
    }
    return "UNKNOWN";
}
