#pragma once

#include "core/encoder_profile.hpp"
#include "core/process_runner.hpp"
#include "logging/event_sink.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>

/**
 * @brief Picks the best usable encoder backend and caches the choice.
 *
 * Hardware tiers are probed in order (NVENC, Quick Sync, VA-API). A tier
 * is usable when its probe commands succeed with the expected output and
 * the ffmpeg build lists the tier's encoder. When nothing qualifies the
 * software profile is returned, so detection never fails.
 */
class EncoderDetector
{
public:
    EncoderDetector(ProcessRunner &runner, EventSink &events, std::string ffmpeg_path,
                    std::string encoder_override, ConversionSettings settings,
                    std::chrono::milliseconds probe_timeout);

    /**
     * @brief Return the selected profile, probing on first use
     * @param force Probe again even when a profile is cached
     */
    EncoderProfile detect(bool force = false);

    std::optional<EncoderProfile> cached() const;

private:
    std::set<std::string> listFfmpegEncoders();
    bool probeTier(const EncoderProfile &profile, const std::set<std::string> &ffmpeg_encoders,
                   std::string &reason);

    ProcessRunner &runner_;
    EventSink &events_;
    const std::string ffmpeg_path_;
    const std::string encoder_override_;
    const ConversionSettings settings_;
    const std::chrono::milliseconds probe_timeout_;

    mutable std::mutex mutex_;
    std::optional<EncoderProfile> cached_;
};
