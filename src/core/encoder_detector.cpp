#include "core/encoder_detector.hpp"
#include <sstream>

namespace
{
    const char *COMPONENT = "encoder";
}

EncoderDetector::EncoderDetector(ProcessRunner &runner, EventSink &events, std::string ffmpeg_path,
                                 std::string encoder_override, ConversionSettings settings,
                                 std::chrono::milliseconds probe_timeout)
    : runner_(runner), events_(events), ffmpeg_path_(std::move(ffmpeg_path)),
      encoder_override_(std::move(encoder_override)), settings_(std::move(settings)),
      probe_timeout_(probe_timeout)
{
}

std::optional<EncoderProfile> EncoderDetector::cached() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_;
}

EncoderProfile EncoderDetector::detect(bool force)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_ && !force)
    {
        return *cached_;
    }

    EncoderProfile selected;
    if (!encoder_override_.empty() && encoder_override_ != "auto")
    {
        if (EncoderProfiles::byName(encoder_override_, settings_, selected))
        {
            events_.info(COMPONENT, "Encoder selected",
                         {{"encoder", selected.name}, {"codec", selected.ffmpeg_encoder}, {"source", "config"}});
            cached_ = selected;
            return selected;
        }
        events_.warn(COMPONENT, "Unknown encoder override, probing instead", {{"encoder", encoder_override_}});
    }

    auto ffmpeg_encoders = listFfmpegEncoders();
    bool found = false;
    for (const auto &tier : EncoderProfiles::hardwareTiers(settings_))
    {
        std::string reason;
        bool usable = probeTier(tier, ffmpeg_encoders, reason);
        events_.info(COMPONENT, "Encoder probe",
                     {{"tier", tier.tier}, {"encoder", tier.name}, {"usable", usable}, {"reason", reason}});
        if (usable)
        {
            selected = tier;
            found = true;
            break;
        }
    }

    if (!found)
    {
        selected = EncoderProfiles::software(settings_);
    }
    events_.info(COMPONENT, "Encoder selected",
                 {{"encoder", selected.name}, {"codec", selected.ffmpeg_encoder}, {"source", "probe"}});
    cached_ = selected;
    return selected;
}

std::set<std::string> EncoderDetector::listFfmpegEncoders()
{
    std::set<std::string> encoders;
    ProcessResult result = runner_.run({ffmpeg_path_, "-hide_banner", "-encoders"}, probe_timeout_);
    if (!result.succeeded())
    {
        events_.warn(COMPONENT, "Could not list ffmpeg encoders",
                     {{"exit_code", result.exit_code}, {"error", result.error_message}});
        return encoders;
    }

    // Lines look like " V....D hevc_nvenc   NVIDIA NVENC hevc encoder"
    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line))
    {
        std::istringstream words(line);
        std::string flags;
        std::string name;
        if (words >> flags >> name)
        {
            encoders.insert(name);
        }
    }
    return encoders;
}

bool EncoderDetector::probeTier(const EncoderProfile &profile, const std::set<std::string> &ffmpeg_encoders,
                                std::string &reason)
{
    for (const auto &command : profile.probe_commands)
    {
        ProcessResult result = runner_.run(command, probe_timeout_);
        if (result.spawn_failed)
        {
            reason = command.front() + " not available";
            return false;
        }
        if (result.timed_out)
        {
            reason = command.front() + " timed out";
            return false;
        }
        if (result.exit_code != 0)
        {
            reason = command.front() + " exited with " + std::to_string(result.exit_code);
            return false;
        }
        if (!profile.probe_markers.empty())
        {
            bool matched = false;
            for (const auto &marker : profile.probe_markers)
            {
                if (result.output.find(marker) != std::string::npos)
                {
                    matched = true;
                    break;
                }
            }
            if (!matched)
            {
                reason = command.front() + " reported no suitable device";
                return false;
            }
        }
    }

    if (ffmpeg_encoders.count(profile.ffmpeg_encoder) == 0)
    {
        reason = "ffmpeg lacks " + profile.ffmpeg_encoder;
        return false;
    }
    reason = "ok";
    return true;
}
