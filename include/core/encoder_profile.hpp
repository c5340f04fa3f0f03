#pragma once

#include <string>
#include <vector>

/**
 * @brief How one transcoding backend is detected and driven.
 *
 * Profiles are built once for the configured codec family and quality and
 * are read-only afterwards; workers share them by const reference.
 */
struct EncoderProfile
{
    std::string name;         // nvenc, qsv, vaapi or software
    int tier = 0;             // probe order, 1 is tried first; software is last
    std::string ffmpeg_encoder; // encoder name as listed by "ffmpeg -encoders"

    // Commands that must all succeed (and match probe_marker) for the tier to be usable
    std::vector<std::vector<std::string>> probe_commands;
    std::vector<std::string> probe_markers; // any one must appear in the probe output

    std::vector<std::string> input_args;  // placed before -i
    std::vector<std::string> video_filter; // e.g. {"-vf", "format=nv12,hwupload"}
    std::vector<std::string> video_args;
    std::vector<std::string> audio_args;

    bool isHardware() const { return name != "software"; }
};

struct ConversionSettings
{
    std::string codec = "hevc";
    int quality = 23;
    std::string audio_codec = "aac";
    std::string audio_bitrate = "192k";
    std::string vaapi_device = "/dev/dri/renderD128";
};

namespace EncoderProfiles
{
    const std::vector<std::string> &knownNames();

    EncoderProfile nvenc(const ConversionSettings &settings);
    EncoderProfile qsv(const ConversionSettings &settings);
    EncoderProfile vaapi(const ConversionSettings &settings);
    EncoderProfile software(const ConversionSettings &settings);

    // Hardware tiers in probe order
    std::vector<EncoderProfile> hardwareTiers(const ConversionSettings &settings);

    /**
     * @brief Build a profile by name
     * @return false if the name is unknown
     */
    bool byName(const std::string &name, const ConversionSettings &settings, EncoderProfile &out);
}
