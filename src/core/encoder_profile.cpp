#include "core/encoder_profile.hpp"

namespace
{
    bool isH264(const ConversionSettings &settings)
    {
        return settings.codec == "h264";
    }

    std::vector<std::string> audioArgs(const ConversionSettings &settings)
    {
        std::vector<std::string> args{"-c:a", settings.audio_codec};
        if (settings.audio_codec != "copy" && !settings.audio_bitrate.empty())
        {
            args.push_back("-b:a");
            args.push_back(settings.audio_bitrate);
        }
        return args;
    }
}

namespace EncoderProfiles
{
    const std::vector<std::string> &knownNames()
    {
        static const std::vector<std::string> names{"nvenc", "qsv", "vaapi", "software"};
        return names;
    }

    EncoderProfile nvenc(const ConversionSettings &settings)
    {
        EncoderProfile profile;
        profile.name = "nvenc";
        profile.tier = 1;
        profile.ffmpeg_encoder = isH264(settings) ? "h264_nvenc" : "hevc_nvenc";
        profile.probe_commands = {{"nvidia-smi", "-L"}};
        profile.probe_markers = {"GPU "};
        profile.input_args = {"-hwaccel", "cuda"};
        profile.video_args = {"-c:v", profile.ffmpeg_encoder, "-preset", "p5", "-rc", "vbr",
                              "-cq", std::to_string(settings.quality), "-b:v", "0"};
        profile.audio_args = audioArgs(settings);
        return profile;
    }

    EncoderProfile qsv(const ConversionSettings &settings)
    {
        EncoderProfile profile;
        profile.name = "qsv";
        profile.tier = 2;
        profile.ffmpeg_encoder = isH264(settings) ? "h264_qsv" : "hevc_qsv";
        profile.probe_commands = {{"vainfo"}};
        profile.probe_markers = {"iHD", "i965", "Intel"};
        profile.input_args = {"-hwaccel", "qsv"};
        profile.video_args = {"-c:v", profile.ffmpeg_encoder, "-preset", "medium",
                              "-global_quality", std::to_string(settings.quality)};
        profile.audio_args = audioArgs(settings);
        return profile;
    }

    EncoderProfile vaapi(const ConversionSettings &settings)
    {
        EncoderProfile profile;
        profile.name = "vaapi";
        profile.tier = 3;
        profile.ffmpeg_encoder = isH264(settings) ? "h264_vaapi" : "hevc_vaapi";
        profile.probe_commands = {{"vainfo", "--display", "drm", "--device", settings.vaapi_device}};
        profile.probe_markers = {"VAEntrypointEncSlice"};
        profile.input_args = {"-vaapi_device", settings.vaapi_device};
        profile.video_filter = {"-vf", "format=nv12,hwupload"};
        profile.video_args = {"-c:v", profile.ffmpeg_encoder, "-qp", std::to_string(settings.quality)};
        profile.audio_args = audioArgs(settings);
        return profile;
    }

    EncoderProfile software(const ConversionSettings &settings)
    {
        EncoderProfile profile;
        profile.name = "software";
        profile.tier = 4;
        profile.ffmpeg_encoder = isH264(settings) ? "libx264" : "libx265";
        profile.video_args = {"-c:v", profile.ffmpeg_encoder, "-preset", "medium",
                              "-crf", std::to_string(settings.quality)};
        profile.audio_args = audioArgs(settings);
        return profile;
    }

    std::vector<EncoderProfile> hardwareTiers(const ConversionSettings &settings)
    {
        return {nvenc(settings), qsv(settings), vaapi(settings)};
    }

    bool byName(const std::string &name, const ConversionSettings &settings, EncoderProfile &out)
    {
        if (name == "nvenc")
            out = nvenc(settings);
        else if (name == "qsv")
            out = qsv(settings);
        else if (name == "vaapi")
            out = vaapi(settings);
        else if (name == "software")
            out = software(settings);
        else
            return false;
        return true;
    }
}
