#include "core/stream_probe.hpp"
#include "core/external_library_wrappers.hpp"
#include <cerrno>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace
{
    std::string avError(int code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(code, err_buf, AV_ERROR_MAX_STRING_SIZE);
        return std::string(err_buf);
    }

    std::string mediaTypeName(AVMediaType type)
    {
        switch (type)
        {
        case AVMEDIA_TYPE_VIDEO:
            return "video";
        case AVMEDIA_TYPE_AUDIO:
            return "audio";
        case AVMEDIA_TYPE_SUBTITLE:
            return "subtitle";
        case AVMEDIA_TYPE_DATA:
            return "data";
        case AVMEDIA_TYPE_ATTACHMENT:
            return "attachment";
        default:
            return "unknown";
        }
    }
}

std::optional<int> ProbeReport::primaryVideoIndex() const
{
    for (const auto &stream : streams)
    {
        if (stream.type == "video" && !stream.attached_picture)
        {
            return stream.index;
        }
    }
    return std::nullopt;
}

bool ProbeReport::isTransientFailure() const
{
    if (readable)
    {
        return false;
    }
    return error_code == AVERROR(EIO) || error_code == AVERROR(EAGAIN) ||
           error_code == AVERROR(EBUSY) || error_code == AVERROR(ENOMEM);
}

LibavStreamProbe::LibavStreamProbe()
{
    // Probe failures are reported through ProbeReport; keep libav quiet
    av_log_set_level(AV_LOG_ERROR);
}

ProbeReport LibavStreamProbe::probe(const std::string &path)
{
    ProbeReport report;
    AVFormatContextRAII format_ctx;

    int open_result = avformat_open_input(format_ctx.address(), path.c_str(), nullptr, nullptr);
    if (open_result < 0)
    {
        report.error = "Could not open input (possibly corrupted or unsupported format): " + avError(open_result);
        report.error_code = open_result;
        return report;
    }

    int info_result = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (info_result < 0)
    {
        report.error = "Could not find stream information (file may be corrupted): " + avError(info_result);
        report.error_code = info_result;
        return report;
    }

    AVFormatContext *ctx = format_ctx.get();
    if (ctx->duration > 0)
    {
        report.duration_seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;
    }
    for (unsigned int i = 0; i < ctx->nb_streams; i++)
    {
        const AVStream *stream = ctx->streams[i];
        StreamInfo info;
        info.index = static_cast<int>(i);
        info.type = mediaTypeName(stream->codecpar->codec_type);
        info.codec = avcodec_get_name(stream->codecpar->codec_id);
        info.attached_picture = (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0;
        report.streams.push_back(info);
    }
    report.readable = true;
    return report;
}
