#pragma once

extern "C"
{
#include <libavformat/avformat.h>
}

// RAII wrapper for FFmpeg AVFormatContext opened with avformat_open_input
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};
