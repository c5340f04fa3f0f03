#pragma once

#include "core/conversion_job.hpp"
#include "core/encoder_profile.hpp"
#include "core/process_runner.hpp"
#include "core/stream_probe.hpp"
#include "logging/event_sink.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Result of one conversion attempt
 */
struct TranscodeOutcome
{
    bool success = false;
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string output; // tail of ffmpeg's combined output
    std::optional<ErrorKind> error_kind;
    std::string message;
};

struct ExecutorSettings
{
    std::string ffmpeg_path = "ffmpeg";
    std::string container = "mkv";
    std::string output_dir;
    std::chrono::milliseconds conversion_timeout{std::chrono::hours(1)};
    bool preserve_permissions = true;
    bool preserve_timestamps = true;
};

/**
 * @brief Runs one conversion attempt for a job; used by the worker pool
 */
class JobExecutor
{
public:
    virtual ~JobExecutor() = default;
    virtual TranscodeOutcome execute(const ConversionJob &job, const EncoderProfile &profile,
                                     const std::atomic<bool> *cancel) = 0;
};

/**
 * @brief ffmpeg-based executor.
 *
 * Output goes to "<destination>.part" and is renamed only after ffmpeg
 * exits cleanly, so a destination file under its final name is always
 * complete.
 */
class TranscodeExecutor : public JobExecutor
{
public:
    static constexpr const char *PART_SUFFIX = ".part";

    TranscodeExecutor(ExecutorSettings settings, ProcessRunner &runner, StreamProbe *probe, EventSink &events);

    TranscodeOutcome execute(const ConversionJob &job, const EncoderProfile &profile,
                             const std::atomic<bool> *cancel) override;

    /**
     * @brief Full ffmpeg argument vector for a job
     * @param report Probe result; without it the first non-cover-art video stream is selected by specifier
     */
    std::vector<std::string> buildCommand(const std::string &source, const std::string &part_path,
                                          const EncoderProfile &profile,
                                          const std::optional<ProbeReport> &report) const;

    /**
     * @brief output_dir/<path relative to watch_root>/<stem>.<container>
     *
     * A relative output_dir is taken relative to watch_root and an empty
     * one means next to the source. If the result equals the source,
     * ".converted" is inserted before the extension.
     */
    static std::string destinationFor(const std::string &source, const std::string &watch_root,
                                      const std::string &output_dir, const std::string &container);

    // ffmpeg muxer name for a container extension
    static std::string muxerFor(const std::string &container);

private:
    TranscodeOutcome fail(ErrorKind kind, const std::string &message) const;

    const ExecutorSettings settings_;
    ProcessRunner &runner_;
    StreamProbe *probe_;
    EventSink &events_;
};
