#include "core/transcode_executor.hpp"
#include "core/error_classifier.hpp"
#include "core/file_utils.hpp"
#include <filesystem>

namespace
{
    const char *COMPONENT = "executor";

    void appendAll(std::vector<std::string> &argv, const std::vector<std::string> &args)
    {
        argv.insert(argv.end(), args.begin(), args.end());
    }

    void removePart(const std::string &part_path)
    {
        std::error_code ec;
        fs::remove(part_path, ec);
    }
}

TranscodeExecutor::TranscodeExecutor(ExecutorSettings settings, ProcessRunner &runner, StreamProbe *probe,
                                     EventSink &events)
    : settings_(std::move(settings)), runner_(runner), probe_(probe), events_(events)
{
}

std::string TranscodeExecutor::muxerFor(const std::string &container)
{
    if (container == "mkv")
        return "matroska";
    if (container == "ts")
        return "mpegts";
    if (container == "m4v")
        return "mp4";
    return container;
}

std::string TranscodeExecutor::destinationFor(const std::string &source, const std::string &watch_root,
                                              const std::string &output_dir, const std::string &container)
{
    fs::path src(FileUtils::normalizePath(source));
    fs::path target_dir = src.parent_path();

    if (!output_dir.empty())
    {
        fs::path root(FileUtils::normalizePath(watch_root.empty() ? src.parent_path().string() : watch_root));
        fs::path out(output_dir);
        if (out.is_relative())
        {
            out = root / out;
        }
        fs::path relative = src.parent_path().lexically_relative(root);
        if (relative.empty() || *relative.begin() == "..")
        {
            relative.clear();
        }
        target_dir = (out / relative).lexically_normal();
    }

    fs::path destination = target_dir / (src.stem().string() + "." + container);
    std::string normal = FileUtils::normalizePath(destination.string());
    if (normal == src.string())
    {
        normal = FileUtils::normalizePath((target_dir / (src.stem().string() + ".converted." + container)).string());
    }
    return normal;
}

std::vector<std::string> TranscodeExecutor::buildCommand(const std::string &source, const std::string &part_path,
                                                         const EncoderProfile &profile,
                                                         const std::optional<ProbeReport> &report) const
{
    std::vector<std::string> argv{settings_.ffmpeg_path, "-hide_banner", "-nostdin", "-y"};
    appendAll(argv, profile.input_args);
    argv.push_back("-i");
    argv.push_back(source);

    std::string video_map = "0:V:0";
    if (report)
    {
        auto index = report->primaryVideoIndex();
        if (index)
        {
            video_map = "0:" + std::to_string(*index);
        }
    }
    appendAll(argv, {"-map", video_map, "-map", "0:a?"});
    appendAll(argv, profile.video_filter);
    appendAll(argv, profile.video_args);
    appendAll(argv, profile.audio_args);
    appendAll(argv, {"-sn", "-dn", "-f", muxerFor(settings_.container), part_path});
    return argv;
}

TranscodeOutcome TranscodeExecutor::fail(ErrorKind kind, const std::string &message) const
{
    TranscodeOutcome outcome;
    outcome.error_kind = kind;
    outcome.message = message;
    return outcome;
}

TranscodeOutcome TranscodeExecutor::execute(const ConversionJob &job, const EncoderProfile &profile,
                                            const std::atomic<bool> *cancel)
{
    const std::string &source = job.source_path;
    if (!FileUtils::getFileMetadata(source))
    {
        return fail(ErrorKind::FATAL, "Source file no longer exists: " + source);
    }

    std::optional<ProbeReport> report;
    if (probe_)
    {
        report = probe_->probe(source);
        if (!report->readable)
        {
            return fail(report->isTransientFailure() ? ErrorKind::RETRYABLE : ErrorKind::FATAL, report->error);
        }
        if (!report->primaryVideoIndex())
        {
            return fail(ErrorKind::FATAL, "Input has no video stream");
        }
    }

    std::string destination = job.destination_path.empty()
                                  ? destinationFor(source, job.watch_root, settings_.output_dir, settings_.container)
                                  : job.destination_path;
    std::string part_path = destination + PART_SUFFIX;

    std::error_code ec;
    fs::create_directories(fs::path(destination).parent_path(), ec);
    if (ec)
    {
        return fail(ErrorKind::RETRYABLE, "Cannot create output directory: " + ec.message());
    }
    removePart(part_path);

    auto argv = buildCommand(source, part_path, profile, report);
    events_.info(COMPONENT, "Job started",
                 {{"job", job.id}, {"source", source}, {"destination", destination},
                  {"encoder", profile.name}, {"attempt", job.attempt_count}});
    events_.debug(COMPONENT, "ffmpeg command", {{"job", job.id}, {"argv", argv}});

    ProcessResult result = runner_.run(argv, settings_.conversion_timeout, cancel);

    TranscodeOutcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.timed_out = result.timed_out;
    outcome.cancelled = result.cancelled;
    outcome.output = result.output;

    if (!result.succeeded())
    {
        removePart(part_path);
        Classification classification = ErrorClassifier::classify(result);
        outcome.error_kind = classification.kind;
        outcome.message = classification.reason;
        return outcome;
    }

    auto produced = FileUtils::getFileMetadata(part_path);
    if (!produced || produced->file_size == 0)
    {
        removePart(part_path);
        outcome.error_kind = ErrorKind::RETRYABLE;
        outcome.message = "ffmpeg reported success but produced no output";
        return outcome;
    }

    fs::rename(part_path, destination, ec);
    if (ec)
    {
        removePart(part_path);
        outcome.error_kind = ErrorKind::RETRYABLE;
        outcome.message = "Cannot move output into place: " + ec.message();
        return outcome;
    }

    if (settings_.preserve_permissions || settings_.preserve_timestamps)
    {
        std::string error;
        if (!FileUtils::copyAttributes(source, destination, settings_.preserve_permissions,
                                       settings_.preserve_timestamps, error))
        {
            events_.warn(COMPONENT, "Could not preserve source attributes",
                         {{"job", job.id}, {"destination", destination}, {"error", error}});
        }
    }

    outcome.success = true;
    outcome.message = destination;
    return outcome;
}
