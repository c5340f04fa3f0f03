#include <gtest/gtest.h>
#include "core/transcode_executor.hpp"
#include "test_base.hpp"
#include <algorithm>
#include <cerrno>
#include <sys/stat.h>

extern "C"
{
#include <libavutil/error.h>
}

using namespace std::chrono_literals;

namespace
{
    // Behaves like ffmpeg: writes its last argument, the output file
    FakeProcessRunner::Handler writesOutput(const std::string &content = "converted bytes")
    {
        return [content](const std::vector<std::string> &argv)
        {
            std::ofstream(argv.back(), std::ios::binary) << content;
            return FakeProcessRunner::exited(0, "");
        };
    }

    bool contains(const std::vector<std::string> &argv, const std::vector<std::string> &sequence)
    {
        return std::search(argv.begin(), argv.end(), sequence.begin(), sequence.end()) != argv.end();
    }
}

class TranscodeExecutorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        settings.ffmpeg_path = "ffmpeg";
        settings.container = "mkv";
        settings.conversion_timeout = 5s;
        software = EncoderProfiles::software(ConversionSettings{});
    }

    ConversionJob jobFor(const std::string &source)
    {
        ConversionJob job = makeJob(1, source);
        job.watch_root = path("watch");
        return job;
    }

    RecordingEventSink events;
    FakeProcessRunner runner;
    ExecutorSettings settings;
    EncoderProfile software;
};

TEST_F(TranscodeExecutorTest, CommandMapsPrimaryVideoAndSkipsCoverArt)
{
    ProbeReport report;
    report.readable = true;
    report.streams = {{0, "video", "mjpeg", true}, {1, "video", "h264", false}, {2, "audio", "aac", false},
                      {3, "subtitle", "subrip", false}};
    TranscodeExecutor executor(settings, runner, nullptr, events);

    auto argv = executor.buildCommand("/watch/in.mp4", "/out/in.mkv.part", software, report);

    EXPECT_EQ(argv.front(), "ffmpeg");
    EXPECT_TRUE(contains(argv, {"-i", "/watch/in.mp4"}));
    EXPECT_TRUE(contains(argv, {"-map", "0:1", "-map", "0:a?"}));
    EXPECT_TRUE(contains(argv, {"-c:v", "libx265"}));
    EXPECT_TRUE(contains(argv, {"-sn", "-dn", "-f", "matroska", "/out/in.mkv.part"}));
    EXPECT_EQ(argv.back(), "/out/in.mkv.part");
}

TEST_F(TranscodeExecutorTest, CommandFallsBackToVideoSpecifierWithoutProbe)
{
    TranscodeExecutor executor(settings, runner, nullptr, events);
    auto argv = executor.buildCommand("/watch/in.avi", "/out/in.mkv.part", software, std::nullopt);
    EXPECT_TRUE(contains(argv, {"-map", "0:V:0"}));
}

TEST_F(TranscodeExecutorTest, HardwareInputArgsPrecedeInput)
{
    TranscodeExecutor executor(settings, runner, nullptr, events);
    auto vaapi = EncoderProfiles::vaapi(ConversionSettings{});
    auto argv = executor.buildCommand("/watch/in.mp4", "/out/in.mkv.part", vaapi, std::nullopt);

    auto device = std::find(argv.begin(), argv.end(), "-vaapi_device");
    auto input = std::find(argv.begin(), argv.end(), "-i");
    ASSERT_NE(device, argv.end());
    EXPECT_LT(device, input);
    EXPECT_TRUE(contains(argv, {"-vf", "format=nv12,hwupload"}));
}

TEST_F(TranscodeExecutorTest, DestinationMirrorsLayoutUnderOutputDir)
{
    EXPECT_EQ(TranscodeExecutor::destinationFor("/w/sub/a.mp4", "/w", "", "mkv"), "/w/sub/a.mkv");
    EXPECT_EQ(TranscodeExecutor::destinationFor("/w/sub/a.mp4", "/w", "/out", "mkv"), "/out/sub/a.mkv");
    EXPECT_EQ(TranscodeExecutor::destinationFor("/w/sub/a.mp4", "/w", "../converted", "mp4"), "/converted/sub/a.mp4");
    EXPECT_EQ(TranscodeExecutor::destinationFor("/w/a.avi", "/w/", "/out", "mkv"), "/out/a.mkv");
}

TEST_F(TranscodeExecutorTest, DestinationNeverOverwritesSource)
{
    EXPECT_EQ(TranscodeExecutor::destinationFor("/w/a.mkv", "/w", "", "mkv"), "/w/a.converted.mkv");
}

TEST_F(TranscodeExecutorTest, MuxerNames)
{
    EXPECT_EQ(TranscodeExecutor::muxerFor("mkv"), "matroska");
    EXPECT_EQ(TranscodeExecutor::muxerFor("ts"), "mpegts");
    EXPECT_EQ(TranscodeExecutor::muxerFor("mp4"), "mp4");
}

TEST_F(TranscodeExecutorTest, SuccessRenamesPartFileAndCopiesAttributes)
{
    std::string source = writeFile("watch/show/ep1.mp4");
    chmod(source.c_str(), 0640);
    settings.output_dir = path("out");
    runner.setHandler(writesOutput());
    FakeStreamProbe probe(FakeStreamProbe::videoWithAudio());
    TranscodeExecutor executor(settings, runner, &probe, events);

    auto outcome = executor.execute(jobFor(source), software, nullptr);

    ASSERT_TRUE(outcome.success) << outcome.message;
    std::string destination = path("out/show/ep1.mkv");
    EXPECT_EQ(outcome.message, destination);
    EXPECT_TRUE(fs::exists(destination));
    EXPECT_FALSE(fs::exists(destination + TranscodeExecutor::PART_SUFFIX));

    struct stat st;
    ASSERT_EQ(stat(destination.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0640u);
    EXPECT_EQ(fs::last_write_time(destination), fs::last_write_time(source));
}

TEST_F(TranscodeExecutorTest, FailureLeavesNoOutputBehind)
{
    std::string source = writeFile("watch/ep1.mp4");
    runner.setHandler([](const std::vector<std::string> &argv)
                      {
        std::ofstream(argv.back()) << "partial";
        return FakeProcessRunner::exited(1, "Invalid data found when processing input\n"); });
    TranscodeExecutor executor(settings, runner, nullptr, events);

    auto outcome = executor.execute(jobFor(source), software, nullptr);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::FATAL);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_FALSE(fs::exists(path("watch/ep1.mkv")));
    EXPECT_FALSE(fs::exists(path("watch/ep1.mkv.part")));
}

TEST_F(TranscodeExecutorTest, EmptyOutputIsRetryable)
{
    std::string source = writeFile("watch/ep1.mp4");
    runner.setHandler(writesOutput(""));
    TranscodeExecutor executor(settings, runner, nullptr, events);

    auto outcome = executor.execute(jobFor(source), software, nullptr);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::RETRYABLE);
    EXPECT_FALSE(fs::exists(path("watch/ep1.mkv")));
}

TEST_F(TranscodeExecutorTest, UnreadableInputFailsWithoutRunningFfmpeg)
{
    std::string source = writeFile("watch/ep1.mp4");
    ProbeReport unreadable;
    unreadable.error = "Invalid data found when processing input";
    unreadable.error_code = AVERROR_INVALIDDATA;
    FakeStreamProbe probe(unreadable);
    TranscodeExecutor executor(settings, runner, &probe, events);

    auto outcome = executor.execute(jobFor(source), software, nullptr);
    EXPECT_EQ(outcome.error_kind, ErrorKind::FATAL);
    EXPECT_TRUE(runner.calls().empty());
}

TEST_F(TranscodeExecutorTest, InputReadErrorIsRetryable)
{
    std::string source = writeFile("watch/ep1.mp4");
    ProbeReport io_failure;
    io_failure.error = "Could not open input: Input/output error";
    io_failure.error_code = AVERROR(EIO);
    FakeStreamProbe probe(io_failure);
    TranscodeExecutor executor(settings, runner, &probe, events);

    auto outcome = executor.execute(jobFor(source), software, nullptr);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::RETRYABLE);
    EXPECT_EQ(outcome.message, io_failure.error);
    EXPECT_TRUE(runner.calls().empty());
}

TEST(ProbeReportTest, TransientFailuresAreIoBusyAndMemoryErrors)
{
    ProbeReport report;
    for (int code : {AVERROR(EIO), AVERROR(EAGAIN), AVERROR(EBUSY), AVERROR(ENOMEM)})
    {
        report.error_code = code;
        EXPECT_TRUE(report.isTransientFailure()) << code;
    }
    for (int code : {AVERROR_INVALIDDATA, AVERROR(ENOENT), AVERROR_DEMUXER_NOT_FOUND, 0})
    {
        report.error_code = code;
        EXPECT_FALSE(report.isTransientFailure()) << code;
    }

    report.readable = true;
    report.error_code = AVERROR(EIO);
    EXPECT_FALSE(report.isTransientFailure());
}

TEST_F(TranscodeExecutorTest, AudioOnlyInputIsFatal)
{
    std::string source = writeFile("watch/song.mp4");
    ProbeReport audio_only;
    audio_only.readable = true;
    audio_only.streams = {{0, "audio", "aac", false}, {1, "video", "mjpeg", true}};
    FakeStreamProbe probe(audio_only);
    TranscodeExecutor executor(settings, runner, &probe, events);

    auto outcome = executor.execute(jobFor(source), software, nullptr);
    EXPECT_EQ(outcome.error_kind, ErrorKind::FATAL);
    EXPECT_TRUE(runner.calls().empty());
}

TEST_F(TranscodeExecutorTest, MissingSourceIsFatal)
{
    TranscodeExecutor executor(settings, runner, nullptr, events);
    auto outcome = executor.execute(jobFor(path("watch/gone.mp4")), software, nullptr);
    EXPECT_EQ(outcome.error_kind, ErrorKind::FATAL);
}

TEST(LibavStreamProbeTest, MissingFileIsUnreadable)
{
    LibavStreamProbe probe;
    auto report = probe.probe("/nonexistent/videoconverter/input.mp4");
    EXPECT_FALSE(report.readable);
    EXPECT_FALSE(report.error.empty());
    EXPECT_LT(report.error_code, 0);
    EXPECT_FALSE(report.isTransientFailure());
    EXPECT_FALSE(report.primaryVideoIndex().has_value());
}
