#include <gtest/gtest.h>
#include "core/error_classifier.hpp"

namespace
{
    ProcessResult failedWith(int code, const std::string &output)
    {
        ProcessResult result;
        result.exit_code = code;
        result.output = output;
        return result;
    }
}

TEST(ErrorClassifierTest, CorruptInputIsFatal)
{
    auto c = ErrorClassifier::classify(failedWith(1, "[mov,mp4] moov atom not found\nbroken.mp4: Invalid data found when processing input\n"));
    EXPECT_EQ(c.kind, ErrorKind::FATAL);
}

TEST(ErrorClassifierTest, CodecContainerMismatchIsFatal)
{
    auto c = ErrorClassifier::classify(failedWith(1, "Could not write header for output file #0\n"
                                                     "codec not currently supported in container\n"));
    EXPECT_EQ(c.kind, ErrorKind::FATAL);

    c = ErrorClassifier::classify(failedWith(1, "Unknown encoder 'hevc_nvenc'\n"));
    EXPECT_EQ(c.kind, ErrorKind::FATAL);
}

TEST(ErrorClassifierTest, TransientConditionsAreRetryable)
{
    EXPECT_EQ(ErrorClassifier::classify(failedWith(1, "OpenEncodeSessionEx failed: out of memory (10)\n")).kind,
              ErrorKind::RETRYABLE);
    EXPECT_EQ(ErrorClassifier::classify(failedWith(1, "av_interleaved_write_frame(): No space left on device\n")).kind,
              ErrorKind::RETRYABLE);
    EXPECT_EQ(ErrorClassifier::classify(failedWith(1, "Device or resource busy\n")).kind, ErrorKind::RETRYABLE);
}

TEST(ErrorClassifierTest, TransientWinsOverFatalInSameOutput)
{
    auto c = ErrorClassifier::classify(failedWith(1, "Could not write header for output file #0\nInput/output error\n"));
    EXPECT_EQ(c.kind, ErrorKind::RETRYABLE);
}

TEST(ErrorClassifierTest, UnknownFailureIsRetryableWithTail)
{
    auto c = ErrorClassifier::classify(failedWith(69, "one\ntwo\n\nthree\nfour\n"));
    EXPECT_EQ(c.kind, ErrorKind::RETRYABLE);
    EXPECT_NE(c.reason.find("69"), std::string::npos);
    EXPECT_NE(c.reason.find("two | three | four"), std::string::npos);
    EXPECT_EQ(c.reason.find("one"), std::string::npos);
}

TEST(ErrorClassifierTest, ProcessLevelFailuresAreRetryable)
{
    ProcessResult timed_out;
    timed_out.timed_out = true;
    EXPECT_EQ(ErrorClassifier::classify(timed_out).kind, ErrorKind::RETRYABLE);

    ProcessResult spawn;
    spawn.spawn_failed = true;
    EXPECT_EQ(ErrorClassifier::classify(spawn).kind, ErrorKind::RETRYABLE);

    ProcessResult killed;
    killed.term_signal = 9;
    EXPECT_EQ(ErrorClassifier::classify(killed).kind, ErrorKind::RETRYABLE);
}
