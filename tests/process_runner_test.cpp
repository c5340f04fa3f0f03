#include <gtest/gtest.h>
#include "core/process_runner.hpp"
#include <atomic>
#include <csignal>
#include <thread>

using namespace std::chrono_literals;

class PosixProcessRunnerTest : public ::testing::Test
{
protected:
    PosixProcessRunner runner{std::chrono::milliseconds(200)};
};

TEST_F(PosixProcessRunnerTest, CapturesOutputAndExitCode)
{
    auto result = runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, 5s);
    EXPECT_FALSE(result.spawn_failed);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST_F(PosixProcessRunnerTest, SuccessfulRun)
{
    auto result = runner.run({"/bin/sh", "-c", "printf ok"}, 5s);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "ok");
}

TEST_F(PosixProcessRunnerTest, ArgumentsAreNotInterpretedByAShell)
{
    auto result = runner.run({"/bin/echo", "$HOME;", "`id`"}, 5s);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "$HOME; `id`\n");
}

TEST_F(PosixProcessRunnerTest, MissingProgramIsSpawnFailure)
{
    auto result = runner.run({"/nonexistent/videoconverter-no-such-binary"}, 5s);
    EXPECT_TRUE(result.spawn_failed);
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(PosixProcessRunnerTest, TimeoutTerminatesChild)
{
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run({"/bin/sleep", "10"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(elapsed, 5s);
}

TEST_F(PosixProcessRunnerTest, TimeoutEscalatesToKillWhenTermIsIgnored)
{
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run({"/bin/sh", "-c", "trap '' TERM; sleep 10"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(PosixProcessRunnerTest, CancelFlagStopsChild)
{
    std::atomic<bool> cancel{false};
    std::thread canceller([&cancel]()
                          {
        std::this_thread::sleep_for(150ms);
        cancel.store(true); });

    auto result = runner.run({"/bin/sleep", "10"}, 0ms, &cancel);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(PosixProcessRunnerTest, OutputIsBoundedToTail)
{
    PosixProcessRunner small(std::chrono::milliseconds(200), 1024);
    auto result = small.run({"/bin/sh", "-c", "i=0; while [ $i -lt 500 ]; do echo line$i; i=$((i+1)); done; echo LAST"}, 5s);
    EXPECT_TRUE(result.succeeded());
    EXPECT_LE(result.output.size(), 1024u);
    EXPECT_NE(result.output.find("LAST"), std::string::npos);
}

TEST(ProcessRunnerLookupTest, FindsProgramsOnPath)
{
    EXPECT_TRUE(PosixProcessRunner::isExecutableAvailable("sh"));
    EXPECT_TRUE(PosixProcessRunner::isExecutableAvailable("/bin/sh"));
    EXPECT_FALSE(PosixProcessRunner::isExecutableAvailable("videoconverter-no-such-binary"));
    EXPECT_FALSE(PosixProcessRunner::isExecutableAvailable(""));
}
