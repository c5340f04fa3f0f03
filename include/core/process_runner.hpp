#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Result of one external program invocation
 */
struct ProcessResult
{
    int exit_code = -1;       // exit status, or -1 when the process did not exit normally
    int term_signal = 0;      // signal that terminated the process, 0 if none
    bool spawn_failed = false;
    bool timed_out = false;
    bool cancelled = false;
    std::string output;       // combined stdout and stderr (tail only when truncated)
    std::string error_message;

    bool succeeded() const { return !spawn_failed && !timed_out && !cancelled && exit_code == 0; }
};

/**
 * @brief Runs external programs from an explicit argument vector
 */
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run argv[0] with the given arguments and wait for it
     * @param argv Program and arguments, no shell involved
     * @param timeout Maximum run time; 0 means unlimited
     * @param cancel Optional flag polled while waiting; when set the child is terminated
     */
    virtual ProcessResult run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout,
                              const std::atomic<bool> *cancel = nullptr) = 0;
};

/**
 * @brief fork/execvp implementation with a polled, killable wait
 *
 * The child runs in its own process group so that a timeout or
 * cancellation reaches helpers it spawned as well. Termination sends
 * SIGTERM first and SIGKILL after kill_grace.
 */
class PosixProcessRunner : public ProcessRunner
{
public:
    explicit PosixProcessRunner(std::chrono::milliseconds kill_grace = std::chrono::seconds(5),
                                size_t max_output_bytes = 256 * 1024);

    ProcessResult run(const std::vector<std::string> &argv,
                      std::chrono::milliseconds timeout,
                      const std::atomic<bool> *cancel = nullptr) override;

    /**
     * @brief Look a program up the way execvp would
     * @return true if argv0 names an executable file (directly or via PATH)
     */
    static bool isExecutableAvailable(const std::string &program);

private:
    std::chrono::milliseconds kill_grace_;
    size_t max_output_bytes_;
};
