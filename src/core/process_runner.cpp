#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace
{
    void closeFd(int &fd)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }

    // Read whatever is available without blocking; sets eof when the write side is gone
    void drainPipe(int fd, std::string &output, size_t max_bytes, bool &eof)
    {
        char buffer[4096];
        for (;;)
        {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                output.append(buffer, static_cast<size_t>(n));
                if (output.size() > max_bytes)
                {
                    output.erase(0, output.size() - max_bytes);
                }
                continue;
            }
            if (n == 0)
            {
                eof = true;
            }
            else if (errno == EINTR)
            {
                continue;
            }
            return;
        }
    }
}

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds kill_grace, size_t max_output_bytes)
    : kill_grace_(kill_grace), max_output_bytes_(max_output_bytes)
{
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout,
                                      const std::atomic<bool> *cancel)
{
    ProcessResult result;
    if (argv.empty())
    {
        result.spawn_failed = true;
        result.error_message = "Empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0)
    {
        result.spawn_failed = true;
        result.error_message = std::string("pipe() failed: ") + std::strerror(errno);
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        return result;
    }

    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        result.spawn_failed = true;
        result.error_message = std::string("fork() failed: ") + std::strerror(errno);
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        closeFd(exec_pipe[0]);
        closeFd(exec_pipe[1]);
        return result;
    }

    if (pid == 0)
    {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    closeFd(out_pipe[1]);
    closeFd(exec_pipe[1]);

    // The exec pipe closes on a successful exec; otherwise the child reports errno
    int child_errno = 0;
    ssize_t got;
    do
    {
        got = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status = 0;
        waitpid(pid, &status, 0);
        closeFd(out_pipe[0]);
        result.spawn_failed = true;
        result.error_message = "Cannot execute " + argv[0] + ": " + std::strerror(child_errno);
        return result;
    }

    int out_fd = out_pipe[0];
    fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL) | O_NONBLOCK);

    const auto started = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point kill_deadline;
    bool terminating = false;
    bool killed = false;
    bool eof = false;
    bool exited = false;
    int status = 0;

    while (!exited)
    {
        if (!eof)
        {
            struct pollfd pfd
            {
                out_fd, POLLIN, 0
            };
            int ready = poll(&pfd, 1, 100);
            if (ready > 0)
            {
                drainPipe(out_fd, result.output, max_output_bytes_, eof);
            }
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            exited = true;
            break;
        }
        if (waited < 0 && errno != EINTR)
        {
            result.error_message = std::string("waitpid() failed: ") + std::strerror(errno);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (!terminating)
        {
            if (timeout.count() > 0 && now - started >= timeout)
            {
                result.timed_out = true;
                terminating = true;
            }
            else if (cancel && cancel->load())
            {
                result.cancelled = true;
                terminating = true;
            }
            if (terminating)
            {
                kill(-pid, SIGTERM);
                kill_deadline = now + kill_grace_;
            }
        }
        else if (!killed && now >= kill_deadline)
        {
            kill(-pid, SIGKILL);
            killed = true;
        }
    }

    // Helpers of the child may still hold the pipe; do not wait on them for long
    auto drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    while (!eof && std::chrono::steady_clock::now() < drain_deadline)
    {
        struct pollfd pfd
        {
            out_fd, POLLIN, 0
        };
        if (poll(&pfd, 1, 50) > 0)
        {
            drainPipe(out_fd, result.output, max_output_bytes_, eof);
        }
    }
    closeFd(out_fd);

    if (exited)
    {
        if (WIFEXITED(status))
        {
            result.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            result.term_signal = WTERMSIG(status);
        }
    }
    return result;
}

bool PosixProcessRunner::isExecutableAvailable(const std::string &program)
{
    if (program.empty())
    {
        return false;
    }
    if (program.find('/') != std::string::npos)
    {
        return access(program.c_str(), X_OK) == 0;
    }

    const char *path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(search);
    std::string dir;
    while (std::getline(ss, dir, ':'))
    {
        if (dir.empty())
        {
            dir = ".";
        }
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0)
        {
            return true;
        }
    }
    return false;
}
