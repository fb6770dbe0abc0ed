#include "core/transcoder_invoker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace
{
    using Clock = std::chrono::steady_clock;

    constexpr int EXEC_FAILURE_EXIT_CODE = 127;
    constexpr auto POLL_SLICE = std::chrono::milliseconds(50);

    // Only async-signal-safe calls are allowed between fork() and exec()
    void writeAll(int fd, const char *data, size_t length)
    {
        while (length > 0)
        {
            ssize_t written = ::write(fd, data, length);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return;
            }
            data += written;
            length -= static_cast<size_t>(written);
        }
    }

    void writeErrno(int fd, int error_number)
    {
        char digits[16];
        int pos = sizeof(digits);
        unsigned value = static_cast<unsigned>(error_number);
        do
        {
            digits[--pos] = static_cast<char>('0' + value % 10);
            value /= 10;
        } while (value != 0 && pos > 0);
        writeAll(fd, digits + pos, sizeof(digits) - pos);
    }

    class FdCloser
    {
    public:
        explicit FdCloser(int fd) : fd_(fd) {}
        ~FdCloser()
        {
            if (fd_ >= 0)
                ::close(fd_);
        }
        FdCloser(const FdCloser &) = delete;
        FdCloser &operator=(const FdCloser &) = delete;

    private:
        int fd_;
    };

    // Reports termination without reaping. The zombie keeps the pid, and with
    // it the process group id, reserved until waitpid collects it.
    bool childExited(pid_t pid)
    {
        for (;;)
        {
            siginfo_t info;
            std::memset(&info, 0, sizeof(info));
            if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0)
                return info.si_pid == pid;
            if (errno == EINTR)
                continue;
            return true;
        }
    }

    bool reapChild(pid_t pid, int &status, bool block)
    {
        for (;;)
        {
            pid_t result = ::waitpid(pid, &status, block ? 0 : WNOHANG);
            if (result == pid)
                return true;
            if (result == 0)
                return false;
            if (errno == EINTR)
                continue;
            // ECHILD: somebody else reaped it; treat as gone
            status = 0;
            return true;
        }
    }
}

const char *toString(InvocationOutcome::Status status)
{
    switch (status)
    {
    case InvocationOutcome::Status::Success:
        return "Success";
    case InvocationOutcome::Status::EncoderFailed:
        return "EncoderFailed";
    case InvocationOutcome::Status::Timeout:
        return "Timeout";
    }
    return "Unknown";
}

TranscoderInvoker::TranscoderInvoker(Options options)
    : options_(std::move(options))
{
}

std::vector<std::string> TranscoderInvoker::buildArguments(const std::filesystem::path &input_path,
                                                           const std::filesystem::path &output_path) const
{
    return {
        options_.encoder_binary,
        "-hide_banner",
        "-nostdin",
        "-loglevel", "error",
        "-y",
        "-i", input_path.string(),
        "-vn",
        "-codec:a", "libmp3lame",
        "-b:a", options_.bitrate,
        "-f", "mp3",
        output_path.string()};
}

InvocationOutcome TranscoderInvoker::convert(const std::filesystem::path &input_path,
                                             const std::filesystem::path &output_path) const
{
    InvocationOutcome outcome;
    const auto started = Clock::now();
    const auto deadline = started + options_.timeout;

    auto args = buildArguments(input_path, output_path);
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string exec_error_prefix = "failed to execute " + options_.encoder_binary + ": errno ";

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0)
    {
        outcome.stderr_text = std::string("pipe() failed: ") + std::strerror(errno);
        Logger::error("TranscoderInvoker: " + outcome.stderr_text);
        return outcome;
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        int fork_errno = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        outcome.stderr_text = std::string("fork() failed: ") + std::strerror(fork_errno);
        Logger::error("TranscoderInvoker: " + outcome.stderr_text);
        return outcome;
    }

    if (pid == 0)
    {
        // Own process group so a timeout kill also reaches anything the encoder spawned
        ::setpgid(0, 0);

        // The server blocks its shutdown signals; the encoder must not inherit that
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        int null_fd = ::open("/dev/null", O_RDWR);
        if (null_fd >= 0)
        {
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(null_fd, STDOUT_FILENO);
        }
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        int exec_errno = errno;
        writeAll(STDERR_FILENO, exec_error_prefix.data(), exec_error_prefix.size());
        writeErrno(STDERR_FILENO, exec_errno);
        writeAll(STDERR_FILENO, "\n", 1);
        ::_exit(EXEC_FAILURE_EXIT_CODE);
    }

    // Parent
    ::setpgid(pid, pid);
    ::close(err_pipe[1]);
    FdCloser read_end_closer(err_pipe[0]);
    int read_fd = err_pipe[0];
    ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);

    Logger::debug("TranscoderInvoker: spawned pid " + std::to_string(pid) + " for " + input_path.string());

    bool pipe_open = true;
    bool exited = false;
    int status = 0;
    char buffer[4096];

    // Keep at most stderr_cap_bytes; the rest is read and dropped so the child never blocks
    auto capture = [&](size_t n)
    {
        size_t room = options_.stderr_cap_bytes > outcome.stderr_text.size()
                          ? options_.stderr_cap_bytes - outcome.stderr_text.size()
                          : 0;
        size_t take = std::min(room, n);
        outcome.stderr_text.append(buffer, take);
        if (take < n)
        {
            outcome.stderr_truncated = true;
        }
    };

    while (!exited)
    {
        auto now = Clock::now();
        if (now >= deadline)
        {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min(remaining, std::chrono::milliseconds(POLL_SLICE)).count());

        if (pipe_open)
        {
            struct pollfd pfd;
            pfd.fd = read_fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = ::poll(&pfd, 1, wait_ms);
            if (ready > 0)
            {
                for (;;)
                {
                    ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
                    if (n > 0)
                    {
                        capture(static_cast<size_t>(n));
                        continue;
                    }
                    if (n == 0)
                    {
                        pipe_open = false;
                    }
                    else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    {
                        pipe_open = false;
                    }
                    break;
                }
            }
            else if (ready < 0 && errno != EINTR)
            {
                pipe_open = false;
            }
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms > 0 ? std::min(wait_ms, 10) : 1));
        }

        exited = childExited(pid);
    }

    if (!exited)
    {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        reapChild(pid, status, true);

        outcome.status = InvocationOutcome::Status::Timeout;
        outcome.term_signal = SIGKILL;
        outcome.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
        Logger::warn("TranscoderInvoker: pid " + std::to_string(pid) + " exceeded " +
                     std::to_string(options_.timeout.count()) + " ms and was killed");
    }
    else
    {
        // Stragglers left in the group must not outlive the request. The
        // leader is still unreaped here, so the group id cannot be reused yet.
        ::kill(-pid, SIGKILL);
        reapChild(pid, status, true);

        // Drain whatever the child wrote right before exiting
        while (pipe_open)
        {
            ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
            if (n <= 0)
                break;
            capture(static_cast<size_t>(n));
        }

        outcome.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
        if (WIFEXITED(status))
        {
            outcome.exit_code = WEXITSTATUS(status);
            outcome.status = outcome.exit_code == 0 ? InvocationOutcome::Status::Success
                                                    : InvocationOutcome::Status::EncoderFailed;
        }
        else if (WIFSIGNALED(status))
        {
            outcome.term_signal = WTERMSIG(status);
            outcome.status = InvocationOutcome::Status::EncoderFailed;
        }
        else
        {
            outcome.status = InvocationOutcome::Status::EncoderFailed;
        }

    }

    if (outcome.stderr_truncated)
    {
        outcome.stderr_text += TRUNCATION_MARKER;
    }

    Logger::debug("TranscoderInvoker: pid " + std::to_string(pid) + " finished with " + toString(outcome.status) +
                  " exit=" + std::to_string(outcome.exit_code) + " signal=" + std::to_string(outcome.term_signal) +
                  " in " + std::to_string(outcome.elapsed_ms) + " ms");
    return outcome;
}
