#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Result of running the external encoder once
 */
struct InvocationOutcome
{
    enum class Status
    {
        Success,
        EncoderFailed,
        Timeout
    };

    Status status = Status::EncoderFailed;
    int exit_code = -1;   // Valid when the child exited normally
    int term_signal = 0;  // Non-zero when the child was killed by a signal
    std::string stderr_text;
    bool stderr_truncated = false;
    long long elapsed_ms = 0;

    bool succeeded() const { return status == Status::Success; }
};

const char *toString(InvocationOutcome::Status status);

/**
 * @brief Runs the encoder as a child process with a wall-clock limit.
 *
 * Only the exit status is authoritative; stdout is discarded and stderr is
 * captured (bounded) for diagnostics. On timeout the child's whole process
 * group is killed and reaped before convert() returns.
 */
class TranscoderInvoker
{
public:
    struct Options
    {
        std::string encoder_binary = "ffmpeg";
        std::string bitrate = "128k";
        std::chrono::milliseconds timeout{60000};
        size_t stderr_cap_bytes = 64 * 1024;
    };

    static constexpr const char *TRUNCATION_MARKER = "\n[stderr truncated]";

    explicit TranscoderInvoker(Options options);

    /**
     * @brief Convert input_path to an mp3 at output_path
     * @return Success on exit status 0, EncoderFailed otherwise, Timeout past the deadline
     */
    InvocationOutcome convert(const std::filesystem::path &input_path,
                              const std::filesystem::path &output_path) const;

    // Full argv, program name first
    std::vector<std::string> buildArguments(const std::filesystem::path &input_path,
                                            const std::filesystem::path &output_path) const;

    const Options &options() const { return options_; }

private:
    Options options_;
};
