#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Centralized shutdown coordination.
 * - Blocks SIGINT/SIGTERM/SIGQUIT process-wide and waits for them on a
 *   dedicated thread with sigwait(), so no code runs in signal context
 * - Ignores SIGPIPE so writes to dropped client sockets fail with EPIPE
 * - Provides a blocking wait until shutdown is requested
 *
 * installSignalHandlers() must run before any other thread is started so
 * every thread inherits the blocked mask.
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe to call from any thread
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    void stopSignalThread() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread signal_thread_;
    std::atomic<bool> signal_thread_running_{false};
};
