#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <pthread.h>

namespace
{
    // SIGUSR1 only wakes the signal thread when the manager is torn down
    sigset_t shutdownSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGQUIT);
        sigaddset(&set, SIGUSR1);
        return set;
    }
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopSignalThread();
}

void ShutdownManager::installSignalHandlers()
{
    if (signal_thread_running_.exchange(true))
    {
        return;
    }

    std::signal(SIGPIPE, SIG_IGN);

    sigset_t set = shutdownSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        Logger::error("ShutdownManager: pthread_sigmask failed with code " + std::to_string(rc));
        signal_thread_running_.store(false);
        return;
    }

    signal_thread_ = std::thread([this, set]()
                                 {
        while (signal_thread_running_.load())
        {
            int sig = 0;
            if (sigwait(&set, &sig) != 0)
            {
                continue;
            }
            if (sig == SIGUSR1)
            {
                continue;
            }
            requestShutdown("Signal received", sig);
        } });

    Logger::info("ShutdownManager: signal handling installed");
}

void ShutdownManager::stopSignalThread() noexcept
{
    if (!signal_thread_running_.exchange(false))
    {
        return;
    }
    if (signal_thread_.joinable())
    {
        pthread_kill(signal_thread_.native_handle(), SIGUSR1);
        signal_thread_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        last_signal_.store(signal_number);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: programmatic shutdown requested - " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    reason_.clear();
}
