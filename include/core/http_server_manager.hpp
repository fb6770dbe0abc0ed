#pragma once

#include <httplib.h>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/config_observer.hpp"

/**
 * @brief Owns the HTTP listener and its worker pool
 *
 * Binds synchronously so callers learn about port conflicts immediately,
 * then serves on a background thread. Host, port, worker count or payload
 * cap changes rebuild the listener without restarting the process.
 */
class HttpServerManager : public ConfigObserver
{
public:
    static HttpServerManager &getInstance();

    struct Options
    {
        std::string host = "0.0.0.0";
        int port = 8080;
        size_t worker_threads = 8;
        size_t payload_hard_cap = 0; // 0 leaves the library default

        bool operator==(const Options &other) const
        {
            return host == other.host && port == other.port &&
                   worker_threads == other.worker_threads && payload_hard_cap == other.payload_hard_cap;
        }
        bool operator!=(const Options &other) const { return !(*this == other); }
    };

    /**
     * @brief Bind and start serving
     * @return false if the address could not be bound
     */
    bool start(const Options &options);
    void stop();
    bool isRunning() const;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    Options getCurrentOptions() const;

    // Invoked on every (re)built server before it starts listening
    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

    static Options optionsFromConfig();

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    bool startLocked(const Options &options);
    void stopLocked();
    void serverThread(httplib::Server *server);

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    Options current_;
    RouteSetupCallback route_setup_callback_;

    mutable std::mutex server_mutex_;
};
