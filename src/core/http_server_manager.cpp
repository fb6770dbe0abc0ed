#include "core/http_server_manager.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include <algorithm>

HttpServerManager::HttpServerManager() = default;

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

HttpServerManager::Options HttpServerManager::optionsFromConfig()
{
    auto &config = PocoConfigAdapter::getInstance();

    Options options;
    options.host = config.getServerHost();
    options.port = config.getServerPort();
    options.worker_threads = static_cast<size_t>(std::max(1, config.getHttpServerThreads()));
    options.payload_hard_cap = config.getMaxPayloadBytes() + ServerConfig::PAYLOAD_HARD_CAP_SLACK;
    return options;
}

bool HttpServerManager::start(const Options &options)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running. Stopping current instance first.");
        stopLocked();
    }
    return startLocked(options);
}

bool HttpServerManager::startLocked(const Options &options)
{
    current_ = options;
    server_ = std::make_unique<httplib::Server>();

    const size_t workers = options.worker_threads;
    server_->new_task_queue = [workers]
    { return new httplib::ThreadPool(workers); };

    if (options.payload_hard_cap > 0)
    {
        server_->set_payload_max_length(options.payload_hard_cap);
    }

    if (route_setup_callback_)
    {
        route_setup_callback_(*server_);
    }
    else
    {
        Logger::warn("HttpServerManager: no route setup callback registered");
    }

    if (!server_->bind_to_port(options.host, options.port))
    {
        Logger::error("HttpServerManager: Failed to bind " + options.host + ":" + std::to_string(options.port));
        server_.reset();
        return false;
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this, server_.get());

    Logger::info("HttpServerManager: Listening on http://" + options.host + ":" + std::to_string(options.port) +
                 " with " + std::to_string(workers) + " worker threads");
    return true;
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    stopLocked();
}

void HttpServerManager::stopLocked()
{
    if (!server_)
    {
        return;
    }

    running_.store(false);
    server_->stop();

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }
    server_.reset();

    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

HttpServerManager::Options HttpServerManager::getCurrentOptions() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.hasKey("server_port") && !event.hasKey("server_host") &&
        !event.hasKey("threading.http_server_threads") && !event.hasKey("limits.max_payload_bytes"))
    {
        return;
    }

    Options next;
    try
    {
        next = optionsFromConfig();
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Error reading server configuration: " + std::string(e.what()));
        return;
    }

    std::lock_guard<std::mutex> lock(server_mutex_);
    if (!server_)
    {
        Logger::info("HttpServerManager: Server not running, configuration applies on next start");
        current_ = next;
        return;
    }

    // PORT and command line values win over the file, so the effective options may not move
    if (next == current_)
    {
        Logger::debug("HttpServerManager: Effective listener options unchanged, keeping current server");
        return;
    }

    Logger::info("HttpServerManager: Reconfiguring server to " + next.host + ":" + std::to_string(next.port));
    Options previous = current_;
    stopLocked();
    if (!startLocked(next))
    {
        Logger::error("HttpServerManager: Reconfiguration failed, restoring " + previous.host + ":" +
                      std::to_string(previous.port));
        if (!startLocked(previous))
        {
            Logger::error("HttpServerManager: Could not restore previous listener");
        }
    }
}

void HttpServerManager::serverThread(httplib::Server *server)
{
    try
    {
        if (!server->listen_after_bind())
        {
            Logger::error("HttpServerManager: listener exited with an error");
        }
        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
