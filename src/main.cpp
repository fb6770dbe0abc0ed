#include "core/conversion_handler.hpp"
#include "core/http_server_manager.hpp"
#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/shutdown_manager.hpp"
#include "core/workspace_manager.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/route_handlers.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Voice Transcoder - ogg/opus to mp3 conversion service" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>   Configuration file (default: config.json," << std::endl;
        std::cout << "                        or $VOICE_TRANSCODER_CONFIG)" << std::endl;
        std::cout << "  --port, -p <port>     Listen port (overridden by $PORT)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    // Initialize coordinated signal handling FIRST so every thread inherits the mask
    ShutdownManager::getInstance().installSignalHandlers();

    std::string config_path = "config.json";
    if (const char *env_config = std::getenv("VOICE_TRANSCODER_CONFIG"); env_config != nullptr && *env_config != '\0')
    {
        config_path = env_config;
    }
    int cli_port = 0;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--port" || arg == "-p") && i + 1 < argc)
        {
            try
            {
                cli_port = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: invalid port '" << argv[i] << "'" << std::endl;
                return 1;
            }
        }
        else
        {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto &config_manager = PocoConfigAdapter::getInstance();
    Logger::init(config_manager.getLogLevel());

    Logger::info("Starting " + std::string(ServerConfig::SERVICE_NAME) + " " + ServerConfig::SERVICE_VERSION +
                 " (PID: " + std::to_string(getpid()) + ")...");

    const bool config_file_present = std::filesystem::exists(config_path);
    if (config_file_present)
    {
        if (!config_manager.loadConfig(config_path))
        {
            Logger::error("Failed to load configuration from " + config_path);
            return 1;
        }
    }
    else
    {
        Logger::info("No configuration file at " + config_path + ", using built-in defaults");
    }

    if (cli_port != 0)
    {
        try
        {
            config_manager.applyCommandLineOverrides({{"server_port", cli_port}});
        }
        catch (const std::invalid_argument &e)
        {
            Logger::error("Invalid --port " + std::to_string(cli_port) + ": " + e.what());
            return 1;
        }
    }

    if (!config_manager.validateConfig())
    {
        Logger::error("Configuration is invalid, refusing to start");
        return 1;
    }

    Logger::init(config_manager.getLogLevel());

    auto logger_observer = std::make_unique<LoggerObserver>();
    config_manager.subscribe(logger_observer.get());

    WorkspaceManager workspaces(config_manager.getTempRoot());
    size_t swept = workspaces.sweepStale();
    if (swept > 0)
    {
        Logger::info("Removed " + std::to_string(swept) + " stale workspaces left by a previous run");
    }

    ConversionHandler handler(workspaces, ConversionHandler::Settings::fromConfig(config_manager));
    config_manager.subscribe(&handler);

    auto &server_manager = HttpServerManager::getInstance();
    server_manager.setRouteSetupCallback([&handler](httplib::Server &svr)
                                         { RouteHandlers::setupRoutes(svr, handler); });
    config_manager.subscribe(&server_manager);

    if (!server_manager.start(HttpServerManager::optionsFromConfig()))
    {
        Logger::error("Failed to start HTTP server");
        config_manager.unsubscribe(&server_manager);
        config_manager.unsubscribe(&handler);
        config_manager.unsubscribe(logger_observer.get());
        return 1;
    }

    if (config_file_present)
    {
        config_manager.startWatching(config_path, 2);
    }

    Logger::info("Server ready. Press Ctrl+C to stop.");
    ShutdownManager::getInstance().waitForShutdown();

    Logger::info("Shutting down: " + ShutdownManager::getInstance().getReason());
    config_manager.stopWatching();
    config_manager.unsubscribe(&server_manager);
    server_manager.stop();
    config_manager.unsubscribe(&handler);
    config_manager.unsubscribe(logger_observer.get());

    size_t leftovers = workspaces.sweepStale();
    if (leftovers > 0)
    {
        Logger::warn("Removed " + std::to_string(leftovers) + " workspaces still present at shutdown");
    }

    Logger::info("Shutdown complete");
    return 0;
}
