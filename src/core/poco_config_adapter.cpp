#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <stdexcept>

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
    Logger::debug("PocoConfigAdapter: initialized with built-in defaults");
}

PocoConfigAdapter::~PocoConfigAdapter()
{
    stopWatching();
}

nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getLogLevel();
}

std::string PocoConfigAdapter::getServerHost() const
{
    return poco_cfg_.getServerHost();
}

int PocoConfigAdapter::getServerPort() const
{
    // The hosting platform assigns the port through the environment
    const char *env_port = std::getenv("PORT");
    if (env_port != nullptr && *env_port != '\0')
    {
        try
        {
            int port = std::stoi(env_port);
            if (port > 0 && port <= 65535)
            {
                return port;
            }
        }
        catch (const std::exception &)
        {
        }
        Logger::warn("Ignoring invalid PORT environment value: " + std::string(env_port));
    }
    return poco_cfg_.getServerPort();
}

int PocoConfigAdapter::getHttpServerThreads() const
{
    return poco_cfg_.getHttpServerThreads();
}

std::string PocoConfigAdapter::getTempRoot() const
{
    return poco_cfg_.getTempRoot();
}

std::string PocoConfigAdapter::getEncoderBinary() const
{
    return poco_cfg_.getEncoderBinary();
}

std::string PocoConfigAdapter::getMp3Bitrate() const
{
    return poco_cfg_.getMp3Bitrate();
}

size_t PocoConfigAdapter::getMaxPayloadBytes() const
{
    return static_cast<size_t>(std::max(0, poco_cfg_.getMaxPayloadBytes()));
}

int PocoConfigAdapter::getConversionTimeoutSeconds() const
{
    return poco_cfg_.getConversionTimeoutSeconds();
}

int PocoConfigAdapter::getMaxConcurrentConversions() const
{
    return poco_cfg_.getMaxConcurrentConversions();
}

size_t PocoConfigAdapter::getStderrCapBytes() const
{
    return static_cast<size_t>(std::max(0, poco_cfg_.getStderrCapBytes()));
}

std::vector<std::string> PocoConfigAdapter::updateConfig(const nlohmann::json &patch, const std::string &source)
{
    if (!patch.is_object())
    {
        throw std::invalid_argument("Configuration patch must be a JSON object");
    }

    auto before = poco_cfg_.getAll();
    if (!poco_cfg_.update(patch))
    {
        Logger::error("Configuration update from " + source + " rejected: " + patch.dump());
        throw std::invalid_argument("Configuration update rejected by validation");
    }
    auto changed = diffKeys(before, poco_cfg_.getAll());

    if (!changed.empty())
    {
        ConfigUpdateEvent event;
        event.changed_keys = changed;
        event.source = source;
        event.update_id = nextUpdateId();
        publishEvent(event);
    }
    return changed;
}

void PocoConfigAdapter::applyCommandLineOverrides(const nlohmann::json &overrides)
{
    if (!overrides.is_object())
    {
        throw std::invalid_argument("Command line overrides must be a JSON object");
    }
    updateConfig(overrides, "cli");

    std::lock_guard<std::mutex> lock(overrides_mutex_);
    overrides_ = PocoConfigManager::overlay(overrides_, overrides);
}

nlohmann::json PocoConfigAdapter::getCommandLineOverrides() const
{
    std::lock_guard<std::mutex> lock(overrides_mutex_);
    return overrides_;
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    auto before = poco_cfg_.getAll();
    if (!poco_cfg_.load(file_path, getCommandLineOverrides()))
    {
        return false;
    }
    Logger::info("Configuration loaded from " + file_path);

    auto changed = diffKeys(before, poco_cfg_.getAll());
    if (!changed.empty())
    {
        ConfigUpdateEvent event;
        event.changed_keys = changed;
        event.source = "file_observer";
        event.update_id = nextUpdateId();
        publishEvent(event);
    }
    return true;
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    std::string target_path = file_path.empty() ? "config.json" : file_path;
    return poco_cfg_.save(target_path);
}

void PocoConfigAdapter::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(overrides_mutex_);
        overrides_ = nlohmann::json::object();
    }
    poco_cfg_.resetToDefaults();
}

bool PocoConfigAdapter::validateConfig() const
{
    return poco_cfg_.validateConfig();
}

void PocoConfigAdapter::startWatching(const std::string &file_path, int interval_seconds)
{
    if (watching_.load())
        return;

    watched_file_path_ = file_path;
    watch_interval_seconds_ = std::max(1, interval_seconds);

    std::error_code ec;
    last_write_time_ = std::filesystem::last_write_time(watched_file_path_, ec);
    if (ec)
    {
        last_write_time_ = std::filesystem::file_time_type{};
    }

    watching_.store(true);
    watcher_thread_ = std::thread([this]()
                                  {
        Logger::info("Starting configuration file watcher for: " + watched_file_path_);
        while (watching_.load()) {
            std::error_code ec;
            auto current = std::filesystem::last_write_time(watched_file_path_, ec);
            if (!ec && current != last_write_time_) {
                Logger::info("Detected change in configuration file. Reloading...");
                if (!loadConfig(watched_file_path_)) {
                    Logger::warn("Failed to reload configuration from file, keeping previous values");
                }
                last_write_time_ = current;
            }

            // Sleep in short steps so stopWatching() returns promptly
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(watch_interval_seconds_);
            while (watching_.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
        Logger::info("Configuration file watcher stopped"); });
}

void PocoConfigAdapter::stopWatching()
{
    if (!watching_.exchange(false))
        return;

    if (watcher_thread_.joinable())
        watcher_thread_.join();
}

void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
}

std::map<std::string, nlohmann::json> PocoConfigAdapter::flatten(const nlohmann::json &node)
{
    std::map<std::string, nlohmann::json> flat;
    std::function<void(const std::string &, const nlohmann::json &)> walk;
    walk = [&](const std::string &prefix, const nlohmann::json &value)
    {
        if (value.is_object())
        {
            for (auto it = value.begin(); it != value.end(); ++it)
            {
                walk(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value());
            }
        }
        else
        {
            flat[prefix] = value;
        }
    };
    walk("", node);
    return flat;
}

std::vector<std::string> PocoConfigAdapter::diffKeys(const nlohmann::json &before, const nlohmann::json &after) const
{
    auto old_values = flatten(before);
    auto new_values = flatten(after);

    std::vector<std::string> changed;
    for (const auto &[key, value] : new_values)
    {
        auto it = old_values.find(key);
        if (it == old_values.end() || it->second != value)
        {
            changed.push_back(key);
        }
    }
    for (const auto &[key, value] : old_values)
    {
        if (new_values.find(key) == new_values.end())
        {
            changed.push_back(key);
        }
    }
    return changed;
}

void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    std::string keys;
    for (const auto &key : event.changed_keys)
    {
        keys += (keys.empty() ? "" : ", ") + key;
    }
    Logger::info("Publishing config update " + event.update_id + " from " + event.source + ": " + keys);

    for (auto *observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

std::string PocoConfigAdapter::nextUpdateId()
{
    return "cfg-" + std::to_string(++update_counter_);
}
