#pragma once

#include "core/poco_config_manager.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class ConfigObserver;
struct ConfigUpdateEvent;

/**
 * @brief Typed configuration facade over PocoConfigManager.
 *
 * Adds environment overrides (PORT), change detection with observer
 * notification, and a polling watcher for the configuration file.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter();

    nlohmann::json getAll() const;

    // Server
    std::string getLogLevel() const;
    std::string getServerHost() const;
    int getServerPort() const;
    int getHttpServerThreads() const;

    // Transcoding
    std::string getTempRoot() const;
    std::string getEncoderBinary() const;
    std::string getMp3Bitrate() const;

    // Limits
    size_t getMaxPayloadBytes() const;
    int getConversionTimeoutSeconds() const;
    int getMaxConcurrentConversions() const;
    size_t getStderrCapBytes() const;

    /**
     * @brief Apply a partial JSON document and notify observers of changed keys
     * @param patch Nested JSON object, e.g. {"limits": {"max_payload_bytes": 1024}}
     * @param source Tag copied into the published event
     * @return Keys whose value actually changed
     * @throws std::invalid_argument if the patch is not an object or the
     *         resulting configuration fails validation (nothing is applied)
     */
    std::vector<std::string> updateConfig(const nlohmann::json &patch, const std::string &source = "api");

    /**
     * @brief Pin values given on the command line
     *
     * Applied immediately and re-applied on top of every later file load,
     * so a reload never moves them. Cleared by resetToDefaults().
     */
    void applyCommandLineOverrides(const nlohmann::json &overrides);
    nlohmann::json getCommandLineOverrides() const;

    // Configuration file operations. A rejected file leaves every value as it was.
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;
    void resetToDefaults();

    bool validateConfig() const;

    // Runtime config file watching
    void startWatching(const std::string &file_path = "config.json", int interval_seconds = 2);
    void stopWatching();
    bool isWatching() const { return watching_.load(); }

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    // Flattens nested objects into "a.b.c" keys
    static std::map<std::string, nlohmann::json> flatten(const nlohmann::json &node);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    std::vector<std::string> diffKeys(const nlohmann::json &before, const nlohmann::json &after) const;
    void publishEvent(const ConfigUpdateEvent &event);
    std::string nextUpdateId();

    PocoConfigManager &poco_cfg_;

    mutable std::mutex overrides_mutex_;
    nlohmann::json overrides_ = nlohmann::json::object();

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
    std::atomic<unsigned long> update_counter_{0};

    // File watching internals
    std::atomic<bool> watching_{false};
    std::thread watcher_thread_;
    std::string watched_file_path_;
    int watch_interval_seconds_{2};
    std::filesystem::file_time_type last_write_time_{};
};
