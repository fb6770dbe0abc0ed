#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <limits>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *const DEFAULT_CONFIG = R"({
        "log_level": "INFO",
        "server_host": "0.0.0.0",
        "server_port": 8080,
        "temp_root": "",
        "encoder_binary": "ffmpeg",
        "mp3_bitrate": "128k",
        "limits": {
            "max_payload_bytes": 20971520,
            "conversion_timeout_seconds": 60,
            "max_concurrent_conversions": 4,
            "stderr_cap_bytes": 65536
        },
        "threading": {
            "http_server_threads": 8
        }
    })";
}

PocoConfigManager::PocoConfigManager()
{
    initializeDefaultConfig();
}

nlohmann::json PocoConfigManager::defaults()
{
    return nlohmann::json::parse(DEFAULT_CONFIG);
}

AutoPtr<JSONConfiguration> PocoConfigManager::buildTree(const nlohmann::json &tree)
{
    std::istringstream in(tree.dump());
    AutoPtr<JSONConfiguration> cfg = new JSONConfiguration();
    cfg->load(in);
    return cfg;
}

void PocoConfigManager::initializeDefaultConfig()
{
    cfg_ = buildTree(defaults());
}

void PocoConfigManager::resetToDefaults()
{
    std::lock_guard<std::mutex> lock(mutex_);
    initializeDefaultConfig();
}

nlohmann::json PocoConfigManager::overlay(nlohmann::json base, const nlohmann::json &patch)
{
    if (!patch.is_object())
        return base;
    if (!base.is_object())
        base = nlohmann::json::object();

    for (auto it = patch.begin(); it != patch.end(); ++it)
    {
        if (it.value().is_null())
            continue;
        auto existing = base.find(it.key());
        if (it.value().is_object() && existing != base.end() && existing->is_object())
            *existing = overlay(*existing, it.value());
        else
            base[it.key()] = it.value();
    }
    return base;
}

bool PocoConfigManager::load(const std::string &path, const nlohmann::json &overrides)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json loaded;
    try
    {
        loaded = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.what());
        return false;
    }
    if (!loaded.is_object())
    {
        Logger::error("Configuration file " + path + " must contain a JSON object");
        return false;
    }

    // Missing keys keep their defaults
    const nlohmann::json candidate = overlay(overlay(defaults(), loaded), overrides);
    if (!validateTree(candidate))
    {
        Logger::error("Configuration file " + path + " rejected, keeping current settings");
        return false;
    }

    AutoPtr<JSONConfiguration> next = buildTree(candidate);
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = next;
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::snapshotLocked() const
{
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

bool PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const nlohmann::json candidate = overlay(snapshotLocked(), patch);
    if (!validateTree(candidate))
        return false;
    cfg_ = buildTree(candidate);
    return true;
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 8080);
}

int PocoConfigManager::getHttpServerThreads() const
{
    return getInt("threading.http_server_threads", 8);
}

std::string PocoConfigManager::getTempRoot() const
{
    std::string root = getString("temp_root", "");
    if (root.empty())
    {
        root = (std::filesystem::temp_directory_path() / "voice_transcoder").string();
    }
    return root;
}

std::string PocoConfigManager::getEncoderBinary() const
{
    return getString("encoder_binary", "ffmpeg");
}

std::string PocoConfigManager::getMp3Bitrate() const
{
    return getString("mp3_bitrate", "128k");
}

int PocoConfigManager::getMaxPayloadBytes() const
{
    return getInt("limits.max_payload_bytes", 20 * 1024 * 1024);
}

int PocoConfigManager::getConversionTimeoutSeconds() const
{
    return getInt("limits.conversion_timeout_seconds", 60);
}

int PocoConfigManager::getMaxConcurrentConversions() const
{
    return getInt("limits.max_concurrent_conversions", 4);
}

int PocoConfigManager::getStderrCapBytes() const
{
    return getInt("limits.stderr_cap_bytes", 64 * 1024);
}

namespace
{
    const nlohmann::json *lookup(const nlohmann::json &tree, const std::string &dotted)
    {
        const nlohmann::json *node = &tree;
        std::size_t begin = 0;
        while (true)
        {
            const std::size_t dot = dotted.find('.', begin);
            const std::string part = dotted.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
            if (!node->is_object())
                return nullptr;
            auto it = node->find(part);
            if (it == node->end())
                return nullptr;
            node = &*it;
            if (dot == std::string::npos)
                return node;
            begin = dot + 1;
        }
    }

    bool checkInt(const nlohmann::json &tree, const std::string &key, std::int64_t min, std::int64_t max)
    {
        const nlohmann::json *value = lookup(tree, key);
        if (!value || !value->is_number_integer())
        {
            Logger::error("Invalid value for " + key + ": expected an integer");
            return false;
        }
        // Unsigned values above INT64_MAX are out of range regardless
        if (value->is_number_unsigned() && value->get<std::uint64_t>() > static_cast<std::uint64_t>(max))
        {
            Logger::error("Invalid value for " + key + ": " + value->dump());
            return false;
        }
        const std::int64_t v = value->get<std::int64_t>();
        if (v < min || v > max)
        {
            Logger::error("Invalid value for " + key + ": " + value->dump());
            return false;
        }
        return true;
    }

    bool checkString(const nlohmann::json &tree, const std::string &key, bool allow_empty)
    {
        const nlohmann::json *value = lookup(tree, key);
        if (!value || !value->is_string() || (!allow_empty && value->get<std::string>().empty()))
        {
            Logger::error(key + " must be a" + std::string(allow_empty ? "" : " non-empty") + " string");
            return false;
        }
        return true;
    }
}

bool PocoConfigManager::validateTree(const nlohmann::json &tree)
{
    if (!checkInt(tree, "server_port", 1, 65535))
        return false;

    if (!checkString(tree, "log_level", false))
        return false;
    const std::string level = lookup(tree, "log_level")->get<std::string>();
    if (!Logger::isValidLevel(level))
    {
        Logger::error("Invalid log level: " + level);
        return false;
    }

    if (!checkString(tree, "server_host", false) ||
        !checkString(tree, "encoder_binary", false) ||
        !checkString(tree, "mp3_bitrate", false) ||
        !checkString(tree, "temp_root", true))
        return false;

    const int max_int = std::numeric_limits<int>::max();
    for (const char *key : {"limits.max_payload_bytes",
                            "limits.conversion_timeout_seconds",
                            "limits.max_concurrent_conversions",
                            "limits.stderr_cap_bytes",
                            "threading.http_server_threads"})
    {
        if (!checkInt(tree, key, 1, max_int))
            return false;
    }

    return true;
}

bool PocoConfigManager::validateConfig() const
{
    return validateTree(getAll());
}
