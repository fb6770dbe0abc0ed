#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe owner of the Poco JSON configuration tree.
 *
 * Every key has a built-in default, so getters never fail when a key is
 * missing from a loaded file.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Builds defaults + file + overrides, validates, then swaps it in whole.
    // The live tree is untouched when the file is unreadable or invalid.
    bool load(const std::string &path, const nlohmann::json &overrides = nlohmann::json::object());
    bool save(const std::string &path) const;

    // Drop everything and fall back to the built-in defaults
    void resetToDefaults();

    nlohmann::json getAll() const;

    // Applies the patch to a copy of the live tree and swaps it in only if
    // the result validates. Returns false and changes nothing otherwise.
    bool update(const nlohmann::json &patch);

    // Basic getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    bool hasKey(const std::string &key) const;

    // Server configuration getters
    std::string getLogLevel() const;
    std::string getServerHost() const;
    int getServerPort() const;
    int getHttpServerThreads() const;

    // Transcoding configuration getters
    std::string getTempRoot() const;
    std::string getEncoderBinary() const;
    std::string getMp3Bitrate() const;

    // Limits
    int getMaxPayloadBytes() const;
    int getConversionTimeoutSeconds() const;
    int getMaxConcurrentConversions() const;
    int getStderrCapBytes() const;

    bool validateConfig() const;

    // Checks a complete candidate tree (types and ranges), logging the first problem
    static bool validateTree(const nlohmann::json &tree);

    // Recursive merge; null values in the patch are ignored
    static nlohmann::json overlay(nlohmann::json base, const nlohmann::json &patch);

    static nlohmann::json defaults();

private:
    PocoConfigManager();
    void initializeDefaultConfig();
    nlohmann::json snapshotLocked() const;
    static Poco::AutoPtr<Poco::Util::JSONConfiguration> buildTree(const nlohmann::json &tree);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
