#pragma once

#include <algorithm>
#include <string>
#include <vector>

/**
 * @brief Configuration update event
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Dotted keys whose value changed, e.g. "limits.max_payload_bytes"
    std::string source;                    // "api", "cli" or "file_observer"
    std::string update_id;                 // Unique identifier to prevent feedback loops

    bool hasKey(const std::string &key) const
    {
        return std::find(changed_keys.begin(), changed_keys.end(), key) != changed_keys.end();
    }
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
