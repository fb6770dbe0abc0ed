#pragma once

#include "core/config_observer.hpp"

/**
 * @brief Applies log_level changes to the process-wide logger
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;
};
