#pragma once

#include "core/config_observer.hpp"
#include "core/conversion_limiter.hpp"
#include "core/conversion_types.hpp"
#include "core/transcoder_invoker.hpp"
#include "core/workspace_manager.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

class PocoConfigAdapter;

/**
 * @brief Lifecycle of a single conversion, used for logging
 */
enum class ConversionState
{
    Received,
    Validated,
    Staged,
    Converted,
    Completed,
    Failed
};

const char *toString(ConversionState state);

/**
 * @brief Orchestrates one ogg/opus -> mp3 conversion end to end.
 *
 * Validates the payload, stages it into a fresh workspace, runs the encoder
 * and reads the artifact back. The workspace is released on every path
 * before handle() returns, and every failure below this layer is turned into
 * a ConversionResult rather than an exception.
 */
class ConversionHandler : public ConfigObserver
{
public:
    struct Settings
    {
        size_t max_payload_bytes = 20 * 1024 * 1024;
        size_t max_concurrent_conversions = 4;
        TranscoderInvoker::Options invoker;

        static Settings fromConfig(const PocoConfigAdapter &config);
    };

    ConversionHandler(WorkspaceManager &workspaces, Settings settings);

    /**
     * @brief Run a conversion; never throws for conversion failures
     */
    ConversionResult handle(const ConversionRequest &request);

    // "req-<n>-<hex>", unique within this handler
    std::string nextRequestId();

    // Short text safe to return to clients
    static std::string publicMessage(ConversionErrorKind kind);

    void updateSettings(const Settings &settings);
    Settings settings() const;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    const ConversionLimiter &limiter() const { return limiter_; }
    WorkspaceManager &workspaces() { return workspaces_; }
    uint64_t encoderInvocations() const { return encoder_invocations_.load(); }

private:
    ConversionResult fail(const ConversionRequest &request, ConversionErrorKind kind, const std::string &diagnostic) const;
    void logTransition(const std::string &request_id, ConversionState state) const;

    WorkspaceManager &workspaces_;

    mutable std::mutex settings_mutex_;
    Settings settings_;

    ConversionLimiter limiter_;
    std::atomic<uint64_t> request_counter_{0};
    std::atomic<uint64_t> encoder_invocations_{0};
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};
