#include "core/conversion_handler.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace
{
    bool startsWith(const std::string &value, const std::string &prefix)
    {
        return value.compare(0, prefix.size(), prefix) == 0;
    }
}

const char *toString(ConversionState state)
{
    switch (state)
    {
    case ConversionState::Received:
        return "Received";
    case ConversionState::Validated:
        return "Validated";
    case ConversionState::Staged:
        return "Staged";
    case ConversionState::Converted:
        return "Converted";
    case ConversionState::Completed:
        return "Completed";
    case ConversionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

ConversionHandler::Settings ConversionHandler::Settings::fromConfig(const PocoConfigAdapter &config)
{
    Settings settings;
    settings.max_payload_bytes = config.getMaxPayloadBytes();
    settings.max_concurrent_conversions = static_cast<size_t>(std::max(1, config.getMaxConcurrentConversions()));
    settings.invoker.encoder_binary = config.getEncoderBinary();
    settings.invoker.bitrate = config.getMp3Bitrate();
    settings.invoker.timeout = std::chrono::seconds(config.getConversionTimeoutSeconds());
    settings.invoker.stderr_cap_bytes = config.getStderrCapBytes();
    return settings;
}

ConversionHandler::ConversionHandler(WorkspaceManager &workspaces, Settings settings)
    : workspaces_(workspaces),
      settings_(std::move(settings)),
      limiter_(settings_.max_concurrent_conversions),
      rng_(std::random_device{}())
{
}

std::string ConversionHandler::nextRequestId()
{
    uint32_t token;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        token = static_cast<uint32_t>(rng_());
    }
    std::ostringstream id;
    id << "req-" << ++request_counter_ << "-" << std::hex << std::setw(8) << std::setfill('0') << token;
    return id.str();
}

std::string ConversionHandler::publicMessage(ConversionErrorKind kind)
{
    switch (kind)
    {
    case ConversionErrorKind::InvalidInput:
        return "Request body is empty or not an accepted audio type";
    case ConversionErrorKind::PayloadTooLarge:
        return "Audio payload exceeds the maximum allowed size";
    case ConversionErrorKind::ConversionTimeout:
        return "Conversion timed out";
    case ConversionErrorKind::Busy:
        return "Too many conversions in progress, retry later";
    case ConversionErrorKind::ConversionFailed:
        return "Audio could not be converted";
    case ConversionErrorKind::ResourceExhausted:
    case ConversionErrorKind::IOFailure:
    case ConversionErrorKind::NotFound:
        return "Internal error during conversion";
    case ConversionErrorKind::None:
        break;
    }
    return "Unexpected error";
}

void ConversionHandler::updateSettings(const Settings &settings)
{
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_ = settings;
    }
    limiter_.setMaxInFlight(settings.max_concurrent_conversions);
}

ConversionHandler::Settings ConversionHandler::settings() const
{
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

void ConversionHandler::onConfigUpdate(const ConfigUpdateEvent &event)
{
    bool relevant = false;
    for (const auto &key : event.changed_keys)
    {
        if (startsWith(key, "limits.") || key == "encoder_binary" || key == "mp3_bitrate")
        {
            relevant = true;
        }
        else if (key == "temp_root")
        {
            Logger::warn("ConversionHandler: temp_root changes take effect after a restart");
        }
    }
    if (!relevant)
    {
        return;
    }

    try
    {
        auto updated = Settings::fromConfig(PocoConfigAdapter::getInstance());
        updateSettings(updated);
        Logger::info("ConversionHandler: limits updated - max_payload_bytes=" + std::to_string(updated.max_payload_bytes) +
                     ", timeout_ms=" + std::to_string(updated.invoker.timeout.count()) +
                     ", max_concurrent=" + std::to_string(updated.max_concurrent_conversions));
    }
    catch (const std::exception &e)
    {
        Logger::error("ConversionHandler: failed to apply configuration update: " + std::string(e.what()));
    }
}

void ConversionHandler::logTransition(const std::string &request_id, ConversionState state) const
{
    Logger::debug("[" + request_id + "] -> " + toString(state));
}

ConversionResult ConversionHandler::fail(const ConversionRequest &request, ConversionErrorKind kind,
                                         const std::string &diagnostic) const
{
    logTransition(request.request_id, ConversionState::Failed);
    const std::string line = "[" + request.request_id + "] conversion failed (" + toString(kind) + "): " + diagnostic;
    if (kind == ConversionErrorKind::InvalidInput || kind == ConversionErrorKind::PayloadTooLarge ||
        kind == ConversionErrorKind::Busy)
    {
        Logger::warn(line);
    }
    else
    {
        Logger::error(line);
    }
    return ConversionResult::failure(request.request_id, kind, publicMessage(kind), diagnostic);
}

ConversionResult ConversionHandler::handle(const ConversionRequest &request)
{
    const Settings current = settings();
    logTransition(request.request_id, ConversionState::Received);

    if (request.payload.empty())
    {
        return fail(request, ConversionErrorKind::InvalidInput, "empty payload");
    }
    if (request.payload.size() > current.max_payload_bytes)
    {
        return fail(request, ConversionErrorKind::PayloadTooLarge,
                    "payload of " + std::to_string(request.payload.size()) + " bytes exceeds limit of " +
                        std::to_string(current.max_payload_bytes));
    }

    auto slot = limiter_.tryAcquire();
    if (!slot)
    {
        return fail(request, ConversionErrorKind::Busy,
                    "concurrency cap of " + std::to_string(limiter_.maxInFlight()) + " reached");
    }

    const AudioFormat sniffed = request.sniffed_format;
    if (request.declared_format != AudioFormat::Unknown && sniffed == AudioFormat::Unknown)
    {
        Logger::debug("[" + request.request_id + "] declared " + toString(request.declared_format) +
                      " but payload has no Ogg signature; deferring to the encoder");
    }
    logTransition(request.request_id, ConversionState::Validated);

    try
    {
        WorkspaceGuard guard(workspaces_, workspaces_.acquire());
        const Workspace &workspace = guard.workspace();

        workspaces_.writeInput(workspace, request.payload);
        logTransition(request.request_id, ConversionState::Staged);

        TranscoderInvoker invoker(current.invoker);
        ++encoder_invocations_;
        InvocationOutcome outcome = invoker.convert(workspace.inputPath(), workspace.outputPath());

        switch (outcome.status)
        {
        case InvocationOutcome::Status::Timeout:
            return fail(request, ConversionErrorKind::ConversionTimeout,
                        "encoder killed after " + std::to_string(outcome.elapsed_ms) + " ms; stderr: " + outcome.stderr_text);
        case InvocationOutcome::Status::EncoderFailed:
            return fail(request, ConversionErrorKind::ConversionFailed,
                        "encoder exit=" + std::to_string(outcome.exit_code) + " signal=" +
                            std::to_string(outcome.term_signal) + "; stderr: " + outcome.stderr_text);
        case InvocationOutcome::Status::Success:
            break;
        }
        logTransition(request.request_id, ConversionState::Converted);

        std::vector<uint8_t> artifact = workspaces_.readOutput(workspace);
        if (artifact.empty())
        {
            return fail(request, ConversionErrorKind::ConversionFailed, "encoder exited 0 but wrote an empty file");
        }

        guard.release();
        logTransition(request.request_id, ConversionState::Completed);
        Logger::info("[" + request.request_id + "] converted " + std::to_string(request.payload.size()) + " bytes (" +
                     toString(sniffed) + ") to " + std::to_string(artifact.size()) + " bytes of mp3 in " +
                     std::to_string(outcome.elapsed_ms) + " ms");
        return ConversionResult::ok(request.request_id, std::move(artifact));
    }
    catch (const ConversionError &e)
    {
        return fail(request, e.kind(), e.what());
    }
    catch (const std::exception &e)
    {
        return fail(request, ConversionErrorKind::IOFailure, std::string("unexpected error: ") + e.what());
    }
}
