#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Failure taxonomy shared by the workspace, invoker and handler layers
 */
enum class ConversionErrorKind
{
    None,
    InvalidInput,
    PayloadTooLarge,
    ResourceExhausted,
    IOFailure,
    NotFound,
    ConversionTimeout,
    ConversionFailed,
    Busy
};

inline const char *toString(ConversionErrorKind kind)
{
    switch (kind)
    {
    case ConversionErrorKind::None:
        return "None";
    case ConversionErrorKind::InvalidInput:
        return "InvalidInput";
    case ConversionErrorKind::PayloadTooLarge:
        return "PayloadTooLarge";
    case ConversionErrorKind::ResourceExhausted:
        return "ResourceExhausted";
    case ConversionErrorKind::IOFailure:
        return "IOFailure";
    case ConversionErrorKind::NotFound:
        return "NotFound";
    case ConversionErrorKind::ConversionTimeout:
        return "ConversionTimeout";
    case ConversionErrorKind::ConversionFailed:
        return "ConversionFailed";
    case ConversionErrorKind::Busy:
        return "Busy";
    }
    return "Unknown";
}

/**
 * @brief Thrown by the workspace layer; caught at the handler boundary
 */
class ConversionError : public std::runtime_error
{
public:
    ConversionError(ConversionErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ConversionErrorKind kind() const noexcept { return kind_; }

private:
    ConversionErrorKind kind_;
};

/**
 * @brief Source format derived from the Content-Type header or payload magic
 */
enum class AudioFormat
{
    Unknown,
    Ogg,
    Opus
};

inline const char *toString(AudioFormat format)
{
    switch (format)
    {
    case AudioFormat::Ogg:
        return "ogg";
    case AudioFormat::Opus:
        return "opus";
    case AudioFormat::Unknown:
        break;
    }
    return "unknown";
}

/**
 * @brief Guess the container from leading bytes ("OggS", then "OpusHead" in the first page)
 */
inline AudioFormat sniffAudioFormat(const std::string &payload)
{
    if (payload.compare(0, 4, "OggS") != 0)
    {
        return AudioFormat::Unknown;
    }
    if (payload.find("OpusHead", 0) < 512)
    {
        return AudioFormat::Opus;
    }
    return AudioFormat::Ogg;
}

/**
 * @brief One inbound conversion, immutable after construction
 *
 * Carries both the format the client declared and the one sniffed from the
 * payload; the two may disagree.
 */
struct ConversionRequest
{
    std::string request_id;
    std::string payload;
    AudioFormat declared_format;
    AudioFormat sniffed_format;
    std::string original_name; // Base name for the download, without extension

    ConversionRequest() : declared_format(AudioFormat::Unknown), sniffed_format(AudioFormat::Unknown) {}
    ConversionRequest(std::string id, std::string data, AudioFormat declared = AudioFormat::Unknown, std::string name = "")
        : request_id(std::move(id)), payload(std::move(data)), declared_format(declared),
          sniffed_format(sniffAudioFormat(payload)), original_name(std::move(name)) {}
};

/**
 * @brief Outcome of one conversion: either the mp3 bytes or a failure descriptor
 *
 * error_message is safe to show to a client; diagnostic is for server logs only.
 */
struct ConversionResult
{
    bool success;
    std::string request_id;
    std::vector<uint8_t> artifact;
    ConversionErrorKind error_kind;
    std::string error_message;
    std::string diagnostic;

    ConversionResult() : success(false), error_kind(ConversionErrorKind::None) {}

    static ConversionResult ok(const std::string &id, std::vector<uint8_t> data)
    {
        ConversionResult result;
        result.success = true;
        result.request_id = id;
        result.artifact = std::move(data);
        return result;
    }

    static ConversionResult failure(const std::string &id, ConversionErrorKind kind,
                                    const std::string &message, const std::string &diagnostic = "")
    {
        ConversionResult result;
        result.request_id = id;
        result.error_kind = kind;
        result.error_message = message;
        result.diagnostic = diagnostic;
        return result;
    }

    size_t size() const { return artifact.size(); }
};
