#pragma once

#include <cstddef>

class ServerConfig
{
public:
    static constexpr const char *SERVICE_NAME = "voice-transcoder";
    static constexpr const char *SERVICE_VERSION = "1.0.0";

    static constexpr const char *ROOT_PATH = "/";
    static constexpr const char *CONVERT_PATH = "/convert";
    static constexpr const char *API_CONVERT_PATH = "/api/convert";
    static constexpr const char *STATUS_PATH = "/api/status";
    static constexpr const char *SWAGGER_JSON_PATH = "/swagger.json";

    static constexpr const char *MP3_CONTENT_TYPE = "audio/mpeg";
    static constexpr const char *REQUEST_ID_HEADER = "X-Request-Id";

    // Bodies up to max_payload_bytes + this slack reach the handler, which
    // answers 400; anything larger is refused by the HTTP library with 413.
    static constexpr size_t PAYLOAD_HARD_CAP_SLACK = 1024 * 1024;
};
