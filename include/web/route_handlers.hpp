#pragma once

#include "core/conversion_handler.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/openapi_docs.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

using json = nlohmann::json;

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, ConversionHandler &handler)
    {
        const auto started = std::chrono::steady_clock::now();

        svr.Get(ServerConfig::ROOT_PATH, [](const httplib::Request &, httplib::Response &res)
                { res.set_content(json{{"ok", true}, {"service", ServerConfig::SERVICE_NAME}}.dump(), "application/json"); });

        svr.Post(ServerConfig::CONVERT_PATH, [&handler](const httplib::Request &req, httplib::Response &res)
                 { handleConvert(req, res, handler); });

        svr.Post(ServerConfig::API_CONVERT_PATH, [&handler](const httplib::Request &req, httplib::Response &res)
                 { handleConvert(req, res, handler); });

        svr.Get(ServerConfig::STATUS_PATH, [&handler, started](const httplib::Request &req, httplib::Response &res)
                { handleStatus(req, res, handler, started); });

        svr.Get(ServerConfig::SWAGGER_JSON_PATH, [](const httplib::Request &, httplib::Response &res)
                { res.set_content(OpenApiDocs::getSpec(), "application/json"); });

        svr.set_error_handler([](const httplib::Request &req, httplib::Response &res)
                              { handleHttpError(req, res); });

        // Anything thrown past a handler still gets a sanitized body
        svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                  {
            std::string detail = "unknown exception";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception &e) {
                detail = e.what();
            } catch (...) {
                detail = "non-standard exception";
            }
            Logger::error("Unhandled exception on " + req.method + " " + req.path + ": " + detail);
            res.status = 500;
            res.set_content(json{{"ok", false}, {"error", "InternalError"}, {"message", "Internal server error"}}.dump(),
                            "application/json"); });
    }

    /**
     * @brief Rewrites statuses produced by the HTTP layer itself
     *
     * Bodies above the listener's hard cap are refused before any handler
     * runs. They get the same 400 PayloadTooLarge answer as bodies the
     * conversion handler rejects. Other statuses pass through untouched.
     */
    static void handleHttpError(const httplib::Request &req, httplib::Response &res)
    {
        if (res.status != 413)
        {
            return;
        }
        Logger::warn("Rejected " + req.method + " " + req.path + ": body exceeds the listener payload cap");
        res.status = statusFor(ConversionErrorKind::PayloadTooLarge);
        res.set_content(json{{"ok", false},
                             {"error", toString(ConversionErrorKind::PayloadTooLarge)},
                             {"message", ConversionHandler::publicMessage(ConversionErrorKind::PayloadTooLarge)}}
                            .dump(),
                        "application/json");
    }

    /**
     * @brief HTTP status for a handler failure kind
     */
    static int statusFor(ConversionErrorKind kind)
    {
        switch (kind)
        {
        case ConversionErrorKind::None:
            return 200;
        case ConversionErrorKind::InvalidInput:
        case ConversionErrorKind::PayloadTooLarge:
            return 400;
        case ConversionErrorKind::ConversionTimeout:
            return 504;
        case ConversionErrorKind::Busy:
            return 503;
        case ConversionErrorKind::ConversionFailed:
        case ConversionErrorKind::ResourceExhausted:
        case ConversionErrorKind::IOFailure:
        case ConversionErrorKind::NotFound:
            return 500;
        }
        return 500;
    }

    /**
     * @brief Map a Content-Type header to a declared format
     * @return false when the type is present but not one we accept
     */
    static bool parseContentType(const std::string &header, AudioFormat &format)
    {
        std::string media_type = header.substr(0, header.find(';'));
        media_type.erase(std::remove_if(media_type.begin(), media_type.end(),
                                        [](unsigned char c)
                                        { return std::isspace(c); }),
                         media_type.end());
        std::transform(media_type.begin(), media_type.end(), media_type.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (media_type == "audio/ogg" || media_type == "application/ogg")
        {
            format = AudioFormat::Ogg;
            return true;
        }
        if (media_type == "audio/opus")
        {
            format = AudioFormat::Opus;
            return true;
        }
        if (media_type.empty() || media_type == "application/octet-stream")
        {
            format = AudioFormat::Unknown;
            return true;
        }
        return false;
    }

    // Keeps [A-Za-z0-9_-] of the last path component, drops any extension, falls back to "converted"
    static std::string downloadName(const std::string &requested)
    {
        const size_t slash = requested.find_last_of("/\\");
        std::string base = slash == std::string::npos ? requested : requested.substr(slash + 1);
        base = base.substr(0, base.rfind('.'));
        std::string clean;
        for (char c : base)
        {
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')
            {
                clean.push_back(c);
            }
        }
        if (clean.size() > 64)
        {
            clean.resize(64);
        }
        return clean.empty() ? "converted" : clean;
    }

private:
    static void sendError(httplib::Response &res, const ConversionResult &result)
    {
        res.status = statusFor(result.error_kind);
        res.set_header(ServerConfig::REQUEST_ID_HEADER, result.request_id);
        json body = {
            {"ok", false},
            {"error", toString(result.error_kind)},
            {"message", result.error_message},
            {"request_id", result.request_id}};
        res.set_content(body.dump(), "application/json");
    }

    static void handleConvert(const httplib::Request &req, httplib::Response &res, ConversionHandler &handler)
    {
        const std::string request_id = handler.nextRequestId();
        Logger::trace("Received convert request " + request_id + " (" + std::to_string(req.body.size()) + " bytes)");

        try
        {
            AudioFormat declared = AudioFormat::Unknown;
            const std::string content_type = req.get_header_value("Content-Type");
            if (!parseContentType(content_type, declared))
            {
                Logger::warn("[" + request_id + "] rejected content type: " + content_type);
                sendError(res, ConversionResult::failure(request_id, ConversionErrorKind::InvalidInput,
                                                         ConversionHandler::publicMessage(ConversionErrorKind::InvalidInput)));
                return;
            }

            const std::string name = downloadName(req.get_param_value("filename"));
            ConversionRequest request(request_id, req.body, declared, name);
            ConversionResult result = handler.handle(request);

            if (!result.success)
            {
                sendError(res, result);
                return;
            }

            res.status = 200;
            res.set_header(ServerConfig::REQUEST_ID_HEADER, request_id);
            res.set_header("Content-Disposition", "attachment; filename=\"" + name + ".mp3\"");
            res.set_content(std::string(result.artifact.begin(), result.artifact.end()), ServerConfig::MP3_CONTENT_TYPE);
        }
        catch (const std::exception &e)
        {
            Logger::error("[" + request_id + "] convert endpoint error: " + std::string(e.what()));
            sendError(res, ConversionResult::failure(request_id, ConversionErrorKind::IOFailure,
                                                     ConversionHandler::publicMessage(ConversionErrorKind::IOFailure)));
        }
    }

    static void handleStatus(const httplib::Request &, httplib::Response &res, ConversionHandler &handler,
                             std::chrono::steady_clock::time_point started)
    {
        try
        {
            const auto settings = handler.settings();
            const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started);

            json response = {
                {"ok", true},
                {"service", ServerConfig::SERVICE_NAME},
                {"version", ServerConfig::SERVICE_VERSION},
                {"uptime_seconds", uptime.count()},
                {"conversions", {{"in_flight", handler.limiter().inFlight()}, {"max_concurrent", handler.limiter().maxInFlight()}, {"encoder_invocations", handler.encoderInvocations()}}},
                {"workspaces", {{"live", handler.workspaces().liveCount()}, {"acquired", handler.workspaces().acquiredCount()}, {"released", handler.workspaces().releasedCount()}}},
                {"limits", {{"max_payload_bytes", settings.max_payload_bytes}, {"conversion_timeout_ms", settings.invoker.timeout.count()}, {"stderr_cap_bytes", settings.invoker.stderr_cap_bytes}}}};

            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Status endpoint error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"ok", false}, {"error", "InternalError"}, {"message", "Status unavailable"}}.dump(), "application/json");
        }
    }
};
