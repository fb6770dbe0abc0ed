#pragma once

#include <string>
#include "server_config.hpp"

class OpenApiDocs
{
public:
  static const std::string &getSpec()
  {
    static const std::string spec = R"({
  "openapi": "3.0.0",
  "info": {
    "title": "Voice Transcoder API",
    "version": ")" + std::string(ServerConfig::SERVICE_VERSION) +
                                    R"(",
    "description": "Converts Ogg/Opus voice recordings to MP3 using an external encoder"
  },
  "paths": {
    "/": {
      "get": {
        "summary": "Liveness probe",
        "tags": ["Health"],
        "responses": {
          "200": {
            "description": "Service is up",
            "content": {
              "application/json": {
                "schema": {
                  "type": "object",
                  "properties": {
                    "ok": {"type": "boolean"},
                    "service": {"type": "string"}
                  }
                }
              }
            }
          }
        }
      }
    },
    "/convert": {
      "post": {
        "summary": "Convert an Ogg/Opus upload to MP3",
        "description": "The raw request body is the audio file. The MP3 is returned inline.",
        "tags": ["Conversion"],
        "parameters": [
          {
            "name": "filename",
            "in": "query",
            "required": false,
            "schema": {"type": "string"},
            "description": "Base name used for the Content-Disposition of the result"
          }
        ],
        "requestBody": {
          "required": true,
          "content": {
            "audio/ogg": {"schema": {"type": "string", "format": "binary"}},
            "audio/opus": {"schema": {"type": "string", "format": "binary"}},
            "application/ogg": {"schema": {"type": "string", "format": "binary"}},
            "application/octet-stream": {"schema": {"type": "string", "format": "binary"}}
          }
        },
        "responses": {
          "200": {
            "description": "Converted audio",
            "content": {"audio/mpeg": {"schema": {"type": "string", "format": "binary"}}}
          },
          "400": {"description": "Empty body, unsupported content type or payload too large", "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Error"}}}},
          "413": {"description": "Body rejected by the HTTP layer before reaching the converter"},
          "500": {"description": "Conversion or storage failure", "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Error"}}}},
          "503": {"description": "Too many conversions in progress", "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Error"}}}},
          "504": {"description": "Encoder exceeded the conversion timeout", "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Error"}}}}
        }
      }
    },
    "/api/status": {
      "get": {
        "summary": "Conversion load and configured limits",
        "tags": ["Health"],
        "responses": {
          "200": {"description": "Status document", "content": {"application/json": {"schema": {"type": "object"}}}}
        }
      }
    }
  },
  "components": {
    "schemas": {
      "Error": {
        "type": "object",
        "properties": {
          "ok": {"type": "boolean"},
          "error": {"type": "string"},
          "message": {"type": "string"},
          "request_id": {"type": "string"}
        }
      }
    }
  }
})";
    return spec;
  }
};
