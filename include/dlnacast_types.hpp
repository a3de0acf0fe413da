#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <optional>
#include <chrono>

#include <nlohmann/json_fwd.hpp>

namespace dlnacast {

using SystemClock = std::chrono::system_clock;

// Per-device format support, derived from the ConnectionManager Sink list
struct Capabilities {
    bool supports_mp3 = false;
    bool supports_aac = false;
    bool supports_flac = false;
    bool supports_wav = false;
    bool supports_ogg = false;
    std::string raw_protocol_info;

    static constexpr const char* UNKNOWN_PROTOCOL_INFO = "unknown";

    bool isKnown() const {
        return !raw_protocol_info.empty() && raw_protocol_info != UNKNOWN_PROTOCOL_INFO;
    }

    bool operator==(const Capabilities& other) const;
    bool operator!=(const Capabilities& other) const { return !(*this == other); }
};

// DLNA media renderer
struct Device {
    std::string id;                     // UDN without "uuid:"
    std::string udn;
    std::string friendly_name;
    std::string manufacturer;
    std::string model_name;
    std::string ip;
    uint16_t port = 0;
    std::string location;               // description document URL
    std::string control_url;            // AVTransport
    std::string connection_manager_url; // ConnectionManager
    std::optional<Capabilities> capabilities;

    bool operator==(const Device& other) const;
    bool operator!=(const Device& other) const { return !(*this == other); }
};

// AVTransport GetTransportInfo result
struct TransportInfo {
    std::string state = "UNKNOWN";
    std::string status = "UNKNOWN";
};

// HTTP status codes
enum class HttpStatus {
    OK = 200,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

// HTTP request structure (API server side)
struct HTTPRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::map<std::string, std::string> queryParameters;
    std::string clientIP;
    std::string userAgent;
    SystemClock::time_point timestamp;
};

// HTTP response structure (API server side)
struct HTTPResponse {
    HttpStatus status = HttpStatus::OK;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string contentType = "application/json";
};

// JSON mapping
void to_json(nlohmann::json& j, const Capabilities& caps);
void from_json(const nlohmann::json& j, Capabilities& caps);
void to_json(nlohmann::json& j, const Device& device);
void from_json(const nlohmann::json& j, Device& device);
void to_json(nlohmann::json& j, const TransportInfo& info);

} // namespace dlnacast
