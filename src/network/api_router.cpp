#include "api_router.hpp"
#include "network/validation.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

#ifndef DLNACAST_VERSION
#define DLNACAST_VERSION "1.0.0"
#endif

using json = nlohmann::json;

namespace dlnacast {
namespace network {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> findHeader(const HTTPRequest& request, const std::string& name) {
    const std::string wanted = toLower(name);
    for (const auto& header : request.headers) {
        if (toLower(header.first) == wanted) {
            return header.second;
        }
    }
    return std::nullopt;
}

std::optional<std::string> queryParam(const HTTPRequest& request, const std::string& name) {
    auto it = request.queryParameters.find(name);
    if (it == request.queryParameters.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<int> parseInteger(const std::string& value) {
    if (value.empty() || value.size() > 9) {
        return std::nullopt;
    }
    size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (start == value.size()) {
        return std::nullopt;
    }
    for (size_t i = start; i < value.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return std::nullopt;
        }
    }
    return std::atoi(value.c_str());
}

json publicDeviceJson(const Device& device) {
    return json{
        {"id", device.id},
        {"friendly_name", device.friendly_name},
        {"manufacturer", device.manufacturer},
        {"model_name", device.model_name},
        {"ip", device.ip},
        {"capabilities", device.capabilities ? json(*device.capabilities) : json::object()}
    };
}

} // namespace

// RateLimiter implementation

RateLimiter::RateLimiter(uint32_t limit, double windowSeconds, WallClock clock)
    : limit_(limit)
    , windowSeconds_(windowSeconds)
    , clock_(clock ? std::move(clock) : systemWallClock()) {
}

bool RateLimiter::parseLimit(const std::string& text, uint32_t& limit, double& windowSeconds) {
    std::istringstream stream(toLower(text));
    long count = 0;
    std::string per;
    std::string unit;
    if (!(stream >> count >> per >> unit) || count <= 0 || per != "per") {
        return false;
    }

    if (!unit.empty() && unit.back() == 's') {
        unit.pop_back();
    }

    if (unit == "second") {
        windowSeconds = 1.0;
    } else if (unit == "minute") {
        windowSeconds = 60.0;
    } else if (unit == "hour") {
        windowSeconds = 3600.0;
    } else if (unit == "day") {
        windowSeconds = 86400.0;
    } else {
        return false;
    }

    limit = static_cast<uint32_t>(count);
    return true;
}

bool RateLimiter::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = clock_();

    Window& window = windows_[key];
    if (window.count == 0 || now - window.start >= windowSeconds_) {
        window.start = now;
        window.count = 0;
    }

    if (window.count >= limit_) {
        return false;
    }
    ++window.count;
    return true;
}

// ApiRouter implementation

BuildInfo ApiRouter::defaultBuildInfo() {
    BuildInfo info;
    info.version = DLNACAST_VERSION;
    if (const char* hash = std::getenv("BUILD_HASH")) {
        info.buildHash = hash;
    }
    if (const char* date = std::getenv("BUILD_DATE")) {
        info.buildDate = date;
    }
    return info;
}

ApiRouter::ApiRouter(const Configuration& config, core::PlaybackOrchestrator& orchestrator,
                     core::StreamFormatCache& formatCache, const BuildInfo& buildInfo, WallClock clock)
    : config_(config)
    , orchestrator_(orchestrator)
    , formatCache_(formatCache)
    , buildInfo_(buildInfo) {
    if (buildInfo_.version.empty()) {
        buildInfo_.version = DLNACAST_VERSION;
    }

    if (config_.security.rateLimitEnabled) {
        uint32_t limit = 0;
        double window = 0.0;
        if (RateLimiter::parseLimit(config_.security.rateLimitDefault, limit, window)) {
            rateLimiter_ = std::make_unique<RateLimiter>(limit, window, std::move(clock));
            Logger::info("ApiRouter: Rate limiting enabled: {}", config_.security.rateLimitDefault);
        } else {
            Logger::warning("ApiRouter: Invalid rate limit '{}', rate limiting disabled",
                            config_.security.rateLimitDefault);
        }
    } else {
        Logger::info("ApiRouter: Rate limiting is disabled");
    }

    registerRoutes();
}

void ApiRouter::registerRoutes() {
    auto bind = [this](HTTPResponse (ApiRouter::*method)(const HTTPRequest&)) {
        return [this, method](const HTTPRequest& request) { return (this->*method)(request); };
    };

    routes_["/"].methods["GET"] = bind(&ApiRouter::handleIndex);
    routes_["/health"].methods["GET"] = bind(&ApiRouter::handleHealth);
    routes_["/devices"].methods["GET"] = bind(&ApiRouter::handleDevices);
    routes_["/devices/current"].methods["GET"] = bind(&ApiRouter::handleDeviceCurrent);
    routes_["/status"].methods["GET"] = bind(&ApiRouter::handleStatus);
    routes_["/streams/cached"].methods["GET"] = bind(&ApiRouter::handleStreamsCached);

    routes_["/devices/select"].methods["POST"] = bind(&ApiRouter::handleDeviceSelect);
    routes_["/devices/select"].requiresAuth = true;
    routes_["/play"].methods["POST"] = bind(&ApiRouter::handlePlay);
    routes_["/play"].requiresAuth = true;
    routes_["/stop"].methods["POST"] = bind(&ApiRouter::handleStop);
    routes_["/stop"].requiresAuth = true;
}

HTTPResponse ApiRouter::handle(const HTTPRequest& request) {
    try {
        return dispatch(request);
    } catch (const std::exception& e) {
        Logger::error("ApiRouter: Unhandled error on {} {}: {}", request.method, request.path, e.what());
        return createJsonResponse(HttpStatus::INTERNAL_ERROR, json{
            {"error", "Internal Server Error"},
            {"message", "An unexpected error occurred"}
        });
    }
}

HTTPResponse ApiRouter::dispatch(const HTTPRequest& request) {
    auto route = routes_.find(request.path);
    if (route == routes_.end()) {
        return createMessageResponse(HttpStatus::NOT_FOUND, "The requested endpoint does not exist");
    }

    auto handler = route->second.methods.find(request.method);
    if (handler == route->second.methods.end()) {
        return createMessageResponse(HttpStatus::METHOD_NOT_ALLOWED,
                                     "The method is not allowed for the requested endpoint");
    }

    if (rateLimiter_ && request.path != "/health" && !rateLimiter_->allow(request.clientIP)) {
        Logger::warning("ApiRouter: Rate limit exceeded for {}", request.clientIP);
        return createJsonResponse(HttpStatus::TOO_MANY_REQUESTS, json{
            {"error", "Too Many Requests"},
            {"message", "Rate limit exceeded: " + config_.security.rateLimitDefault}
        });
    }

    if (route->second.requiresAuth) {
        if (auto rejected = checkApiKey(request)) {
            return *rejected;
        }
    }

    return handler->second(request);
}

std::optional<HTTPResponse> ApiRouter::checkApiKey(const HTTPRequest& request) const {
    if (!config_.security.apiAuthEnabled) {
        return std::nullopt;
    }

    auto provided = findHeader(request, "X-API-Key");
    if (!provided || provided->empty()) {
        Logger::warning("ApiRouter: API request without key from {}", request.clientIP);
        return createJsonResponse(HttpStatus::UNAUTHORIZED, json{
            {"error", "API key required"},
            {"message", "Please provide X-API-Key header"}
        });
    }

    if (!constantTimeEquals(*provided, config_.security.apiKey)) {
        Logger::warning("ApiRouter: Invalid API key from {}", request.clientIP);
        return createErrorResponse(HttpStatus::FORBIDDEN, "Invalid API key");
    }
    return std::nullopt;
}

HTTPResponse ApiRouter::handleIndex(const HTTPRequest&) {
    return createJsonResponse(HttpStatus::OK, json{
        {"name", buildInfo_.name},
        {"version", buildInfo_.version},
        {"build_hash", buildInfo_.buildHash},
        {"build_date", buildInfo_.buildDate}
    });
}

HTTPResponse ApiRouter::handleHealth(const HTTPRequest&) {
    return createJsonResponse(HttpStatus::OK, json{
        {"status", "ok"},
        {"streaming", orchestrator_.isStreaming()}
    });
}

HTTPResponse ApiRouter::handleDevices(const HTTPRequest& request) {
    const std::string forceScanParam = queryParam(request, "force_scan").value_or("false");
    if (!validateBooleanString(forceScanParam)) {
        return createMessageResponse(HttpStatus::BAD_REQUEST,
                                     "force_scan must be \"true\" or \"false\", got: " + forceScanParam);
    }
    const bool forceScan = forceScanParam == "true";

    int timeout = DEFAULT_SCAN_TIMEOUT;
    if (auto timeoutParam = queryParam(request, "timeout")) {
        auto parsed = parseInteger(*timeoutParam);
        if (!parsed) {
            return createMessageResponse(HttpStatus::BAD_REQUEST, "timeout must be an integer, got: " + *timeoutParam);
        }
        timeout = std::min(std::max(*parsed, MIN_SCAN_TIMEOUT), MAX_SCAN_TIMEOUT);
    }

    core::DeviceListing listing = orchestrator_.listDevices(forceScan, static_cast<double>(timeout));

    return createJsonResponse(HttpStatus::OK, json{
        {"devices", listing.devices},
        {"count", listing.devices.size()},
        {"cache_age_seconds", listing.cache_age_seconds ? json(*listing.cache_age_seconds) : json(nullptr)}
    });
}

HTTPResponse ApiRouter::handleDeviceSelect(const HTTPRequest& request) {
    auto ip = queryParam(request, "ip");
    if (!ip || ip->empty()) {
        return createMessageResponse(HttpStatus::BAD_REQUEST, "ip parameter is required");
    }

    // Rejected before any network call is made
    if (!validateIpAddress(*ip)) {
        return createMessageResponse(HttpStatus::BAD_REQUEST, "Invalid IP address format: " + *ip);
    }

    core::SelectResult result = orchestrator_.selectDevice(*ip);
    if (!result.ok) {
        if (result.status == HttpStatus::NOT_FOUND) {
            return createMessageResponse(result.status, result.error);
        }
        return createErrorResponse(result.status, result.error);
    }

    return createJsonResponse(HttpStatus::OK, json{
        {"status", "selected"},
        {"device", publicDeviceJson(*result.device)}
    });
}

HTTPResponse ApiRouter::handleDeviceCurrent(const HTTPRequest&) {
    auto device = orchestrator_.currentDevice();
    if (!device) {
        return createJsonResponse(HttpStatus::OK, json{
            {"device", nullptr},
            {"message", "No device selected"}
        });
    }
    return createJsonResponse(HttpStatus::OK, json{{"device", publicDeviceJson(*device)}});
}

HTTPResponse ApiRouter::handlePlay(const HTTPRequest& request) {
    const std::string streamUrl = queryParam(request, "streamUrl").value_or(config_.defaultRadioUrl);
    if (streamUrl.empty()) {
        return createMessageResponse(HttpStatus::BAD_REQUEST, "No stream URL provided and no default configured");
    }

    if (!validateStreamUrl(streamUrl)) {
        return createMessageResponse(HttpStatus::BAD_REQUEST, "Invalid stream URL format: " + streamUrl);
    }

    core::PlayResult result = orchestrator_.play(streamUrl);
    if (!result.ok) {
        if (result.status == HttpStatus::BAD_REQUEST) {
            return createMessageResponse(result.status, result.error);
        }
        return createErrorResponse(result.status, result.error);
    }

    return createJsonResponse(HttpStatus::OK, json{
        {"status", "playing"},
        {"stream_url", result.stream_url},
        {"playback_url", result.playback_url},
        {"transcoding", result.transcoding},
        {"format", result.format ? json(*result.format) : json(nullptr)}
    });
}

HTTPResponse ApiRouter::handleStop(const HTTPRequest&) {
    orchestrator_.stop();
    return createJsonResponse(HttpStatus::OK, json{{"status", "stopped"}});
}

HTTPResponse ApiRouter::handleStatus(const HTTPRequest&) {
    core::StatusReport report = orchestrator_.status();

    json currentDevice = nullptr;
    if (report.current_device) {
        currentDevice = json{
            {"friendly_name", report.current_device->friendly_name},
            {"ip", report.current_device->ip}
        };
    }

    return createJsonResponse(HttpStatus::OK, json{
        {"streaming", report.streaming},
        {"dlna", report.dlna ? json(*report.dlna) : json(nullptr)},
        {"current_device", currentDevice}
    });
}

HTTPResponse ApiRouter::handleStreamsCached(const HTTPRequest&) {
    json streams = json::array();
    for (const auto& entry : formatCache_.entries()) {
        streams.push_back(json{
            {"url", entry.url},
            {"mime_type", entry.mime_type},
            {"detection_method", entry.detection_method}
        });
    }

    const size_t count = streams.size();
    return createJsonResponse(HttpStatus::OK, json{
        {"streams", std::move(streams)},
        {"count", count}
    });
}

HTTPResponse ApiRouter::createJsonResponse(HttpStatus status, const json& body) {
    HTTPResponse response;
    response.status = status;
    response.contentType = "application/json";
    // Echoed parameters may carry invalid UTF-8
    response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return response;
}

HTTPResponse ApiRouter::createMessageResponse(HttpStatus status, const std::string& message) {
    return createJsonResponse(status, json{{"message", message}});
}

HTTPResponse ApiRouter::createErrorResponse(HttpStatus status, const std::string& error) {
    return createJsonResponse(status, json{{"error", error}});
}

} // namespace network
} // namespace dlnacast
