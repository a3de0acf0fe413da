#pragma once

#include "dlnacast_types.hpp"
#include "core/playback_orchestrator.hpp"
#include "core/stream_format_cache.hpp"
#include "../utils/config_manager.hpp"
#include "../utils/json_store.hpp"

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>

#include <nlohmann/json_fwd.hpp>

namespace dlnacast {
namespace network {

/**
 * @brief Fixed-window request limiter keyed by client address
 */
class RateLimiter {
public:
    RateLimiter(uint32_t limit, double windowSeconds, WallClock clock = systemWallClock());

    // "<N> per <second|minute|hour|day>"
    static bool parseLimit(const std::string& text, uint32_t& limit, double& windowSeconds);

    bool allow(const std::string& key);

    uint32_t limit() const { return limit_; }
    double windowSeconds() const { return windowSeconds_; }

private:
    struct Window {
        double start = 0.0;
        uint32_t count = 0;
    };

    uint32_t limit_;
    double windowSeconds_;
    WallClock clock_;
    std::mutex mutex_;
    std::map<std::string, Window> windows_;
};

struct BuildInfo {
    std::string name = "dlnacast";
    std::string version;
    std::string buildHash = "dev";
    std::string buildDate = "unknown";
};

/**
 * @brief Routes, validates and renders the JSON control API
 *
 * Independent of any socket layer: ApiServer converts wire requests into
 * HTTPRequest and writes back the HTTPResponse. Any exception escaping a
 * handler becomes a generic 500 without internal detail.
 */
class ApiRouter {
public:
    static constexpr int DEFAULT_SCAN_TIMEOUT = 5;
    static constexpr int MIN_SCAN_TIMEOUT = 1;
    static constexpr int MAX_SCAN_TIMEOUT = 15;

    ApiRouter(const Configuration& config, core::PlaybackOrchestrator& orchestrator,
              core::StreamFormatCache& formatCache, const BuildInfo& buildInfo = BuildInfo(),
              WallClock clock = systemWallClock());

    HTTPResponse handle(const HTTPRequest& request);

    static BuildInfo defaultBuildInfo();

private:
    using Handler = std::function<HTTPResponse(const HTTPRequest&)>;

    struct Route {
        std::map<std::string, Handler> methods;
        bool requiresAuth = false;
    };

    void registerRoutes();
    HTTPResponse dispatch(const HTTPRequest& request);

    HTTPResponse handleIndex(const HTTPRequest& request);
    HTTPResponse handleHealth(const HTTPRequest& request);
    HTTPResponse handleDevices(const HTTPRequest& request);
    HTTPResponse handleDeviceSelect(const HTTPRequest& request);
    HTTPResponse handleDeviceCurrent(const HTTPRequest& request);
    HTTPResponse handlePlay(const HTTPRequest& request);
    HTTPResponse handleStop(const HTTPRequest& request);
    HTTPResponse handleStatus(const HTTPRequest& request);
    HTTPResponse handleStreamsCached(const HTTPRequest& request);

    std::optional<HTTPResponse> checkApiKey(const HTTPRequest& request) const;

    static HTTPResponse createJsonResponse(HttpStatus status, const nlohmann::json& body);
    static HTTPResponse createMessageResponse(HttpStatus status, const std::string& message);
    static HTTPResponse createErrorResponse(HttpStatus status, const std::string& error);

    Configuration config_;
    core::PlaybackOrchestrator& orchestrator_;
    core::StreamFormatCache& formatCache_;
    BuildInfo buildInfo_;
    std::unique_ptr<RateLimiter> rateLimiter_;
    std::map<std::string, Route> routes_;
};

} // namespace network
} // namespace dlnacast
