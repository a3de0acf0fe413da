#include "core/app_context.hpp"
#include "../utils/bounded_queue.hpp"
#include "../utils/logger.hpp"

#include <filesystem>

namespace dlnacast {
namespace core {

namespace {

upnp::ControlTimeouts controlTimeoutsFrom(const Configuration& config) {
    upnp::ControlTimeouts timeouts;
    timeouts.actionSeconds = config.timeouts.httpRequest;
    return timeouts;
}

PlaybackSettings playbackSettingsFrom(const Configuration& config) {
    PlaybackSettings settings;
    settings.publicUrl = config.streaming.publicUrl;
    settings.ffmpegStartupTimeout = config.timeouts.ffmpegStartup;
    return settings;
}

} // namespace

streaming::StreamerConfig AppContext::streamerConfigFrom(const Configuration& config) {
    streaming::StreamerConfig streamer;
    streamer.ffmpegBinary = config.transcoder.ffmpegBinary;
    streamer.port = config.streaming.port;
    streamer.bitrate = config.streaming.mp3Bitrate;
    streamer.chunkSize = config.transcoder.chunkSize;
    streamer.maxStderrLines = config.transcoder.maxStderrLines;
    streamer.protocolWhitelist = config.transcoder.protocolWhitelist;
    streamer.pidFile = config.storage.pidFile;
    return streamer;
}

AppServices AppContext::createDefaultServices(const Configuration& config) {
    network::HttpClientConfig httpConfig;
    httpConfig.poolConnections = config.performance.connectionPoolSize;
    httpConfig.poolMaxSize = config.performance.connectionPoolMaxSize;

    AppServices services;
    services.http = std::make_unique<network::CurlHttpClient>(httpConfig);
    services.discovery = std::make_unique<network::SsdpDiscovery>(*services.http);
    services.prober = std::make_unique<FfprobeProber>(config.transcoder.ffprobeBinary);
    services.streamers = std::make_unique<streaming::DefaultStreamerFactory>(streamerConfigFrom(config));
    return services;
}

AppContext::AppContext(const Configuration& config)
    : AppContext(config, createDefaultServices(config)) {
}

AppContext::AppContext(const Configuration& config, AppServices services)
    : config_(config)
    , services_(std::move(services)) {
    const std::string stateFile = (std::filesystem::path(config_.storage.dataDir) / "state.json").string();

    formatCache_ = std::make_unique<StreamFormatCache>(config_.storage.dataDir, config_.storage.streamCacheTtl);
    Logger::info("AppContext: Stream format cache initialized (TTL: {}s)", config_.storage.streamCacheTtl);

    registry_ = std::make_unique<network::DeviceRegistry>(stateFile);

    detector_ = std::make_unique<FormatDetector>(*services_.http, *formatCache_, *services_.prober,
                                                 config_.timeouts.streamDetection);

    orchestrator_ = std::make_unique<PlaybackOrchestrator>(*services_.http, *registry_, *services_.discovery,
                                                           *detector_, *services_.streamers,
                                                           playbackSettingsFrom(config_),
                                                           controlTimeoutsFrom(config_));
}

AppContext::~AppContext() {
    shutdown();
}

void AppContext::start(bool backgroundTasks) {
    if (auto saved = registry_->current()) {
        Logger::info("AppContext: Restoring previously selected device: {}", saved->friendly_name);
    } else {
        Logger::info("AppContext: No device selected");
    }

    // Immediate attempt, before the background scan fills the cache
    tryAutoSelectDefaultDevice();

    if (!backgroundTasks) {
        return;
    }

    std::lock_guard<std::mutex> lock(threadsMutex_);
    scanThread_ = std::thread(&AppContext::backgroundScan, this);

    if (!config_.defaultRadioUrl.empty()) {
        precacheThread_ = std::thread(&AppContext::precacheDefaultStream, this);
        Logger::info("AppContext: Started background stream format pre-caching");
    }
}

void AppContext::waitForBackgroundTasks() {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    if (scanThread_.joinable()) {
        scanThread_.join();
    }
    if (precacheThread_.joinable()) {
        precacheThread_.join();
    }
}

void AppContext::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;
    stopping_ = true;

    Logger::info("AppContext: Shutting down");
    waitForBackgroundTasks();

    if (orchestrator_) {
        orchestrator_->stop();
    }
}

void AppContext::tryAutoSelectDefaultDevice() {
    if (config_.defaultDeviceIp.empty() || stopping_) {
        return;
    }
    orchestrator_->autoSelectDevice(config_.defaultDeviceIp);
}

void AppContext::backgroundScan() {
    BoundedQueue<Device> found(SCAN_QUEUE_CAPACITY);

    // Consumer: the only writer of incremental cache updates during the scan
    std::thread updater([this, &found]() {
        size_t added = 0;
        while (auto device = found.pop()) {
            Logger::info("AppContext: Background scan found device: {} at {}", device->friendly_name, device->ip);
            if (registry_->findInCache(device->id)) {
                Logger::debug("AppContext: Device {} already in cache", device->friendly_name);
                continue;
            }
            if (registry_->appendToCache(*device)) {
                ++added;
                Logger::info("AppContext: Added device to cache: {}", device->friendly_name);
            }
        }
        Logger::debug("AppContext: Cache updater added {} devices", added);
    });

    std::vector<Device> devices;
    try {
        const double timeout = config_.timeouts.deviceDiscovery;
        Logger::info("AppContext: Starting background device scan ({}s timeout)", timeout);
        devices = services_.discovery->discover(timeout, [&found](const Device& device) {
            found.push(device);
        });
    } catch (const std::exception& e) {
        Logger::error("AppContext: Background device scan failed: {}", e.what());
    }

    found.close();
    updater.join();

    Logger::info("AppContext: Background scan discovery returned {} devices", devices.size());
    if (!devices.empty()) {
        registry_->updateCache(devices);
        Logger::info("AppContext: Background scan complete. Final cache update with {} devices", devices.size());
        for (const auto& device : devices) {
            Logger::info("AppContext:   - {} ({})", device.friendly_name, device.ip);
        }
    } else {
        Logger::warning("AppContext: Background scan complete. No devices found - this may indicate network issues");
    }

    if (!stopping_) {
        tryAutoSelectDefaultDevice();
    }
}

void AppContext::precacheDefaultStream() {
    const std::string& url = config_.defaultRadioUrl;
    Logger::info("AppContext: Pre-caching stream format for: {}", url);

    auto format = detector_->detect(url);
    if (format) {
        Logger::info("AppContext: Successfully pre-cached stream format: {}", *format);
    } else {
        Logger::warning("AppContext: Could not detect stream format for pre-caching");
    }
}

} // namespace core
} // namespace dlnacast
