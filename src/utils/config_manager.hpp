#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <mutex>
#include <atomic>

#include <nlohmann/json_fwd.hpp>

namespace dlnacast {

// API server settings
struct ServerSettings {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    uint32_t workerThreads = 4;
};

// Transcoding relay settings
struct StreamingSettings {
    uint16_t port = 8080;
    std::string mp3Bitrate = "128k";
    std::string publicUrl;
};

// Timeouts in seconds
struct TimeoutSettings {
    double httpRequest = 10.0;
    double streamDetection = 5.0;
    double deviceDiscovery = 10.0;
    double ffmpegStartup = 10.0;
};

struct SecuritySettings {
    bool apiAuthEnabled = false;
    std::string apiKey;
    bool rateLimitEnabled = false;
    std::string rateLimitDefault = "100 per hour";
};

struct PerformanceSettings {
    uint32_t connectionPoolSize = 10;
    uint32_t connectionPoolMaxSize = 20;
};

// External transcoder / prober binaries
struct TranscoderSettings {
    std::string ffmpegBinary = "ffmpeg";
    std::string ffprobeBinary = "ffprobe";
    uint32_t chunkSize = 8192;
    uint32_t maxStderrLines = 1000;
    std::string protocolWhitelist = "http,https,tcp,tls";
};

struct StorageSettings {
    std::string dataDir = "data";
    double streamCacheTtl = 86400.0;
    std::string pidFile = "/tmp/dlnacast-ffmpeg.pid";
};

struct LogSettings {
    std::string level = "INFO";
    std::string file;
};

struct Configuration {
    ServerSettings server;
    StreamingSettings streaming;
    TimeoutSettings timeouts;
    SecuritySettings security;
    PerformanceSettings performance;
    TranscoderSettings transcoder;
    StorageSettings storage;
    LogSettings log;
    std::string defaultRadioUrl;
    std::string defaultDeviceIp;
};

/**
 * @brief Configuration manager for service settings
 *
 * Loads a JSON document laid out in dotted sections ("server.port",
 * "streaming.mp3_bitrate", ...). Keys absent from the document keep their
 * defaults. Environment variables prefixed DLNACAST_ override the file.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Initialization
    bool initialize(const std::string& configPath = "config/dlnacast.json");
    void shutdown();
    bool isInitialized() const;

    // Configuration loading
    bool loadFromFile(const std::string& filePath);
    bool loadFromString(const std::string& json);
    bool loadFromEnvironment();
    bool reload();

    std::string saveToString() const;

    // Configuration access
    Configuration getConfiguration() const;
    bool updateConfiguration(const Configuration& config);
    std::string getConfigFilePath() const;

    bool validateConfiguration(const Configuration& config) const;

    static Configuration createDefaultConfiguration();

protected:
    bool parseConfigurationJson(const nlohmann::json& doc, Configuration& config) const;
    nlohmann::json serializeConfiguration(const Configuration& config) const;

private:
    mutable std::mutex m_mutex;
    Configuration m_configuration;
    std::string m_configFilePath;
    std::atomic<bool> m_initialized{false};
};

/**
 * @brief Configuration validator
 */
class ConfigValidator {
public:
    struct ValidationResult {
        bool isValid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    static ValidationResult validateConfiguration(const Configuration& config);
};

} // namespace dlnacast
