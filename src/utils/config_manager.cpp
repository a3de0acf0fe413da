#include "config_manager.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dlnacast {

namespace {

template<typename T>
void readValue(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& sectionOf(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

bool parsePort(const char* text, uint16_t& port) {
    try {
        int value = std::stoi(text);
        if (value <= 0 || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

ConfigManager::ConfigManager()
    : m_configuration(createDefaultConfiguration()) {
}

ConfigManager::~ConfigManager() {
    shutdown();
}

bool ConfigManager::initialize(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configFilePath = configPath;
        m_configuration = createDefaultConfiguration();
    }

    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        if (!loadFromFile(configPath)) {
            return false;
        }
    } else {
        Logger::info("ConfigManager: {} not found, using defaults", configPath);
    }

    loadFromEnvironment();

    if (!validateConfiguration(getConfiguration())) {
        Logger::error("ConfigManager: Configuration validation failed");
        return false;
    }

    m_initialized.store(true);
    return true;
}

void ConfigManager::shutdown() {
    m_initialized.store(false);
}

bool ConfigManager::isInitialized() const {
    return m_initialized.load();
}

bool ConfigManager::loadFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        Logger::error("ConfigManager: Cannot open configuration file {}", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!loadFromString(buffer.str())) {
        Logger::error("ConfigManager: Failed to load configuration from {}", filePath);
        return false;
    }

    Logger::info("ConfigManager: Loaded configuration from {}", filePath);
    return true;
}

bool ConfigManager::loadFromString(const std::string& text) {
    Configuration config = createDefaultConfiguration();

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            Logger::error("ConfigManager: Configuration root must be an object");
            return false;
        }
        if (!parseConfigurationJson(doc, config)) {
            return false;
        }
    } catch (const json::exception& e) {
        Logger::error("ConfigManager: Invalid configuration JSON: {}", e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_configuration = config;
    return true;
}

bool ConfigManager::loadFromEnvironment() {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool ok = true;

    if (const char* dataDir = envValue("DLNACAST_DATA_DIR")) {
        m_configuration.storage.dataDir = dataDir;
    }
    if (const char* apiKey = envValue("DLNACAST_API_KEY")) {
        m_configuration.security.apiKey = apiKey;
    }
    if (const char* publicUrl = envValue("DLNACAST_PUBLIC_URL")) {
        m_configuration.streaming.publicUrl = publicUrl;
    }
    if (const char* port = envValue("DLNACAST_SERVER_PORT")) {
        if (!parsePort(port, m_configuration.server.port)) {
            Logger::warning("ConfigManager: Ignoring invalid DLNACAST_SERVER_PORT '{}'", port);
            ok = false;
        }
    }
    if (const char* port = envValue("DLNACAST_STREAM_PORT")) {
        if (!parsePort(port, m_configuration.streaming.port)) {
            Logger::warning("ConfigManager: Ignoring invalid DLNACAST_STREAM_PORT '{}'", port);
            ok = false;
        }
    }
    if (const char* level = envValue("DLNACAST_LOG_LEVEL")) {
        m_configuration.log.level = level;
    }

    return ok;
}

bool ConfigManager::reload() {
    std::string path = getConfigFilePath();
    if (path.empty()) {
        return false;
    }
    return initialize(path);
}

std::string ConfigManager::saveToString() const {
    return serializeConfiguration(getConfiguration()).dump(2);
}

Configuration ConfigManager::getConfiguration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration;
}

bool ConfigManager::updateConfiguration(const Configuration& config) {
    if (!validateConfiguration(config)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_configuration = config;
    return true;
}

std::string ConfigManager::getConfigFilePath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configFilePath;
}

bool ConfigManager::validateConfiguration(const Configuration& config) const {
    auto result = ConfigValidator::validateConfiguration(config);
    for (const auto& warning : result.warnings) {
        Logger::warning("ConfigManager: {}", warning);
    }
    for (const auto& error : result.errors) {
        Logger::error("ConfigManager: {}", error);
    }
    return result.isValid;
}

Configuration ConfigManager::createDefaultConfiguration() {
    return Configuration{};
}

bool ConfigManager::parseConfigurationJson(const json& doc, Configuration& config) const {
    const json& server = sectionOf(doc, "server");
    readValue(server, "host", config.server.host);
    readValue(server, "port", config.server.port);
    readValue(server, "worker_threads", config.server.workerThreads);

    const json& streaming = sectionOf(doc, "streaming");
    readValue(streaming, "port", config.streaming.port);
    readValue(streaming, "mp3_bitrate", config.streaming.mp3Bitrate);
    readValue(streaming, "public_url", config.streaming.publicUrl);

    readValue(sectionOf(doc, "radio"), "default_url", config.defaultRadioUrl);
    readValue(sectionOf(doc, "dlna"), "default_device_ip", config.defaultDeviceIp);

    const json& timeouts = sectionOf(doc, "timeouts");
    readValue(timeouts, "http_request", config.timeouts.httpRequest);
    readValue(timeouts, "stream_detection", config.timeouts.streamDetection);
    readValue(timeouts, "device_discovery", config.timeouts.deviceDiscovery);
    readValue(timeouts, "ffmpeg_startup", config.timeouts.ffmpegStartup);

    const json& security = sectionOf(doc, "security");
    readValue(security, "api_auth_enabled", config.security.apiAuthEnabled);
    readValue(security, "api_key", config.security.apiKey);
    readValue(security, "rate_limit_enabled", config.security.rateLimitEnabled);
    readValue(security, "rate_limit_default", config.security.rateLimitDefault);

    const json& performance = sectionOf(doc, "performance");
    readValue(performance, "connection_pool_size", config.performance.connectionPoolSize);
    readValue(performance, "connection_pool_maxsize", config.performance.connectionPoolMaxSize);

    const json& ffmpeg = sectionOf(doc, "ffmpeg");
    readValue(ffmpeg, "binary", config.transcoder.ffmpegBinary);
    readValue(ffmpeg, "chunk_size", config.transcoder.chunkSize);
    readValue(ffmpeg, "max_stderr_lines", config.transcoder.maxStderrLines);
    readValue(ffmpeg, "protocol_whitelist", config.transcoder.protocolWhitelist);
    readValue(sectionOf(doc, "ffprobe"), "binary", config.transcoder.ffprobeBinary);

    const json& storage = sectionOf(doc, "storage");
    readValue(storage, "data_dir", config.storage.dataDir);
    readValue(storage, "stream_cache_ttl", config.storage.streamCacheTtl);
    readValue(storage, "pid_file", config.storage.pidFile);

    const json& log = sectionOf(doc, "log");
    readValue(log, "level", config.log.level);
    readValue(log, "file", config.log.file);

    return true;
}

json ConfigManager::serializeConfiguration(const Configuration& config) const {
    json doc;
    doc["server"] = {
        {"host", config.server.host},
        {"port", config.server.port},
        {"worker_threads", config.server.workerThreads}
    };
    doc["streaming"] = {
        {"port", config.streaming.port},
        {"mp3_bitrate", config.streaming.mp3Bitrate},
        {"public_url", config.streaming.publicUrl}
    };
    doc["radio"] = {{"default_url", config.defaultRadioUrl}};
    doc["dlna"] = {{"default_device_ip", config.defaultDeviceIp}};
    doc["timeouts"] = {
        {"http_request", config.timeouts.httpRequest},
        {"stream_detection", config.timeouts.streamDetection},
        {"device_discovery", config.timeouts.deviceDiscovery},
        {"ffmpeg_startup", config.timeouts.ffmpegStartup}
    };
    // api_key is never written back out
    doc["security"] = {
        {"api_auth_enabled", config.security.apiAuthEnabled},
        {"rate_limit_enabled", config.security.rateLimitEnabled},
        {"rate_limit_default", config.security.rateLimitDefault}
    };
    doc["performance"] = {
        {"connection_pool_size", config.performance.connectionPoolSize},
        {"connection_pool_maxsize", config.performance.connectionPoolMaxSize}
    };
    doc["ffmpeg"] = {
        {"binary", config.transcoder.ffmpegBinary},
        {"chunk_size", config.transcoder.chunkSize},
        {"max_stderr_lines", config.transcoder.maxStderrLines},
        {"protocol_whitelist", config.transcoder.protocolWhitelist}
    };
    doc["ffprobe"] = {{"binary", config.transcoder.ffprobeBinary}};
    doc["storage"] = {
        {"data_dir", config.storage.dataDir},
        {"stream_cache_ttl", config.storage.streamCacheTtl},
        {"pid_file", config.storage.pidFile}
    };
    doc["log"] = {
        {"level", config.log.level},
        {"file", config.log.file}
    };
    return doc;
}

ConfigValidator::ValidationResult ConfigValidator::validateConfiguration(const Configuration& config) {
    ValidationResult result;

    auto fail = [&result](const std::string& message) {
        result.isValid = false;
        result.errors.push_back(message);
    };

    if (config.server.port == 0) {
        fail("server.port must be non-zero");
    }
    if (config.streaming.port == 0) {
        fail("streaming.port must be non-zero");
    }
    if (config.server.workerThreads == 0) {
        fail("server.worker_threads must be at least 1");
    }
    if (config.streaming.mp3Bitrate.empty()) {
        fail("streaming.mp3_bitrate must not be empty");
    }
    if (config.transcoder.chunkSize == 0) {
        fail("ffmpeg.chunk_size must be non-zero");
    }
    if (config.performance.connectionPoolSize == 0 || config.performance.connectionPoolMaxSize == 0) {
        fail("performance connection pool sizes must be non-zero");
    }
    if (config.security.apiAuthEnabled && config.security.apiKey.empty()) {
        fail("security.api_auth_enabled requires security.api_key");
    }

    if (config.performance.connectionPoolMaxSize < config.performance.connectionPoolSize) {
        result.warnings.push_back("performance.connection_pool_maxsize is below connection_pool_size");
    }
    if (config.server.port == config.streaming.port) {
        fail("server.port and streaming.port must differ");
    }
    if (config.storage.streamCacheTtl <= 0.0) {
        result.warnings.push_back("storage.stream_cache_ttl <= 0 disables the format cache");
    }

    Logger::Level level;
    if (!Logger::parseLevel(config.log.level, level)) {
        result.warnings.push_back("Unknown log.level '" + config.log.level + "', using INFO");
    }

    return result;
}

} // namespace dlnacast
