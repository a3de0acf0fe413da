#include "core/stream_format_cache.hpp"
#include "../utils/logger.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

using json = nlohmann::json;

namespace dlnacast {
namespace core {

namespace {

std::string joinPath(const std::string& dir, const char* name) {
    return (std::filesystem::path(dir) / name).string();
}

} // namespace

StreamFormatCache::StreamFormatCache(const std::string& dataDir, double ttlSeconds, WallClock clock)
    : store_(joinPath(dataDir, FILE_NAME))
    , ttl_(ttlSeconds)
    , clock_(clock ? std::move(clock) : systemWallClock()) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    Logger::debug("StreamFormatCache: Loaded {} entries from {}", entries_.size(), store_.path());
}

std::string StreamFormatCache::cacheKey(const std::string& url) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    if (EVP_Digest(url.data(), url.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1) {
        Logger::error("StreamFormatCache: SHA-256 digest failed");
        return std::string();
    }

    static const char hex[] = "0123456789abcdef";
    std::string key;
    key.reserve(16);
    for (unsigned int i = 0; i < digestLength && key.size() < 16; ++i) {
        key += hex[digest[i] >> 4];
        key += hex[digest[i] & 0x0f];
    }
    return key;
}

bool StreamFormatCache::isExpired(const StreamFormatEntry& entry) const {
    return clock_() - entry.timestamp > ttl_;
}

void StreamFormatCache::reload() {
    json doc;
    entries_.clear();
    if (!store_.read(doc) || !doc.is_object()) {
        return;
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const json& value = it.value();
        if (!value.is_object()) {
            continue;
        }
        try {
            StreamFormatEntry entry;
            entry.url = value.value("url", std::string());
            entry.mime_type = value.value("mime_type", std::string());
            entry.detection_method = value.value("detection_method", std::string());
            entry.timestamp = value.value("timestamp", 0.0);
            entries_[it.key()] = entry;
        } catch (const json::exception& e) {
            Logger::warning("StreamFormatCache: Skipping malformed entry {}: {}", it.key(), e.what());
        }
    }
}

void StreamFormatCache::sweepExpired() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isExpired(it->second)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

bool StreamFormatCache::persist() {
    json doc = json::object();
    for (const auto& item : entries_) {
        doc[item.first] = json{
            {"url", item.second.url},
            {"mime_type", item.second.mime_type},
            {"detection_method", item.second.detection_method},
            {"timestamp", item.second.timestamp}
        };
    }
    if (!store_.write(doc)) {
        Logger::warning("StreamFormatCache: Failed to save cache to {}", store_.path());
        return false;
    }
    return true;
}

std::optional<StreamFormatEntry> StreamFormatCache::get(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();

    const std::string key = cacheKey(url);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (isExpired(it->second)) {
        Logger::debug("StreamFormatCache: Entry for {} expired", url);
        entries_.erase(it);
        persist();
        return std::nullopt;
    }

    Logger::debug("StreamFormatCache: Hit for {}: {}", url, it->second.mime_type);
    return it->second;
}

bool StreamFormatCache::set(const std::string& url, const std::string& mimeType, const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();

    StreamFormatEntry entry;
    entry.url = url;
    entry.mime_type = mimeType;
    entry.detection_method = method;
    entry.timestamp = clock_();
    entries_[cacheKey(url)] = entry;

    sweepExpired();
    Logger::debug("StreamFormatCache: Cached {} for {} ({})", mimeType, url, method);
    return persist();
}

bool StreamFormatCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    Logger::info("StreamFormatCache: Cleared");
    return persist();
}

std::vector<StreamFormatEntry> StreamFormatCache::entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();

    std::vector<StreamFormatEntry> result;
    for (const auto& item : entries_) {
        if (!isExpired(item.second)) {
            result.push_back(item.second);
        }
    }
    return result;
}

} // namespace core
} // namespace dlnacast
