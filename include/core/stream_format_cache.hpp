#pragma once

#include "utils/json_store.hpp"

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>

namespace dlnacast {
namespace core {

struct StreamFormatEntry {
    std::string url;
    std::string mime_type;
    std::string detection_method;   // "head" or "ffprobe"
    double timestamp = 0.0;         // unix seconds
};

/**
 * @brief Persistent URL -> MIME type memo with TTL expiry
 *
 * Entries are keyed by the first 16 hex digits of SHA-256(url). Expired
 * entries are dropped lazily on get() and swept from the whole map before
 * every write. A missing or corrupt file yields an empty cache.
 */
class StreamFormatCache {
public:
    static constexpr const char* FILE_NAME = "stream_format_cache.json";

    StreamFormatCache(const std::string& dataDir, double ttlSeconds = 86400.0,
                      WallClock clock = systemWallClock());

    std::optional<StreamFormatEntry> get(const std::string& url);
    bool set(const std::string& url, const std::string& mimeType, const std::string& method);
    bool clear();

    // Unexpired entries, for diagnostics
    std::vector<StreamFormatEntry> entries();

    double ttlSeconds() const { return ttl_; }
    const std::string& cacheFile() const { return store_.path(); }

    static std::string cacheKey(const std::string& url);

private:
    // Caller holds mutex_
    void reload();
    void sweepExpired();
    bool persist();
    bool isExpired(const StreamFormatEntry& entry) const;

    JsonFileStore store_;
    double ttl_;
    WallClock clock_;
    std::mutex mutex_;
    std::map<std::string, StreamFormatEntry> entries_;
};

} // namespace core
} // namespace dlnacast
