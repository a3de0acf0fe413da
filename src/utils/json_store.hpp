#pragma once

#include <string>
#include <functional>

#include <nlohmann/json_fwd.hpp>

namespace dlnacast {

// Seconds since the epoch; replaceable so TTL and age logic can be tested
using WallClock = std::function<double()>;

WallClock systemWallClock();

/**
 * @brief JSON document on disk shared between processes
 *
 * Writes go to a sibling temporary file that is renamed over the target, so
 * readers only ever see a complete document.
 */
class JsonFileStore {
public:
    explicit JsonFileStore(const std::string& path);

    // false when the file is missing or does not parse; doc is left untouched
    bool read(nlohmann::json& doc) const;

    bool write(const nlohmann::json& doc) const;

    bool exists() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace dlnacast
