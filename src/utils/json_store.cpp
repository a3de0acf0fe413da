#include "json_store.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace dlnacast {

namespace {

std::atomic<unsigned long> g_tempCounter{0};

} // namespace

WallClock systemWallClock() {
    return []() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
    };
}

JsonFileStore::JsonFileStore(const std::string& path)
    : path_(path) {
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            Logger::error("JsonFileStore: Failed to create directory {}: {}", parent.string(), ec.message());
        }
    }
}

bool JsonFileStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

bool JsonFileStore::read(nlohmann::json& doc) const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return false;
    }

    try {
        nlohmann::json parsed = nlohmann::json::parse(file);
        doc = std::move(parsed);
        return true;
    } catch (const nlohmann::json::exception& e) {
        Logger::warning("JsonFileStore: Failed to parse {}: {}", path_, e.what());
        return false;
    }
}

bool JsonFileStore::write(const nlohmann::json& doc) const {
    const std::string tempPath = path_ + ".tmp." + std::to_string(::getpid()) + "." +
                                 std::to_string(g_tempCounter.fetch_add(1));
    {
        std::ofstream file(tempPath, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("JsonFileStore: Cannot open {} for writing", tempPath);
            return false;
        }
        // Invalid UTF-8 from the network is stored as U+FFFD
        std::string text;
        try {
            text = doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const nlohmann::json::exception& e) {
            Logger::error("JsonFileStore: Cannot serialize {}: {}", path_, e.what());
            file.close();
            std::remove(tempPath.c_str());
            return false;
        }
        file << text;
        file.flush();
        if (!file.good()) {
            Logger::error("JsonFileStore: Write to {} failed", tempPath);
            file.close();
            std::remove(tempPath.c_str());
            return false;
        }
    }

    if (std::rename(tempPath.c_str(), path_.c_str()) != 0) {
        Logger::error("JsonFileStore: Failed to replace {}", path_);
        std::remove(tempPath.c_str());
        return false;
    }
    return true;
}

} // namespace dlnacast
