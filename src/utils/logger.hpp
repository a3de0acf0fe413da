#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace dlnacast {

/**
 * @brief Process-wide logging facility
 *
 * Thread-safe, static interface. Messages use "{}" placeholders which are
 * substituted positionally by the arguments:
 *
 *     Logger::info("Found device at {}", location);
 *
 * Surplus arguments are appended to the message, missing ones leave the
 * placeholder in place.
 */
class Logger {
public:
    // Log files rotate to <file>.1 ... <file>.5 at 10MB
    static constexpr size_t MAX_FILE_SIZE = 10 * 1024 * 1024;
    static constexpr size_t MAX_BACKUP_FILES = 5;

    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Critical = 5
    };

    Logger();
    ~Logger();

    // Initialization
    static bool initialize(const std::string& logFile = "",
                           Level minLevel = Level::Info,
                           bool enableConsole = true);
    static void shutdown();
    static bool isInitialized();

    // Configuration
    static void setLevel(Level level);
    static Level getLevel();

    static bool parseLevel(const std::string& name, Level& level);
    static std::string levelToString(Level level);

    // Logging methods
    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warning(const std::string& format, Args&&... args) {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(Level::Error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }

    static void flush();

    template<typename... Args>
    static std::string formatMessage(const std::string& format, Args&&... args) {
        std::ostringstream out;
        size_t pos = 0;
        formatNext(out, format, pos, std::forward<Args>(args)...);
        return out.str();
    }

private:
    template<typename... Args>
    static void log(Level level, const std::string& format, Args&&... args) {
        if (level < s_currentLevel.load()) {
            return;
        }

        try {
            std::string message = formatMessage(format, std::forward<Args>(args)...);
            write(level, message);
        } catch (const std::exception& e) {
            // Avoid recursive logging errors
            std::cerr << "Logger error: " << e.what() << std::endl;
        }
    }

    static void formatNext(std::ostringstream& out, const std::string& format, size_t& pos) {
        out << format.substr(pos);
        pos = format.size();
    }

    template<typename T, typename... Rest>
    static void formatNext(std::ostringstream& out, const std::string& format, size_t& pos,
                           T&& value, Rest&&... rest) {
        size_t placeholder = format.find("{}", pos);
        if (placeholder == std::string::npos) {
            out << format.substr(pos) << ' ' << value;
            pos = format.size();
            formatNext(out, format, pos, std::forward<Rest>(rest)...);
            return;
        }
        out << format.substr(pos, placeholder - pos) << value;
        pos = placeholder + 2;
        formatNext(out, format, pos, std::forward<Rest>(rest)...);
    }

    static void write(Level level, const std::string& message);
    static void writeToConsole(Level level, const std::string& line);
    static void writeToFile(const std::string& line);
    static void rotateLogFile();

    // Instance data
    std::mutex m_mutex;
    std::ofstream m_logFile;
    std::string m_logFilePath;
    size_t m_currentFileSize = 0;

    // Static instance and configuration
    static std::unique_ptr<Logger> s_instance;
    static std::mutex s_consoleMutex;
    static std::atomic<Level> s_currentLevel;
    static std::atomic<bool> s_consoleEnabled;
    static std::atomic<bool> s_fileEnabled;
    static std::atomic<bool> s_initialized;
};

} // namespace dlnacast
