#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace dlnacast {

std::unique_ptr<Logger> Logger::s_instance;
std::mutex Logger::s_consoleMutex;
std::atomic<Logger::Level> Logger::s_currentLevel{Logger::Level::Info};
std::atomic<bool> Logger::s_consoleEnabled{true};
std::atomic<bool> Logger::s_fileEnabled{false};
std::atomic<bool> Logger::s_initialized{false};

Logger::Logger() = default;

Logger::~Logger() {
    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool Logger::initialize(const std::string& logFile, Level minLevel, bool enableConsole) {
    auto instance = std::make_unique<Logger>();
    instance->m_logFilePath = logFile;

    bool fileOk = true;
    if (!logFile.empty()) {
        instance->m_logFile.open(logFile, std::ios::out | std::ios::app);
        if (instance->m_logFile.is_open()) {
            instance->m_logFile.seekp(0, std::ios::end);
            instance->m_currentFileSize = static_cast<size_t>(instance->m_logFile.tellp());
        } else {
            fileOk = false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(s_consoleMutex);
        s_instance = std::move(instance);
    }

    s_currentLevel.store(minLevel);
    s_consoleEnabled.store(enableConsole);
    s_fileEnabled.store(!logFile.empty() && fileOk);
    s_initialized.store(true);

    if (!fileOk) {
        warning("Logger: could not open log file {}, logging to console only", logFile);
    }
    return fileOk;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(s_consoleMutex);
    if (s_instance) {
        std::lock_guard<std::mutex> fileLock(s_instance->m_mutex);
        if (s_instance->m_logFile.is_open()) {
            s_instance->m_logFile.flush();
            s_instance->m_logFile.close();
        }
    }
    s_fileEnabled.store(false);
    s_initialized.store(false);
}

bool Logger::isInitialized() {
    return s_initialized.load();
}

void Logger::setLevel(Level level) {
    s_currentLevel.store(level);
}

Logger::Level Logger::getLevel() {
    return s_currentLevel.load();
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") level = Level::Trace;
    else if (upper == "DEBUG") level = Level::Debug;
    else if (upper == "INFO") level = Level::Info;
    else if (upper == "WARNING" || upper == "WARN") level = Level::Warning;
    else if (upper == "ERROR") level = Level::Error;
    else if (upper == "CRITICAL") level = Level::Critical;
    else return false;
    return true;
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

void Logger::flush() {
    std::cout.flush();
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        if (s_instance->m_logFile.is_open()) {
            s_instance->m_logFile.flush();
        }
    }
}

void Logger::write(Level level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&time, &localTime);

    std::ostringstream ss;
    ss << "[" << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    ss << "[" << levelToString(level) << "] ";
    ss << message;

    const std::string line = ss.str();

    if (s_consoleEnabled.load()) {
        writeToConsole(level, line);
    }

    if (s_fileEnabled.load()) {
        writeToFile(line);
    }
}

void Logger::writeToConsole(Level level, const std::string& line) {
    std::lock_guard<std::mutex> lock(s_consoleMutex);
    if (level >= Level::Error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << '\n';
    }
}

void Logger::writeToFile(const std::string& line) {
    std::lock_guard<std::mutex> consoleLock(s_consoleMutex);
    if (!s_instance) {
        return;
    }

    std::lock_guard<std::mutex> lock(s_instance->m_mutex);
    if (!s_instance->m_logFile.is_open()) {
        return;
    }

    s_instance->m_logFile << line << '\n';
    s_instance->m_currentFileSize += line.size() + 1;

    if (s_instance->m_currentFileSize >= MAX_FILE_SIZE) {
        rotateLogFile();
    }
}

// Caller holds s_instance->m_mutex
void Logger::rotateLogFile() {
    Logger& self = *s_instance;
    self.m_logFile.close();

    const std::string& base = self.m_logFilePath;
    std::remove((base + "." + std::to_string(MAX_BACKUP_FILES)).c_str());
    for (size_t i = MAX_BACKUP_FILES; i > 1; --i) {
        std::rename((base + "." + std::to_string(i - 1)).c_str(),
                    (base + "." + std::to_string(i)).c_str());
    }
    std::rename(base.c_str(), (base + ".1").c_str());

    self.m_logFile.open(base, std::ios::out | std::ios::trunc);
    self.m_currentFileSize = 0;
    if (!self.m_logFile.is_open()) {
        s_fileEnabled.store(false);
    }
}

} // namespace dlnacast
