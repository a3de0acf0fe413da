#include "streaming/audio_streamer.hpp"
#include "streaming/stream_relay_server.hpp"
#include "../utils/logger.hpp"
#include "../utils/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>

#include <unistd.h>

#include <asio.hpp>

namespace dlnacast {
namespace streaming {

namespace {

constexpr auto READY_POLL_INTERVAL = std::chrono::milliseconds(200);

bool fileExists(const std::string& path) {
    return ::access(path.c_str(), F_OK) == 0;
}

} // namespace

AudioStreamer::AudioStreamer(const std::string& streamUrl, const StreamerConfig& config, CrashCallback onCrash)
    : streamUrl_(streamUrl)
    , config_(config)
    , onCrash_(std::move(onCrash)) {
}

AudioStreamer::~AudioStreamer() {
    stop();
}

std::vector<std::string> AudioStreamer::buildCommand() const {
    return {
        config_.ffmpegBinary,
        "-protocol_whitelist", config_.protocolWhitelist,
        "-i", streamUrl_,
        "-vn",
        "-acodec", "libmp3lame",
        "-b:a", config_.bitrate,
        "-ar", "44100",
        "-ac", "2",
        "-f", "mp3",
        "-"
    };
}

void AudioStreamer::cleanupOrphanedTranscoder(const std::string& pidFile, double graceSeconds) {
    if (!fileExists(pidFile)) {
        return;
    }

    long pid = 0;
    {
        std::ifstream in(pidFile);
        in >> pid;
    }

    if (pid > 0 && Subprocess::processExists(static_cast<pid_t>(pid))) {
        Logger::warning("AudioStreamer: Found orphaned FFmpeg process (PID {}), terminating...", pid);
        if (!Subprocess::terminatePid(static_cast<pid_t>(pid), graceSeconds)) {
            Logger::error("AudioStreamer: Orphaned FFmpeg process {} is still alive", pid);
        }
    } else {
        Logger::debug("AudioStreamer: Old PID {} in PID file but process doesn't exist", pid);
    }

    if (std::remove(pidFile.c_str()) != 0 && errno != ENOENT) {
        Logger::warning("AudioStreamer: Failed to remove stale PID file {}", pidFile);
    }
}

void AudioStreamer::savePid(int pid) {
    std::ofstream out(config_.pidFile, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        Logger::warning("AudioStreamer: Failed to save FFmpeg PID to {}", config_.pidFile);
        return;
    }
    out << pid;
    Logger::debug("AudioStreamer: Saved FFmpeg PID {} to {}", pid, config_.pidFile);
}

void AudioStreamer::removePidFile() {
    if (!fileExists(config_.pidFile)) {
        return;
    }
    if (std::remove(config_.pidFile.c_str()) != 0) {
        Logger::warning("AudioStreamer: Failed to remove PID file {}", config_.pidFile);
        return;
    }
    Logger::debug("AudioStreamer: Removed PID file {}", config_.pidFile);
}

void AudioStreamer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        Logger::warning("AudioStreamer: Streamer already running");
        return;
    }

    // Must finish before spawning: the orphan may still hold the relay port
    cleanupOrphanedTranscoder(config_.pidFile, config_.orphanGraceSeconds);

    Logger::info("AudioStreamer: Starting transcoding from {}", streamUrl_);
    {
        std::lock_guard<std::mutex> stderrLock(stderrMutex_);
        stderrRing_.clear();
        stderrLineCount_ = 0;
    }

    auto process = std::make_unique<Subprocess>();
    if (!process->spawn(buildCommand())) {
        throw StreamerError("Failed to start transcoder " + config_.ffmpegBinary);
    }
    process_ = std::move(process);
    savePid(process_->pid());

    stderrThread_ = std::thread(&AudioStreamer::drainStderr, this, process_->stderrFd());

    auto relay = std::make_unique<StreamRelayServer>(config_.bindAddress, config_.port,
                                                     process_->stdoutFd(), config_.chunkSize);
    if (!relay->start()) {
        teardownLocked(true);
        throw StreamerError("Failed to bind streaming port " + std::to_string(config_.port));
    }
    relay_ = std::move(relay);

    running_ = true;
    Logger::info("AudioStreamer: Transcoder running (PID: {}), streaming on port {}", process_->pid(), config_.port);
}

void AudioStreamer::teardownLocked(bool terminateProcess) {
    if (relay_) {
        relay_->stop();
        relay_.reset();
    }

    if (process_ && terminateProcess) {
        process_->terminate(config_.stopGraceSeconds);
    }

    // The drain thread sees EOF once the process is gone
    if (stderrThread_.joinable()) {
        stderrThread_.join();
    }

    if (process_) {
        process_->closePipes();
        process_.reset();
    }

    removePidFile();
    running_ = false;
}

void AudioStreamer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !process_) {
        return;
    }

    Logger::info("AudioStreamer: Stopping streamer");
    teardownLocked(true);
    Logger::info("AudioStreamer: Streamer stopped");
}

bool AudioStreamer::isAlive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->isAlive();
}

bool AudioStreamer::pollAndReconcile() {
    CrashCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (process_ && process_->isAlive()) {
            return true;
        }
        if (!running_) {
            return false;
        }

        int exitCode = process_ ? process_->exitCode().value_or(-1) : -1;
        Logger::warning("AudioStreamer: FFmpeg process ended unexpectedly (exit code: {}), cleaning up", exitCode);

        // Drain the remaining output first so the tail is complete
        relay_.reset();
        if (stderrThread_.joinable()) {
            stderrThread_.join();
        }

        std::vector<std::string> lines = recentStderr();
        if (!lines.empty()) {
            Logger::warning("AudioStreamer: Last FFmpeg output:");
            size_t first = lines.size() > CRASH_LOG_LINES ? lines.size() - CRASH_LOG_LINES : 0;
            for (size_t i = first; i < lines.size(); ++i) {
                Logger::warning("AudioStreamer:   {}", lines[i]);
            }
        }

        teardownLocked(false);
        callback = onCrash_;
    }

    if (callback) {
        try {
            callback();
        } catch (const std::exception& e) {
            Logger::debug("AudioStreamer: Error in crash callback: {}", e.what());
        }
    }
    return false;
}

bool AudioStreamer::isRunning() {
    return pollAndReconcile();
}

bool AudioStreamer::waitUntilReady(double timeoutSeconds) {
    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(timeoutSeconds));

    const std::string host = (config_.bindAddress == "0.0.0.0") ? "127.0.0.1" : config_.bindAddress;
    asio::error_code addressError;
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host, addressError), config_.port);
    if (addressError) {
        Logger::error("AudioStreamer: Invalid readiness address {}", host);
        return false;
    }

    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive()) {
            Logger::warning("AudioStreamer: Transcoder exited before the streaming server became ready");
            return false;
        }

        asio::io_context io_context;
        asio::ip::tcp::socket socket(io_context);
        asio::error_code ec;
        socket.connect(endpoint, ec);
        if (!ec) {
            asio::error_code ignored;
            socket.close(ignored);
            Logger::info("AudioStreamer: Streaming server is ready");
            return true;
        }
        std::this_thread::sleep_for(READY_POLL_INTERVAL);
    }

    Logger::warning("AudioStreamer: Streaming server not ready after {}s", timeoutSeconds);
    return false;
}

std::string AudioStreamer::getStreamUrl(const std::string& host) const {
    return "http://" + host + ":" + std::to_string(config_.port) + StreamRelayServer::STREAM_PATH;
}

std::vector<std::string> AudioStreamer::recentStderr() const {
    std::lock_guard<std::mutex> lock(stderrMutex_);
    return std::vector<std::string>(stderrRing_.begin(), stderrRing_.end());
}

void AudioStreamer::drainStderr(int fd) {
    char buffer[1024];
    std::string pending;

    auto handleLine = [this](const std::string& line) {
        if (line.empty()) {
            return;
        }
        size_t count;
        {
            std::lock_guard<std::mutex> lock(stderrMutex_);
            stderrRing_.push_back(line);
            if (stderrRing_.size() > STDERR_RING_SIZE) {
                stderrRing_.pop_front();
            }
            count = ++stderrLineCount_;
        }

        if (count <= config_.maxStderrLines) {
            Logger::debug("FFmpeg: {}", line);
        } else if (count == config_.maxStderrLines + 1) {
            Logger::warning("AudioStreamer: FFmpeg stderr buffer limit ({} lines) reached, suppressing further output",
                            config_.maxStderrLines);
        }
    };

    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }

        for (ssize_t i = 0; i < n; ++i) {
            // ffmpeg rewrites its progress line with '\r'
            if (buffer[i] == '\n' || buffer[i] == '\r') {
                handleLine(pending);
                pending.clear();
            } else {
                pending += buffer[i];
            }
        }
    }
    handleLine(pending);
}

} // namespace streaming
} // namespace dlnacast
