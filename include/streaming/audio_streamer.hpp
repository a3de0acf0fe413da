#pragma once

#include "streaming/streamer.hpp"

#include <deque>
#include <mutex>
#include <thread>
#include <vector>
#include <string>
#include <memory>

namespace dlnacast {

class Subprocess;

namespace streaming {

class StreamRelayServer;

/**
 * @brief Transcoding session: ffmpeg subprocess to MP3 plus a relay server
 *
 * start() first kills any transcoder left behind by a previous run (PID
 * file), then spawns ffmpeg, records its PID and binds the relay port.
 * stderr is drained continuously; the first maxStderrLines lines are logged
 * and the last STDERR_RING_SIZE are always retained.
 *
 * Liveness:
 *  - isAlive() only queries the subprocess.
 *  - pollAndReconcile() additionally tears the session down when the
 *    subprocess died while the session was running and fires the crash
 *    callback. isRunning() delegates to it, so polling status may clean up.
 */
class AudioStreamer : public Streamer {
public:
    static constexpr size_t STDERR_RING_SIZE = 20;
    static constexpr size_t CRASH_LOG_LINES = 10;

    AudioStreamer(const std::string& streamUrl, const StreamerConfig& config,
                  CrashCallback onCrash = CrashCallback());
    ~AudioStreamer() override;

    AudioStreamer(const AudioStreamer&) = delete;
    AudioStreamer& operator=(const AudioStreamer&) = delete;

    // Throws StreamerError; leaves nothing running on failure
    void start() override;
    void stop() override;
    bool isRunning() override;
    bool waitUntilReady(double timeoutSeconds) override;
    std::string getStreamUrl(const std::string& host) const override;
    bool isTranscoding() const override { return true; }

    bool isAlive();
    bool pollAndReconcile();

    std::vector<std::string> recentStderr() const;
    std::vector<std::string> buildCommand() const;

    // Terminates the process recorded in pidFile, if any, and removes the file
    static void cleanupOrphanedTranscoder(const std::string& pidFile, double graceSeconds);

private:
    void savePid(int pid);
    void removePidFile();
    void drainStderr(int fd);
    void teardownLocked(bool terminateProcess);

    std::string streamUrl_;
    StreamerConfig config_;
    CrashCallback onCrash_;

    std::mutex mutex_;
    bool running_ = false;
    std::unique_ptr<Subprocess> process_;
    std::unique_ptr<StreamRelayServer> relay_;
    std::thread stderrThread_;

    mutable std::mutex stderrMutex_;
    std::deque<std::string> stderrRing_;
    size_t stderrLineCount_ = 0;
};

} // namespace streaming
} // namespace dlnacast
