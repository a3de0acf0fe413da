#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <functional>
#include <stdexcept>

namespace dlnacast {
namespace streaming {

/**
 * @brief Raised when a streaming session cannot acquire its resources
 * (transcoder spawn failure, relay port already bound)
 */
class StreamerError : public std::runtime_error {
public:
    explicit StreamerError(const std::string& message)
        : std::runtime_error(message) {}
};

struct StreamerConfig {
    std::string ffmpegBinary = "ffmpeg";
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8080;
    std::string bitrate = "128k";
    size_t chunkSize = 8192;
    size_t maxStderrLines = 1000;
    std::string protocolWhitelist = "http,https,tcp,tls";
    std::string pidFile = "/tmp/dlnacast-ffmpeg.pid";
    double stopGraceSeconds = 5.0;
    double orphanGraceSeconds = 1.0;
};

using CrashCallback = std::function<void()>;

/**
 * @brief One playback delivery session handed to a renderer
 */
class Streamer {
public:
    virtual ~Streamer() = default;

    virtual void start() = 0;

    // Idempotent
    virtual void stop() = 0;

    // May perform crash cleanup as a side effect (see AudioStreamer::pollAndReconcile)
    virtual bool isRunning() = 0;

    virtual bool waitUntilReady(double timeoutSeconds) = 0;

    // URL the renderer should fetch, given the host it can reach us on
    virtual std::string getStreamUrl(const std::string& host) const = 0;

    virtual bool isTranscoding() const = 0;
};

/**
 * @brief Hands the renderer the source URL unchanged
 */
class PassthroughStreamer : public Streamer {
public:
    explicit PassthroughStreamer(const std::string& streamUrl);

    void start() override;
    void stop() override;
    bool isRunning() override { return running_; }
    bool waitUntilReady(double) override { return running_; }
    std::string getStreamUrl(const std::string&) const override { return streamUrl_; }
    bool isTranscoding() const override { return false; }

private:
    std::string streamUrl_;
    bool running_ = false;
};

class StreamerFactory {
public:
    virtual ~StreamerFactory() = default;

    virtual std::unique_ptr<Streamer> createPassthrough(const std::string& streamUrl) = 0;
    virtual std::unique_ptr<Streamer> createTranscoder(const std::string& streamUrl, CrashCallback onCrash) = 0;
};

class DefaultStreamerFactory : public StreamerFactory {
public:
    explicit DefaultStreamerFactory(const StreamerConfig& config);

    std::unique_ptr<Streamer> createPassthrough(const std::string& streamUrl) override;
    std::unique_ptr<Streamer> createTranscoder(const std::string& streamUrl, CrashCallback onCrash) override;

    const StreamerConfig& config() const { return config_; }

private:
    StreamerConfig config_;
};

} // namespace streaming
} // namespace dlnacast
