#include "streaming/streamer.hpp"
#include "streaming/audio_streamer.hpp"
#include "../utils/logger.hpp"

namespace dlnacast {
namespace streaming {

PassthroughStreamer::PassthroughStreamer(const std::string& streamUrl)
    : streamUrl_(streamUrl) {
}

void PassthroughStreamer::start() {
    running_ = true;
    Logger::info("PassthroughStreamer: Passthrough mode enabled for {}", streamUrl_);
}

void PassthroughStreamer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    Logger::info("PassthroughStreamer: Passthrough streamer stopped");
}

DefaultStreamerFactory::DefaultStreamerFactory(const StreamerConfig& config)
    : config_(config) {
}

std::unique_ptr<Streamer> DefaultStreamerFactory::createPassthrough(const std::string& streamUrl) {
    return std::make_unique<PassthroughStreamer>(streamUrl);
}

std::unique_ptr<Streamer> DefaultStreamerFactory::createTranscoder(const std::string& streamUrl,
                                                                   CrashCallback onCrash) {
    return std::make_unique<AudioStreamer>(streamUrl, config_, std::move(onCrash));
}

} // namespace streaming
} // namespace dlnacast
