#include "playback_fixture.hpp"

using namespace dlnacast;
using namespace dlnacast::testing;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class PlaybackOrchestratorTest : public PlaybackFixture {};

TEST_F(PlaybackOrchestratorTest, PlayWithoutDeviceIsRejected) {
    core::PlayResult result = orchestrator().play("http://radio.example.com/live");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, HttpStatus::BAD_REQUEST);
    EXPECT_EQ(result.error, "No device selected. Please use /devices/select first.");
    EXPECT_TRUE(streamers.passthroughUrls.empty());
    EXPECT_TRUE(streamers.transcoderUrls.empty());
}

TEST_F(PlaybackOrchestratorTest, SupportedHttpStreamPlaysWithoutTranscoding) {
    ASSERT_TRUE(registry.select(capableDevice()));
    const std::string source = "http://radio.example.com/live";
    preparePassthrough(source);

    EXPECT_CALL(http, post(_, HasSubstr("audio/mpeg"), SoapAction("SetAVTransportURI"), _))
        .WillOnce(Return(httpResponse(200, "<ok/>")));
    EXPECT_CALL(http, post(_, _, SoapAction("Play"), _)).WillOnce(Return(httpResponse(200, "<ok/>")));

    core::PlayResult result = orchestrator().play(source);

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.transcoding);
    EXPECT_EQ(result.playback_url, source);
    ASSERT_TRUE(result.format.has_value());
    EXPECT_EQ(*result.format, "audio/mpeg");
    ASSERT_EQ(streamers.passthroughUrls.size(), 1u);
    EXPECT_TRUE(streamers.transcoderUrls.empty());
    EXPECT_TRUE(orchestrator().isStreaming());

    // Detection result is remembered
    auto cached = formatCache.get(source);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->detection_method, "head");
}

TEST_F(PlaybackOrchestratorTest, HttpsSourceIsTranscoded) {
    ASSERT_TRUE(registry.select(capableDevice()));
    prepareTranscoder();

    core::PlayResult result = orchestrator().play("https://radio.example.com/live");

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.transcoding);
    EXPECT_EQ(result.playback_url, "http://192.168.1.5:8080/stream.mp3");
    ASSERT_EQ(streamers.transcoderUrls.size(), 1u);
    EXPECT_EQ(streamers.transcoderUrls[0], "https://radio.example.com/live");
}

TEST_F(PlaybackOrchestratorTest, UnsupportedFormatIsTranscoded) {
    ASSERT_TRUE(registry.select(capableDevice()));
    ON_CALL(http, head(_, _, _)).WillByDefault(Return(httpResponse(200, "", "audio/ogg")));
    prepareTranscoder();

    core::PlayResult result = orchestrator().play("http://radio.example.com/ogg");

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.transcoding);
    EXPECT_EQ(*result.format, "audio/ogg");
}

TEST_F(PlaybackOrchestratorTest, UndetectableFormatIsTranscoded) {
    ASSERT_TRUE(registry.select(capableDevice()));
    ON_CALL(http, head(_, _, _)).WillByDefault(Return(httpResponse(200)));
    EXPECT_CALL(prober, probeMimeType("http://radio.example.com/mystery")).WillOnce(Return(std::nullopt));
    prepareTranscoder();

    core::PlayResult result = orchestrator().play("http://radio.example.com/mystery");

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.transcoding);
    EXPECT_FALSE(result.format.has_value());
    EXPECT_TRUE(formatCache.entries().empty());
}

TEST_F(PlaybackOrchestratorTest, UnknownCapabilitiesAreTranscoded) {
    Device device = makeDevice("192.168.1.21");
    Capabilities unknown;
    unknown.raw_protocol_info = Capabilities::UNKNOWN_PROTOCOL_INFO;
    device.capabilities = unknown;
    ASSERT_TRUE(registry.select(device));
    prepareTranscoder();

    EXPECT_TRUE(orchestrator().play("http://radio.example.com/live").transcoding);
}

TEST_F(PlaybackOrchestratorTest, PublicUrlOverridesLocalAddress) {
    ASSERT_TRUE(registry.select(capableDevice()));
    prepareTranscoder();

    core::PlaybackSettings settings;
    settings.publicUrl = "http://nas.lan:8080/";
    core::PlayResult result = orchestrator(settings).play("https://radio.example.com/live");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.playback_url, "http://nas.lan:8080/stream.mp3");
}

TEST_F(PlaybackOrchestratorTest, RendererRejectionStopsSession) {
    ASSERT_TRUE(registry.select(capableDevice()));
    MockStreamer* streamer = preparePassthrough("http://radio.example.com/live");
    ON_CALL(http, post(_, _, SoapAction("SetAVTransportURI"), _))
        .WillByDefault(Return(httpResponse(500, "<s:Fault/>")));
    EXPECT_CALL(*streamer, stop()).Times(AtLeast(1));

    core::PlayResult result = orchestrator().play("http://radio.example.com/live");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, HttpStatus::INTERNAL_ERROR);
    EXPECT_EQ(result.error, "Failed to start playback on DLNA device");
    EXPECT_FALSE(orchestrator().isStreaming());
}

TEST_F(PlaybackOrchestratorTest, TranscoderThatNeverBecomesReadyFails) {
    ASSERT_TRUE(registry.select(capableDevice()));
    MockStreamer* streamer = prepareTranscoder(false);
    EXPECT_CALL(*streamer, stop()).Times(AtLeast(1));
    EXPECT_CALL(http, post(_, _, SoapAction("SetAVTransportURI"), _)).Times(0);

    core::PlayResult result = orchestrator().play("https://radio.example.com/live");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "Streaming server failed to start");
}

TEST_F(PlaybackOrchestratorTest, StreamerStartFailureIsReported) {
    ASSERT_TRUE(registry.select(capableDevice()));
    MockStreamer* streamer = prepareTranscoder();
    EXPECT_CALL(*streamer, start()).WillOnce(Throw(streaming::StreamerError("Port 8080 is already in use")));

    core::PlayResult result = orchestrator().play("https://radio.example.com/live");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, HttpStatus::INTERNAL_ERROR);
    EXPECT_EQ(result.error, "Streaming server failed to start");
    EXPECT_FALSE(orchestrator().isStreaming());
}

TEST_F(PlaybackOrchestratorTest, NewPlayReplacesPreviousSession) {
    ASSERT_TRUE(registry.select(capableDevice()));
    MockStreamer* first = preparePassthrough("http://radio.example.com/one");
    preparePassthrough("http://radio.example.com/two");
    EXPECT_CALL(*first, stop()).Times(1);

    ASSERT_TRUE(orchestrator().play("http://radio.example.com/one").ok);
    ASSERT_TRUE(orchestrator().play("http://radio.example.com/two").ok);
    EXPECT_EQ(streamers.passthroughUrls.size(), 2u);
}

TEST_F(PlaybackOrchestratorTest, PlayingRendererIsStoppedBeforeNewStream) {
    ASSERT_TRUE(registry.select(capableDevice()));
    preparePassthrough("http://radio.example.com/live");
    ON_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
        .WillByDefault(Return(httpResponse(200, transportInfoResponse("PLAYING"))));
    EXPECT_CALL(http, post(_, _, SoapAction("Stop"), _)).Times(1);

    EXPECT_TRUE(orchestrator().play("http://radio.example.com/live").ok);
}

TEST_F(PlaybackOrchestratorTest, StopHaltsRendererAndSession) {
    ASSERT_TRUE(registry.select(capableDevice()));
    MockStreamer* streamer = preparePassthrough("http://radio.example.com/live");
    ASSERT_TRUE(orchestrator().play("http://radio.example.com/live").ok);

    EXPECT_CALL(http, post(_, _, SoapAction("Stop"), _)).Times(1);
    EXPECT_CALL(*streamer, stop()).Times(1);
    orchestrator().stop();

    EXPECT_FALSE(orchestrator().isStreaming());
}

TEST_F(PlaybackOrchestratorTest, StatusFallsBackWhileStreaming) {
    ASSERT_TRUE(registry.select(capableDevice()));
    preparePassthrough("http://radio.example.com/live");
    ASSERT_TRUE(orchestrator().play("http://radio.example.com/live").ok);

    ON_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
        .WillByDefault(Throw(network::TransportError("Connection refused")));

    core::StatusReport report = orchestrator().status();
    EXPECT_TRUE(report.streaming);
    ASSERT_TRUE(report.dlna.has_value());
    EXPECT_EQ(report.dlna->state, "PLAYING");
    EXPECT_EQ(report.dlna->status, "UNKNOWN");
    ASSERT_TRUE(report.current_device.has_value());
    EXPECT_EQ(report.current_device->ip, "192.168.1.20");
}

TEST_F(PlaybackOrchestratorTest, StatusWithoutDevice) {
    core::StatusReport report = orchestrator().status();
    EXPECT_FALSE(report.streaming);
    EXPECT_FALSE(report.dlna.has_value());
    EXPECT_FALSE(report.current_device.has_value());
}

TEST_F(PlaybackOrchestratorTest, SelectFromCacheDetectsCapabilities) {
    Device device = makeDevice("192.168.1.30", "Kitchen");
    ASSERT_TRUE(registry.updateCache({device}));

    core::SelectResult result = orchestrator().selectDevice("192.168.1.30");

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(result.device->capabilities.has_value());
    EXPECT_TRUE(result.device->capabilities->supports_flac);
    EXPECT_FALSE(result.device->capabilities->supports_aac);
    EXPECT_EQ(discovery.searches.load(), 0);

    auto current = registry.current();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->friendly_name, "Kitchen");
}

TEST_F(PlaybackOrchestratorTest, SelectScansWhenNotCached) {
    discovery.locations = {"http://192.168.1.40:49152/description.xml"};
    ON_CALL(http, get("http://192.168.1.40:49152/description.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("Study", "uuid:study"), "text/xml")));

    core::SelectResult result = orchestrator().selectDevice("192.168.1.40");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.device->friendly_name, "Study");
    EXPECT_EQ(discovery.searches.load(), 1);
    EXPECT_EQ(registry.cached().size(), 1u);
}

TEST_F(PlaybackOrchestratorTest, SelectUnknownDeviceIsNotFound) {
    core::SelectResult result = orchestrator().selectDevice("10.0.0.9");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, HttpStatus::NOT_FOUND);
    EXPECT_EQ(result.error, "Device 10.0.0.9 not found");
    EXPECT_FALSE(registry.hasDevice());
}

TEST_F(PlaybackOrchestratorTest, AutoSelectUsesDirectConnection) {
    ON_CALL(http, get("http://192.168.1.50:49152/description.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("Den", "uuid:den"), "text/xml")));

    EXPECT_TRUE(orchestrator().autoSelectDevice("192.168.1.50"));
    EXPECT_EQ(discovery.searches.load(), 0);
    ASSERT_TRUE(registry.current().has_value());
    EXPECT_EQ(registry.current()->friendly_name, "Den");

    // Second call is satisfied by the current selection
    EXPECT_TRUE(orchestrator().autoSelectDevice("192.168.1.50"));
}

TEST_F(PlaybackOrchestratorTest, ForcedListingRefreshesCache) {
    discovery.locations = {"http://192.168.1.60:49152/description.xml"};
    ON_CALL(http, get("http://192.168.1.60:49152/description.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("Hall", "uuid:hall"), "text/xml")));

    core::DeviceListing cold = orchestrator().listDevices(false, 5.0);
    EXPECT_TRUE(cold.devices.empty());
    EXPECT_FALSE(cold.cache_age_seconds.has_value());

    core::DeviceListing fresh = orchestrator().listDevices(true, 5.0);
    ASSERT_EQ(fresh.devices.size(), 1u);
    EXPECT_DOUBLE_EQ(*fresh.cache_age_seconds, 0.0);

    clock.advance(42.0);
    core::DeviceListing cached = orchestrator().listDevices(false, 5.0);
    ASSERT_EQ(cached.devices.size(), 1u);
    EXPECT_NEAR(*cached.cache_age_seconds, 42.0, 0.001);
}
