#include "../test_helpers.hpp"

#include "upnp/dlna_client.hpp"
#include "upnp/xml_document.hpp"

using namespace dlnacast;
using namespace dlnacast::upnp;
using namespace dlnacast::testing;
using ::testing::_;
using ::testing::AllOf;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class DlnaClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        timeouts.settleDelaySeconds = 0.0;
        timeouts.transportRetryDelaySeconds = 0.0;
        device = makeDevice("192.168.1.30");
        client = std::make_unique<DlnaClient>(http, device, timeouts);
    }

    NiceMock<MockHttpTransport> http;
    ControlTimeouts timeouts;
    Device device;
    std::unique_ptr<DlnaClient> client;
};

TEST_F(DlnaClientTest, EnvelopeCarriesActionAndArguments) {
    const std::string envelope = DlnaClient::buildSoapEnvelope(
        xmlns::AV_TRANSPORT, "Play", {{"InstanceID", "0"}, {"Speed", "1"}});

    auto doc = XmlDocument::parse(envelope);
    ASSERT_NE(doc, nullptr);
    const XmlElement* action = doc->root()->findFirst(xmlns::AV_TRANSPORT, "Play");
    ASSERT_NE(action, nullptr);
    EXPECT_EQ(action->childText("", "InstanceID"), "0");
    EXPECT_EQ(action->childText("", "Speed"), "1");
}

TEST_F(DlnaClientTest, DefaultsServiceUrlsFromAddress) {
    Device bare;
    bare.ip = "10.0.0.9";
    DlnaClient defaults(http, bare, timeouts);
    EXPECT_EQ(defaults.controlUrl(), "http://10.0.0.9:80/AVTransport/ctrl");
    EXPECT_EQ(defaults.connectionManagerUrl(), "http://10.0.0.9:80/ConnectionManager/ctrl");
}

TEST_F(DlnaClientTest, PlaySendsSoapActionHeader) {
    EXPECT_CALL(http, post(device.control_url, AllOf(HasSubstr("<Speed>1</Speed>"), HasSubstr("<InstanceID>0</InstanceID>")),
                           SoapAction("Play"), _))
        .WillOnce(Return(httpResponse(200, "<ok/>")));
    EXPECT_TRUE(client->play());
}

TEST_F(DlnaClientTest, FailureStatusesAndTransportErrorsReturnFalse) {
    EXPECT_CALL(http, post(_, _, SoapAction("Pause"), _)).WillOnce(Return(httpResponse(500, "fault")));
    EXPECT_FALSE(client->pause());

    EXPECT_CALL(http, post(_, _, SoapAction("Stop"), _)).WillOnce(Throw(network::TransportError("timeout")));
    EXPECT_FALSE(client->stop());
}

TEST_F(DlnaClientTest, SetUriEscapesUriAndMetadata) {
    std::string body;
    EXPECT_CALL(http, post(_, _, SoapAction("SetAVTransportURI"), timeouts.setUriSeconds))
        .WillOnce(DoAll(SaveArg<1>(&body), Return(httpResponse(200))));

    EXPECT_TRUE(client->setAVTransportURI("http://host/s?a=1&b=2", "<DIDL-Lite/>"));
    EXPECT_THAT(body, HasSubstr("<CurrentURI>http://host/s?a=1&amp;b=2</CurrentURI>"));
    EXPECT_THAT(body, HasSubstr("<CurrentURIMetaData>&lt;DIDL-Lite/&gt;</CurrentURIMetaData>"));
}

TEST_F(DlnaClientTest, TransportInfoIsParsed) {
    EXPECT_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
        .WillOnce(Return(httpResponse(200, transportInfoResponse("PLAYING"))));

    auto info = client->getTransportInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, "PLAYING");
    EXPECT_EQ(info->status, "OK");
}

TEST_F(DlnaClientTest, TransportInfoRetriesThenGivesUp) {
    EXPECT_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
        .Times(3)
        .WillRepeatedly(Return(httpResponse(503)));
    EXPECT_FALSE(client->getTransportInfo(2).has_value());
}

TEST_F(DlnaClientTest, TransportInfoRecoversOnRetry) {
    EXPECT_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
        .WillOnce(Return(httpResponse(200, "not xml <")))
        .WillOnce(Return(httpResponse(200, transportInfoResponse("STOPPED", "OK"))));
    auto info = client->getTransportInfo(2);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, "STOPPED");
}

TEST_F(DlnaClientTest, StopIfPlayingOnlyStopsActivePlayback) {
    {
        InSequence sequence;
        EXPECT_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
            .WillOnce(Return(httpResponse(200, transportInfoResponse("PAUSED_PLAYBACK"))));
        EXPECT_CALL(http, post(_, _, SoapAction("Stop"), _)).WillOnce(Return(httpResponse(200)));
    }
    EXPECT_TRUE(client->stopIfPlaying());
}

TEST_F(DlnaClientTest, StopIfPlayingLeavesTransitioningAlone) {
    EXPECT_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
        .WillOnce(Return(httpResponse(200, transportInfoResponse("TRANSITIONING"))));
    EXPECT_CALL(http, post(_, _, SoapAction("Stop"), _)).Times(0);
    EXPECT_TRUE(client->stopIfPlaying());
}

TEST_F(DlnaClientTest, DetectsCapabilitiesFromSink) {
    EXPECT_CALL(http, post(device.connection_manager_url, HasSubstr("GetProtocolInfo"), SoapAction("GetProtocolInfo"), _))
        .WillOnce(Return(httpResponse(200, protocolInfoResponse("http-get:*:audio/mpeg:*,http-get:*:audio/flac:*"))));

    Capabilities caps = client->detectCapabilities();
    EXPECT_TRUE(caps.supports_mp3);
    EXPECT_TRUE(caps.supports_flac);
    EXPECT_FALSE(caps.supports_aac);
    EXPECT_TRUE(client->canPlayFormat("audio/mpeg"));
    EXPECT_FALSE(client->canPlayFormat("audio/aac"));
}

TEST_F(DlnaClientTest, UnavailableProtocolInfoYieldsUnknownCapabilities) {
    EXPECT_CALL(http, post(device.connection_manager_url, _, _, _))
        .WillOnce(Return(httpResponse(401)));

    Capabilities caps = client->detectCapabilities();
    EXPECT_EQ(caps.raw_protocol_info, Capabilities::UNKNOWN_PROTOCOL_INFO);
    EXPECT_FALSE(caps.isKnown());
    EXPECT_FALSE(client->canPlayFormat("audio/mpeg"));
}

TEST_F(DlnaClientTest, PlayUrlRetriesWithoutMetadataWhenRejected) {
    {
        InSequence sequence;
        EXPECT_CALL(http, post(_, HasSubstr("DIDL-Lite"), SoapAction("SetAVTransportURI"), _))
            .WillOnce(Return(httpResponse(500, "UPnPError 714")));
        EXPECT_CALL(http, post(_, Not(HasSubstr("DIDL-Lite")), SoapAction("SetAVTransportURI"), _))
            .WillOnce(Return(httpResponse(200)));
        EXPECT_CALL(http, post(_, _, SoapAction("Play"), _)).WillOnce(Return(httpResponse(200)));
    }
    EXPECT_TRUE(client->playUrl("http://10.0.0.2:8080/stream.mp3", "Radio", "audio/mpeg"));
}

TEST_F(DlnaClientTest, PlayUrlFailsWhenUriIsRejected) {
    EXPECT_CALL(http, post(_, _, SoapAction("SetAVTransportURI"), _))
        .Times(2)
        .WillRepeatedly(Return(httpResponse(500)));
    EXPECT_CALL(http, post(_, _, SoapAction("Play"), _)).Times(0);
    EXPECT_FALSE(client->playUrl("http://10.0.0.2:8080/stream.mp3"));
}
