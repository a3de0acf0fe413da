#include "../test_helpers.hpp"

#include "network/ssdp_discovery.hpp"

using namespace dlnacast;
using namespace dlnacast::network;
using namespace dlnacast::testing;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

TEST(SsdpResponseTest, ParsesHeadersCaseInsensitively) {
    auto headers = SsdpDiscovery::parseSsdpResponse(
        "HTTP/1.1 200 OK\r\n"
        "Cache-Control: max-age=1800\r\n"
        "location:  http://192.168.1.30:49152/description.xml \r\n"
        "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
        "\r\n");
    EXPECT_EQ(headers["LOCATION"], "http://192.168.1.30:49152/description.xml");
    EXPECT_EQ(headers["CACHE-CONTROL"], "max-age=1800");
    EXPECT_EQ(headers["ST"], "urn:schemas-upnp-org:device:MediaRenderer:1");
    EXPECT_EQ(headers.count("HTTP/1.1 200 OK"), 0u);
}

TEST(SsdpResponseTest, CollectorDeduplicatesLocations) {
    LocationCollector collector;
    const std::string a = "HTTP/1.1 200 OK\r\nLOCATION: http://10.0.0.5:1400/xml/device_description.xml\r\n\r\n";
    const std::string b = "HTTP/1.1 200 OK\r\nLocation: http://10.0.0.6:49152/desc.xml\r\n\r\n";

    EXPECT_TRUE(collector.add(a));
    EXPECT_FALSE(collector.add(a));
    EXPECT_TRUE(collector.add(b));
    EXPECT_FALSE(collector.add("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n"));

    ASSERT_EQ(collector.locations().size(), 2u);
    EXPECT_EQ(collector.locations()[0], "http://10.0.0.5:1400/xml/device_description.xml");
    EXPECT_EQ(collector.responseCount(), 4u);
}

TEST(SsdpResponseTest, SearchRequestFollowsMSearchFormat) {
    NiceMock<MockHttpTransport> http;
    SsdpDiscovery discovery(http);
    const std::string request = discovery.buildSearchRequest();

    EXPECT_EQ(request.rfind("M-SEARCH * HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(request.find("HOST: 239.255.255.250:1900\r\n"), std::string::npos);
    EXPECT_NE(request.find("MAN: \"ssdp:discover\"\r\n"), std::string::npos);
    EXPECT_NE(request.find("MX: 3\r\n"), std::string::npos);
    EXPECT_NE(request.find("ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"), std::string::npos);
    EXPECT_EQ(request.substr(request.size() - 4), "\r\n\r\n");
}

TEST(DeviceDescriptionParserTest, ExtractsRendererFields) {
    auto device = DeviceDescriptionParser::parse(
        rendererDescription("Kitchen", "uuid:RINCON_000E58"), "http://192.168.1.30:1400/xml/desc.xml");
    ASSERT_TRUE(device.has_value());

    EXPECT_EQ(device->friendly_name, "Kitchen");
    EXPECT_EQ(device->manufacturer, "Acme");
    EXPECT_EQ(device->model_name, "Speaker 1");
    EXPECT_EQ(device->udn, "uuid:RINCON_000E58");
    EXPECT_EQ(device->id, "RINCON_000E58");
    EXPECT_EQ(device->ip, "192.168.1.30");
    EXPECT_EQ(device->port, 1400);
    EXPECT_EQ(device->location, "http://192.168.1.30:1400/xml/desc.xml");
    EXPECT_EQ(device->control_url, "http://192.168.1.30:1400/MediaRenderer/AVTransport/Control");
    EXPECT_EQ(device->connection_manager_url, "http://192.168.1.30:1400/MediaRenderer/ConnectionManager/Control");
    EXPECT_FALSE(device->capabilities.has_value());
}

TEST(DeviceDescriptionParserTest, SkipsDevicesWithoutAvTransport) {
    auto device = DeviceDescriptionParser::parse(
        rendererDescription("NAS", "uuid:nas", false), "http://192.168.1.40:8200/rootDesc.xml");
    EXPECT_FALSE(device.has_value());
}

TEST(DeviceDescriptionParserTest, FallsBackToAddressWhenUdnMissing) {
    auto device = DeviceDescriptionParser::parse(
        rendererDescription("Anonymous", ""), "http://192.168.1.41:8080/description.xml");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->id, "192.168.1.41:8080");
}

TEST(DeviceDescriptionParserTest, AcceptsDescriptionsWithoutNamespace) {
    const std::string xml =
        "<root><device><friendlyName>Bare</friendlyName><UDN>uuid:bare</UDN><serviceList>"
        "<service><serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
        "<controlURL>http://10.1.1.1:9000/av</controlURL></service>"
        "</serviceList></device></root>";
    auto device = DeviceDescriptionParser::parse(xml, "http://10.1.1.1:9000/desc.xml");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->control_url, "http://10.1.1.1:9000/av");
    EXPECT_EQ(device->connection_manager_url, "http://10.1.1.1:9000/ConnectionManager/ctrl");
}

TEST(DeviceDescriptionParserTest, RelativePathsStartingWithHttpStayRelative) {
    const std::string xml =
        "<root><device><friendlyName>Odd</friendlyName><UDN>uuid:odd</UDN><serviceList>"
        "<service><serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
        "<controlURL>httpctrl/av</controlURL></service>"
        "</serviceList></device></root>";
    auto device = DeviceDescriptionParser::parse(xml, "http://10.1.1.2:9000/desc.xml");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->control_url, "http://10.1.1.2:9000/httpctrl/av");
}

TEST(DeviceDescriptionParserTest, BracketsIpv6Hosts) {
    auto device = DeviceDescriptionParser::parse(
        rendererDescription("Loft", "uuid:loft"), "http://[fe80::1234]:49152/description.xml");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->ip, "fe80::1234");
    EXPECT_EQ(device->control_url, "http://[fe80::1234]:49152/MediaRenderer/AVTransport/Control");
}

TEST(DeviceDescriptionParserTest, RejectsMalformedXml) {
    EXPECT_FALSE(DeviceDescriptionParser::parse("<root><device>", "http://10.0.0.1/d.xml").has_value());
    EXPECT_FALSE(DeviceDescriptionParser::parse("<root/>", "http://10.0.0.1/d.xml").has_value());
}

class SsdpDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.fetchTimeoutSeconds = 1.0;
        config.overallFetchTimeoutSeconds = 5.0;
        discovery = std::make_unique<FakeSsdpDiscovery>(http, config);
    }

    NiceMock<MockHttpTransport> http;
    DiscoveryConfig config;
    std::unique_ptr<FakeSsdpDiscovery> discovery;
};

TEST_F(SsdpDiscoveryTest, FetchesEveryLocationAndReportsDevices) {
    discovery->locations = {
        "http://192.168.1.30:1400/desc.xml",
        "http://192.168.1.31:49152/desc.xml",
        "http://192.168.1.32:8200/rootDesc.xml"
    };

    ON_CALL(http, get("http://192.168.1.30:1400/desc.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("Kitchen", "uuid:k"), "text/xml")));
    ON_CALL(http, get("http://192.168.1.31:49152/desc.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("Office", "uuid:o"), "text/xml")));
    // A MediaServer answering the same search
    ON_CALL(http, get("http://192.168.1.32:8200/rootDesc.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("NAS", "uuid:n", false), "text/xml")));

    std::vector<std::string> reported;
    auto devices = discovery->discover(1.0, [&reported](const Device& device) {
        reported.push_back(device.friendly_name);
    });

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(reported.size(), 2u);
    EXPECT_THAT(reported, ::testing::UnorderedElementsAre("Kitchen", "Office"));
}

TEST_F(SsdpDiscoveryTest, OneFailingLocationDoesNotAbortScan) {
    discovery->locations = {"http://10.0.0.1:80/a.xml", "http://10.0.0.2:80/b.xml", "http://10.0.0.3:80/c.xml"};

    ON_CALL(http, get("http://10.0.0.1:80/a.xml", _, _)).WillByDefault(Throw(TransportError("refused")));
    ON_CALL(http, get("http://10.0.0.2:80/b.xml", _, _)).WillByDefault(Return(httpResponse(404)));
    ON_CALL(http, get("http://10.0.0.3:80/c.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("Survivor", "uuid:s"))));

    auto devices = discovery->discover(1.0);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].friendly_name, "Survivor");
}

TEST_F(SsdpDiscoveryTest, CallbackExceptionDoesNotAbortScan) {
    discovery->locations = {"http://10.0.0.1:80/a.xml"};
    ON_CALL(http, get(_, _, _)).WillByDefault(Return(httpResponse(200, rendererDescription("A", "uuid:a"))));

    auto devices = discovery->discover(1.0, [](const Device&) { throw std::runtime_error("consumer gone"); });
    EXPECT_EQ(devices.size(), 1u);
}

TEST_F(SsdpDiscoveryTest, EmptySearchMakesNoRequests) {
    EXPECT_CALL(http, get(_, _, _)).Times(0);
    EXPECT_TRUE(discovery->discover(1.0).empty());
    EXPECT_EQ(discovery->searches.load(), 1);
}

TEST_F(SsdpDiscoveryTest, DirectConnectionStopsAtFirstXmlDescription) {
    ON_CALL(http, get(_, _, _)).WillByDefault(Throw(TransportError("connection refused")));
    // Non-XML answers are skipped
    ON_CALL(http, get("http://192.168.1.77:8080/description.xml", _, _))
        .WillByDefault(Return(httpResponse(200, "<html/>", "text/html")));
    ON_CALL(http, get("http://192.168.1.77:49152/description.xml", _, _))
        .WillByDefault(Return(httpResponse(200, rendererDescription("TV", "uuid:tv"), "text/xml; charset=\"utf-8\"")));

    auto device = discovery->tryDirectConnection("192.168.1.77", 1.0);
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->friendly_name, "TV");
    EXPECT_EQ(device->port, 49152);
}

TEST_F(SsdpDiscoveryTest, DirectConnectionGivesUpAfterAllProbes) {
    const size_t probes = SsdpDiscovery::directConnectionPaths().size() *
                          SsdpDiscovery::directConnectionPorts().size();
    EXPECT_CALL(http, get(_, _, _)).Times(static_cast<int>(probes))
        .WillRepeatedly(Return(httpResponse(404)));

    EXPECT_FALSE(discovery->tryDirectConnection("192.168.1.78", 1.0).has_value());
}
