#include <gtest/gtest.h>

#include <string>

#include "huescan/response_validator.hpp"
#include "huescan/errors.hpp"

using namespace huescan;

static std::string bridge_response(const std::string& location_ip)
{
    return "HTTP/1.1 200 OK\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "EXT:\r\n"
        "CACHE-CONTROL: max-age=100\r\n"
        "LOCATION: http://" + location_ip + ":80/description.xml\r\n"
        "SERVER: FreeRTOS/7.4.2 UPnP/1.0 IpBridge/1.10.0\r\n"
        "hue-bridgeid: 001788FFFE09A206\r\n"
        "ST: upnp:rootdevice\r\n"
        "USN: uuid:2f402f80-da50-11e1-9b23-00178809a206::upnp:rootdevice\r\n"
        "\r\n";
}

static const std::string notify_message =
    "NOTIFY * HTTP/1.1\r\n"
    "HOST: 239.255.255.250:1900\r\n"
    "NT: upnp:rootdevice\r\n"
    "NTS: ssdp:alive\r\n"
    "\r\n";

TEST(ResponseValidator, AcceptsConformantBridge)
{
    EXPECT_TRUE(is_valid_response(bridge_response("192.168.1.5"), "192.168.1.5"));
}

TEST(ResponseValidator, IsIdempotent)
{
    std::string body = bridge_response("192.168.1.5");
    EXPECT_EQ(is_valid_response(body, "192.168.1.5"), is_valid_response(body, "192.168.1.5"));
    EXPECT_FALSE(is_valid_response(notify_message, "192.168.1.5"));
    EXPECT_FALSE(is_valid_response(notify_message, "192.168.1.5"));
}

TEST(ResponseValidator, IgnoresNotify)
{
    EXPECT_FALSE(is_valid_response(notify_message, "10.0.0.9"));
}

TEST(ResponseValidator, RejectsUnknownStatusLine)
{
    EXPECT_THROW(is_valid_response("HTTP/1.1 404 Not Found\r\nUSN: x\r\nST: y\r\n\r\n", "10.0.0.5"),
        malformed_response);
    EXPECT_THROW(is_valid_response("M-SEARCH * HTTP/1.1\r\nMAN: \"ssdp:discover\"\r\n\r\n", "10.0.0.5"),
        malformed_response);
}

TEST(ResponseValidator, RequiresUsnAndSt)
{
    EXPECT_THROW(is_valid_response("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\nSERVER: IpBridge\r\n\r\n", "10.0.0.5"),
        malformed_response);
    EXPECT_THROW(is_valid_response("HTTP/1.1 200 OK\r\nusn: uuid:1\r\nSERVER: IpBridge\r\n\r\n", "10.0.0.5"),
        malformed_response);
}

TEST(ResponseValidator, IgnoresOtherVendors)
{
    std::string body =
        "HTTP/1.1 200 OK\r\n"
        "LOCATION: http://10.0.0.7:1400/xml/device_description.xml\r\n"
        "SERVER: Linux UPnP/1.0 Sonos/70.3-35220 (ZPS1)\r\n"
        "usn: uuid:RINCON_000E58::upnp:rootdevice\r\n"
        "st: upnp:rootdevice\r\n"
        "\r\n";
    EXPECT_FALSE(is_valid_response(body, "10.0.0.7"));
}

TEST(ResponseValidator, MatchesVendorMarkerIgnoringCase)
{
    std::string body = bridge_response("10.0.0.5");
    EXPECT_TRUE(is_valid_response(body, "10.0.0.5", "IPBRIDGE"));
    EXPECT_FALSE(is_valid_response(body, "10.0.0.5", "wemo"));
}

TEST(ResponseValidator, RequiresLocationFromBridge)
{
    std::string body =
        "HTTP/1.1 200 OK\r\n"
        "SERVER: FreeRTOS/7.4.2 UPnP/1.0 IpBridge/1.10.0\r\n"
        "ST: upnp:rootdevice\r\n"
        "USN: uuid:2f402f80::upnp:rootdevice\r\n"
        "\r\n";
    EXPECT_THROW(is_valid_response(body, "10.0.0.5"), malformed_response);
}

TEST(ResponseValidator, ComparesLocationWithSender)
{
    std::string body = bridge_response("192.168.1.5");
    EXPECT_TRUE(is_valid_response(body, "192.168.1.5"));
    EXPECT_THROW(is_valid_response(body, "192.168.1.6"), malformed_response);
}

TEST(ResponseValidator, RejectsLocationWithoutPort)
{
    std::string body =
        "HTTP/1.1 200 OK\r\n"
        "LOCATION: http://10.0.0.5/description.xml\r\n"
        "SERVER: IpBridge/1.10.0\r\n"
        "ST: upnp:rootdevice\r\n"
        "USN: uuid:1\r\n"
        "\r\n";
    EXPECT_THROW(is_valid_response(body, "10.0.0.5"), malformed_response);
}

TEST(ResponseValidator, IgnoresPortContentInLocation)
{
    for(const char* port : {"99999", "http", ""})
    {
        std::string body =
            "HTTP/1.1 200 OK\r\n"
            "LOCATION: http://10.0.0.5:" + std::string {port} + "/description.xml\r\n"
            "SERVER: FreeRTOS/7.4.2 UPnP/1.0 IpBridge/1.10.0\r\n"
            "ST: upnp:rootdevice\r\n"
            "USN: uuid:1\r\n"
            "\r\n";
        EXPECT_TRUE(is_valid_response(body, "10.0.0.5")) << port;
    }
}
