#ifndef HUESCAN_CONFIG_HPP
#define HUESCAN_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdint>

#define HUESCAN_LISTEN_IP "0.0.0.0"
#define HUESCAN_DISCOVERY_IP "239.255.255.250"
#define HUESCAN_DISCOVERY_PORT 1900
#define HUESCAN_DISCOVERY_TIME 3000
#define HUESCAN_MAX_DISCOVERY_TIME 86400000
#define HUESCAN_DISCOVERY_MX 2
#define HUESCAN_SEARCH_TARGET "ssdp:all"
#define HUESCAN_VENDOR_MARKER "ipbridge"
#define HUESCAN_DEFAULT_MAN "\"ssdp:discover\""
#define HUESCAN_MAX_DATAGRAM 8192

namespace huescan
{

struct discovery_config
{
    // Receiving endpoint
    std::string listen_ip = HUESCAN_LISTEN_IP;
    uint16_t listen_port = HUESCAN_DISCOVERY_PORT;

    // Destination of the search request
    std::string multicast_ip = HUESCAN_DISCOVERY_IP;
    uint16_t multicast_port = HUESCAN_DISCOVERY_PORT;

    /// Absolute collection deadline, counted from the moment the endpoint is open.
    /// Must lie in (0, HUESCAN_MAX_DISCOVERY_TIME].
    std::chrono::milliseconds timeout {HUESCAN_DISCOVERY_TIME};

    /// Max-wait hint advertised to responders, independent of timeout
    unsigned int mx = HUESCAN_DISCOVERY_MX;

    std::string search_target = HUESCAN_SEARCH_TARGET;

    /// Matched case-insensitively against the whole reply
    std::string vendor_marker = HUESCAN_VENDOR_MARKER;

    size_t max_datagram_size = HUESCAN_MAX_DATAGRAM;

    bool verbose = false;
};

} // namespace huescan

#endif
