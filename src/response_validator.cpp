#include "huescan/response_validator.hpp"
#include "huescan/ssdp_message.hpp"
#include "huescan/errors.hpp"
#include "huescan/utils.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace huescan
{

static constexpr std::string_view status_ok = "HTTP/1.1 200 OK";
static constexpr std::string_view notify_line = "NOTIFY * HTTP/1.1";

bool is_valid_response(std::string_view body, std::string_view sender, std::string_view vendor_marker)
{
    if(body.find(status_ok) == std::string_view::npos)
    {
        // Unsolicited advertisements share the multicast group
        if(body.find(notify_line) != std::string_view::npos)
            return false;

        throw malformed_response {fmt::format("Invalid SSDP response header: {}", body)};
    }

    ssdp_message msg = parse_message(body);

    // MUST fields from UPnP Device Architecture 1.1
    if(!msg.has_header("usn") || !msg.has_header("st"))
        throw malformed_response {fmt::format("SSDP response from {} without USN or ST", sender)};

    // Bridges announce "IpBridge" in the SERVER field
    if(!utils::contains_ignore_case(body, vendor_marker))
        return false;

    auto location = msg.headers.find("location");
    if(location == msg.headers.end())
        throw malformed_response {fmt::format("Bridge response from {} without LOCATION", sender)};

    std::string ip;
    try {
        ip = location_host(location->second);
    } catch(const std::invalid_argument& e) {
        throw malformed_response {e.what()};
    }

    if(ip != sender)
        throw malformed_response {fmt::format("Response and sender mismatch: LOCATION points to {}, sent by {}", ip, sender)};

    return true;
}

} // namespace huescan
