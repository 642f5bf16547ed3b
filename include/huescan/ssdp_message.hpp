#ifndef HUESCAN_SSDP_MESSAGE_HPP
#define HUESCAN_SSDP_MESSAGE_HPP

#include <string>
#include <string_view>
#include <map>

#include "huescan/config.hpp"

namespace huescan
{

struct ssdp_message
{
    std::string start_line;

    /// Lowercased header name => trimmed value, first occurrence wins
    std::map<std::string, std::string> headers;

    bool has_header(const std::string& key) const
    {
        return headers.find(key) != headers.end();
    }
};

// Renders the M-SEARCH request with CRLF line endings and the terminating blank line
std::string render_search_request(std::string_view man, const discovery_config& config = {});

ssdp_message parse_message(std::string_view text);

// Host part of http://<ip>:<port>/<path>, the text between the scheme and the
// next ':'. The port itself is not looked at. Throws std::invalid_argument when
// the scheme or the ':' is missing.
std::string location_host(std::string_view url);

} // namespace huescan

#endif
