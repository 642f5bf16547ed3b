#ifndef HUESCAN_RESPONSE_VALIDATOR_HPP
#define HUESCAN_RESPONSE_VALIDATOR_HPP

#include <string_view>

#include "huescan/config.hpp"

namespace huescan
{

// Decides whether one reply is a genuine bridge advertisement sent by sender.
// Returns false for traffic that is well-formed but irrelevant (NOTIFY
// messages, devices of other vendors). Throws malformed_response when the
// reply breaks the protocol or its LOCATION does not point back to sender.
bool is_valid_response(std::string_view body, std::string_view sender,
    std::string_view vendor_marker = HUESCAN_VENDOR_MARKER);

} // namespace huescan

#endif
