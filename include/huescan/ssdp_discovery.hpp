#ifndef HUESCAN_SSDP_DISCOVERY_HPP
#define HUESCAN_SSDP_DISCOVERY_HPP

#include <string>
#include <string_view>
#include <vector>

#include "huescan/config.hpp"
#include "huescan/discovery_result.hpp"
#include "huescan/errors.hpp"
#include "huescan/transport.hpp"

namespace huescan
{

/**
 * Runs one discovery round: sends a single M-SEARCH to the multicast group and
 * collects replies until config.timeout has passed since the call started.
 * Replies are deduplicated by sender and each first reply is validated.
 *
 * Deadline expiry is the normal end of the round. Any other failure throws
 * discovery_error carrying what was collected so far.
 */
discovery_result discover(transport& sock, std::string_view man, const discovery_config& config = {});

/// Same as above over a UDP endpoint bound to config.listen_ip:config.listen_port
discovery_result discover(std::string_view man, const discovery_config& config = {});

} // namespace huescan

#endif
