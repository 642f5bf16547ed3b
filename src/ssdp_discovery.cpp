#include "huescan/ssdp_discovery.hpp"
#include "huescan/ssdp_message.hpp"
#include "huescan/response_validator.hpp"
#include "huescan/udp_transport.hpp"

#include <cstdio>
#include <memory>
#include <chrono>
#include <utility>
#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace huescan
{

using error_kind = discovery_error::error_kind;

template<typename... Args>
static void trace(const discovery_config& config, fmt::format_string<Args...> format, Args&&... args)
{
    if(config.verbose)
        fmt::print(stderr, "[huescan] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

discovery_result discover(transport& sock, std::string_view man, const discovery_config& config)
{
    discovery_result result;
    std::vector<std::string> responders;

    if(config.timeout.count() <= 0 || config.timeout.count() > HUESCAN_MAX_DISCOVERY_TIME)
        throw discovery_error {error_kind::setup_failed,
            fmt::format("Discovery timeout of {} ms out of range (1..{})", config.timeout.count(), HUESCAN_MAX_DISCOVERY_TIME)};

    const deadline_t deadline = std::chrono::steady_clock::now() + config.timeout;

    std::string request = render_search_request(man, config);
    try {
        sock.send(config.multicast_ip, config.multicast_port, request);
    } catch(const std::runtime_error& e) {
        throw discovery_error {error_kind::setup_failed,
            fmt::format("Sending M-SEARCH to {}:{} failed: {}", config.multicast_ip, config.multicast_port, e.what())};
    }
    trace(config, "M-SEARCH sent to {}:{}, collecting for {} ms", config.multicast_ip, config.multicast_port,
        config.timeout.count());

    while(true)
    {
        std::optional<datagram> reply;
        try {
            reply = sock.receive(deadline);
        } catch(const std::runtime_error& e) {
            throw discovery_error {error_kind::transport_failed,
                fmt::format("Receiving SSDP responses failed: {}", e.what()), std::move(result)};
        }

        if(!reply)
        {
            trace(config, "Deadline reached after {} responder(s)", result.response_count);
            return result;
        }

        // One host may answer once per advertised service
        if(std::find(responders.begin(), responders.end(), reply->sender) != responders.end())
        {
            trace(config, "Duplicate response from {}", reply->sender);
            continue;
        }
        responders.push_back(reply->sender);
        result.response_count = responders.size();

        bool valid;
        try {
            valid = is_valid_response(reply->payload, reply->sender, config.vendor_marker);
        } catch(const malformed_response& e) {
            throw discovery_error {error_kind::malformed_response, e.what(), std::move(result)};
        }

        if(!valid)
        {
            trace(config, "Ignoring response from {}", reply->sender);
            continue;
        }

        trace(config, "Bridge found at {}", reply->sender);
        result.addresses.push_back(reply->sender);
    }
}

discovery_result discover(std::string_view man, const discovery_config& config)
{
    transport_ptr sock;
    try {
        sock = std::make_unique<udp_transport>(config.listen_ip, config.listen_port, config.max_datagram_size);
    } catch(const std::runtime_error& e) {
        throw discovery_error {error_kind::setup_failed,
            fmt::format("Unable to listen on {}:{}: {}", config.listen_ip, config.listen_port, e.what())};
    }

    return discover(*sock, man, config);
}

} // namespace huescan
