#ifndef HUESCAN_UDP_TRANSPORT_HPP
#define HUESCAN_UDP_TRANSPORT_HPP

#include <string>
#include <chrono>

#include "socketwrapper.hpp"

#include "huescan/transport.hpp"
#include "huescan/config.hpp"

namespace huescan
{

// Milliseconds handed to poll() for the time left, clamped to [0, INT_MAX].
// A clamped wait ends early and the caller polls again.
int poll_timeout(std::chrono::milliseconds remaining);

// IPv4 UDP endpoint. The socket is bound on construction and closed with the object.
class udp_transport : public transport
{
public:

    udp_transport() = delete;
    udp_transport(const udp_transport&) = delete;
    udp_transport& operator=(const udp_transport&) = delete;
    udp_transport(udp_transport&&) = default;
    udp_transport& operator=(udp_transport&&) = default;
    ~udp_transport() override = default;

    /// Throws std::runtime_error if the address cannot be bound
    udp_transport(const std::string& addr, uint16_t port, size_t max_datagram_size = HUESCAN_MAX_DATAGRAM)
        : m_sock {addr, port}, m_max_datagram_size {max_datagram_size}
    {}

    void send(const std::string& addr, uint16_t port, std::string_view payload) override;

    std::optional<datagram> receive(deadline_t deadline) override;

private:

    net::udp_socket<net::ip_version::v4> m_sock;

    size_t m_max_datagram_size;

};

} // namespace huescan

#endif
