#include "huescan/udp_transport.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <limits>
#include <poll.h>

#include <fmt/format.h>

namespace huescan
{

int poll_timeout(std::chrono::milliseconds remaining)
{
    if(remaining.count() <= 0)
        return 0;
    if(remaining.count() > std::numeric_limits<int>::max())
        return std::numeric_limits<int>::max();
    return static_cast<int>(remaining.count());
}

void udp_transport::send(const std::string& addr, uint16_t port, std::string_view payload)
{
    m_sock.send(addr, port, payload);
}

std::optional<datagram> udp_transport::receive(deadline_t deadline)
{
    using namespace std::chrono;

    while(true)
    {
        auto remaining = std::chrono::ceil<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            return std::nullopt;

        // Wait on the descriptor so the read below never blocks past the deadline
        pollfd pfd {m_sock.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, poll_timeout(remaining));
        if(ready < 0)
        {
            if(errno == EINTR)
                continue;
            throw std::runtime_error {fmt::format("Waiting for SSDP responses failed: {}", std::strerror(errno))};
        }
        // Deadline or a clamped wait ran out, the top of the loop tells which
        if(ready == 0)
            continue;

        auto [buffer, peer] = m_sock.read<char>(m_max_datagram_size);
        return datagram {std::string {buffer.begin(), buffer.end()}, peer.addr};
    }
}

} // namespace huescan
