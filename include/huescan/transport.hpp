#ifndef HUESCAN_TRANSPORT_HPP
#define HUESCAN_TRANSPORT_HPP

#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <memory>
#include <cstdint>

namespace huescan
{

struct datagram
{
    std::string payload;
    std::string sender; ///< dotted IPv4 address
};

using deadline_t = std::chrono::steady_clock::time_point;

class transport
{
public:
    virtual ~transport() = default;

    // Throws std::runtime_error if the datagram cannot be sent
    virtual void send(const std::string& addr, uint16_t port, std::string_view payload) = 0;

    // Blocks until one datagram arrives or deadline passes. An empty optional
    // means the deadline passed, a transport failure throws std::runtime_error.
    virtual std::optional<datagram> receive(deadline_t deadline) = 0;
};

using transport_ptr = std::unique_ptr<transport>;

} // namespace huescan

#endif
