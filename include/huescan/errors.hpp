#ifndef HUESCAN_ERRORS_HPP
#define HUESCAN_ERRORS_HPP

#include <string>
#include <utility>
#include <stdexcept>

#include "huescan/discovery_result.hpp"

namespace huescan
{

// Reply that breaks the discovery protocol. Replies that are merely irrelevant
// are reported as "not valid" instead.
class malformed_response : public std::runtime_error
{
public:
    explicit malformed_response(const std::string& what)
        : std::runtime_error {what}
    {}
};

class discovery_error : public std::runtime_error
{
public:

    enum class error_kind
    {
        setup_failed,
        transport_failed,
        malformed_response
    };

    discovery_error(error_kind kind, const std::string& what, discovery_result partial = {})
        : std::runtime_error {what}, m_kind {kind}, m_partial {std::move(partial)}
    {}

    error_kind kind() const
    {
        return m_kind;
    }

    // Whatever was collected before the failure. Not complete.
    const discovery_result& partial() const
    {
        return m_partial;
    }

private:

    error_kind m_kind;

    discovery_result m_partial;

};

} // namespace huescan

#endif
