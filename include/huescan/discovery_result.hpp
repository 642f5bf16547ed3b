#ifndef HUESCAN_DISCOVERY_RESULT_HPP
#define HUESCAN_DISCOVERY_RESULT_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace huescan
{

struct discovery_result
{
    /// Senders whose reply passed validation, in order of first sight
    std::vector<std::string> addresses;

    /// Number of distinct senders seen
    size_t response_count = 0;
};

} // namespace huescan

#endif
