#ifndef HUESCAN_UTILS_HPP
#define HUESCAN_UTILS_HPP

#include <string>
#include <string_view>

namespace huescan::utils
{

std::string to_lower(std::string_view view);

// Strips spaces and tabs on both ends
std::string_view trim(std::string_view view);

bool contains_ignore_case(std::string_view haystack, std::string_view needle);

} // namespace huescan::utils

#endif
