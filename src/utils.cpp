#include "huescan/utils.hpp"

#include <algorithm>
#include <cctype>

namespace huescan::utils
{

std::string to_lower(std::string_view view)
{
    std::string lowered {view};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::string_view trim(std::string_view view)
{
    const char* whitespace = " \t";

    size_t first = view.find_first_not_of(whitespace);
    if(first == std::string_view::npos)
        return {};

    size_t last = view.find_last_not_of(whitespace);
    return view.substr(first, last - first + 1);
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle)
{
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

} // namespace huescan::utils
