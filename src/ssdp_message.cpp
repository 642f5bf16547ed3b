#include "huescan/ssdp_message.hpp"
#include "huescan/utils.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace huescan
{

std::string render_search_request(std::string_view man, const discovery_config& config)
{
    // Keep the trailing empty line, it terminates the request
    std::string body = fmt::format(
        "M-SEARCH * HTTP/1.1\n"
        "HOST: {}:{}\n"
        "ST: {}\n"
        "MAN: {}\n"
        "MX: {}\n"
        "\n",
        config.multicast_ip, config.multicast_port, config.search_target, man, config.mx);

    std::string raw;
    raw.reserve(body.size() + 8);
    for(char c : body)
    {
        if(c == '\n')
            raw.push_back('\r');
        raw.push_back(c);
    }

    return raw;
}

ssdp_message parse_message(std::string_view view)
{
    ssdp_message msg;
    bool start_line = true;

    while(!view.empty())
    {
        size_t endl = view.find('\n');
        std::string_view line = view.substr(0, endl);
        view.remove_prefix((endl == std::string_view::npos) ? view.size() : endl + 1);

        if(!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if(start_line)
        {
            msg.start_line = std::string {line};
            start_line = false;
            continue;
        }

        // End of header section
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            continue;

        msg.headers.emplace(utils::to_lower(utils::trim(line.substr(0, sep))),
            std::string {utils::trim(line.substr(sep + 1))});
    }

    return msg;
}

std::string location_host(std::string_view view)
{
    const std::string original {view};

    // Scheme is matched case-insensitively, offsets are the same in both strings
    size_t tmp = utils::to_lower(view).find("http://");
    if(tmp == std::string::npos)
        throw std::invalid_argument {fmt::format("Location without http scheme: {}", original)};
    view.remove_prefix(tmp + 7);

    tmp = view.find(':');
    if(tmp == std::string_view::npos)
        throw std::invalid_argument {fmt::format("Location without explicit port: {}", original)};

    return std::string {view.substr(0, tmp)};
}

} // namespace huescan
