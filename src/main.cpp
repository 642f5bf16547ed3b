#include <string>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <chrono>
#include <charconv>
#include <system_error>
#include <unistd.h>

#include <fmt/format.h>

#include "huescan/ssdp_discovery.hpp"

static void print_usage(const char* prog)
{
    fmt::print(stderr, "Usage: {} [-v] [-t <timeout-ms>] [-m <man-token>]\n", prog);
}

static void print_bridges(const huescan::discovery_result& res)
{
    for(const auto& addr : res.addresses)
        fmt::print("{}\n", addr);
    fmt::print("Found {} bridge(s) among {} responder(s)\n", res.addresses.size(), res.response_count);
}

int main(int argc, char** argv)
{
    huescan::discovery_config config;
    std::string man = HUESCAN_DEFAULT_MAN;

    int opt;
    while((opt = getopt(argc, argv, "vt:m:")) != -1)
    {
        switch(opt)
        {
            case 'v':
                config.verbose = true;
                break;
            case 't':
            {
                std::string_view arg {optarg};
                long ms = 0;
                auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), ms);
                if(ec != std::errc {} || ptr != arg.data() + arg.size() || ms <= 0 || ms > HUESCAN_MAX_DISCOVERY_TIME)
                {
                    fmt::print(stderr, "Invalid timeout: {} (expected 1..{} ms)\n", arg, HUESCAN_MAX_DISCOVERY_TIME);
                    return 2;
                }
                config.timeout = std::chrono::milliseconds {ms};
                break;
            }
            case 'm':
                man = optarg;
                break;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }
    if(optind != argc)
    {
        print_usage(argv[0]);
        return 2;
    }

    fmt::print("Scanning network for bridges...\n");
    try {
        print_bridges(huescan::discover(man, config));
    } catch(const huescan::discovery_error& e) {
        print_bridges(e.partial());
        fmt::print(stderr, "Discovery failed: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
