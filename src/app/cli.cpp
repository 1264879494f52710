#include "qf/cli.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <print>
#include <string>
#include <string_view>
#include <utility>

#include "qf/endpoint.hpp"

using namespace std::string_view_literals;

namespace qf {

void print_usage(const char *prog)
{
    std::println("DNS query load generator");
    std::println("Usage: {} -s SERVER [options]", prog);
    std::println("Options:");
    std::println("  -p, --threads N    Number of parallel workers (default: 10)");
    std::println("  -n, --number N     Queries per worker (default: 100)");
    std::println(
        "  -d, --domains FILE Newline-delimited domain list (default: domains.txt)");
    std::println("  -r, --record RR    Query type: A|AAAA (default: A)");
    std::println("  -s, --server ADDR  DNS server ip:port or [ipv6]:port (required)");
    std::println(
        "  -t, --timeout MS   Per-request timeout in milliseconds (default: 500)");
    std::println(
        "  -v, --debug L      0: summary only, 1: progress, 2: per-query detail (default: 0)");
    std::println("      --json         Print the final summary as JSON");
    std::println("  -h, --help         Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} -s 127.0.0.1:53", prog);
    std::println("  {} -p 4 -n 1000 -r AAAA -t 200 -s [::1]:5353 -v 1", prog);
}

// Matches `a` against the short/long spelling of an option taking a value.
// Supports "-x V", "--long V" and "--long=V". Returns nullopt when `a` is a
// different option; sets `missing` when the value is absent.
static std::optional<std::string> take_value(std::string_view a,
                                             std::string_view short_name,
                                             std::string_view long_name,
                                             int argc,
                                             char **argv,
                                             int &i,
                                             bool &missing)
{
    if (a == short_name || a == long_name)
    {
        if (i + 1 < argc) return std::string(argv[++i]);
        std::println(stderr, "missing value for {}", a);
        missing = true;
        return std::string();
    }
    if (a.size() > long_name.size() && a.starts_with(long_name) && a[long_name.size()] == '=')
    {
        return std::string(a.substr(long_name.size() + 1));
    }
    return std::nullopt;
}

static bool parse_int(const std::string &val, std::string_view what, int &out)
{
    try
    {
        std::size_t pos = 0;
        out = std::stoi(val, &pos);
        if (pos != val.size()) throw std::invalid_argument(val);
    }
    catch (const std::exception &)
    {
        std::println(stderr, "invalid {}: {}", what, val);
        return false;
    }
    return true;
}

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        bool missing = false;

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return false;
        }
        if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (auto v = take_value(a, "-p", "--threads", argc, argv, i, missing))
        {
            if (missing || !parse_int(*v, "threads", opt.threads)) return false;
            if (opt.threads <= 0) opt.threads = 1;
        }
        else if (auto v = take_value(a, "-n", "--number", argc, argv, i, missing))
        {
            if (missing || !parse_int(*v, "number", opt.number)) return false;
            if (opt.number < 0) opt.number = 0;
        }
        else if (auto v = take_value(a, "-d", "--domains", argc, argv, i, missing))
        {
            if (missing) return false;
            if (v->empty())
            {
                std::println(stderr, "invalid --domains usage");
                return false;
            }
            opt.domains = std::move(*v);
        }
        else if (auto v = take_value(a, "-r", "--record", argc, argv, i, missing))
        {
            if (missing) return false;
            std::string val = std::move(*v);
            // Uppercase normalize
            std::ranges::transform(
                val,
                val.begin(),
                [](unsigned char c)
                {
                    return std::toupper(c);
                });
            if (val == "A") opt.record = RecordType::A;
            else if (val == "AAAA") opt.record = RecordType::AAAA;
            else
            {
                std::println(stderr, "invalid record type: {} (expected A or AAAA)", val);
                return false;
            }
        }
        else if (auto v = take_value(a, "-s", "--server", argc, argv, i, missing))
        {
            if (missing) return false;
            if (!parse_server_address(*v))
            {
                std::println(stderr, "invalid server address: {} (expected ip:port or [ipv6]:port)", *v);
                return false;
            }
            opt.server = std::move(*v);
        }
        else if (auto v = take_value(a, "-t", "--timeout", argc, argv, i, missing))
        {
            if (missing || !parse_int(*v, "timeout", opt.timeout_ms)) return false;
            if (opt.timeout_ms < 1) opt.timeout_ms = 1;
        }
        else if (auto v = take_value(a, "-v", "--debug", argc, argv, i, missing))
        {
            if (missing || !parse_int(*v, "debug level", opt.debug)) return false;
            opt.debug = std::clamp(opt.debug, 0, 2);
        }
        else
        {
            std::println(stderr, "unknown option: {}", a);
            return false;
        }
    }
    if (opt.server.empty())
    {
        std::println(stderr, "missing required option: --server");
        return false;
    }
    return true;
}

} // namespace qf
