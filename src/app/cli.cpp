#include "fq/cli.hpp"

#include <algorithm>
#include <cctype>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace fq {

void print_usage(const char *prog)
{
    std::println("Concurrent DNS query dispatcher");
    std::println("Usage: {} [options] <name>", prog);
    std::println("Options:");
    std::println(
        "  --ns SERVER          Upstream nameserver, repeatable; SERVER#PORT overrides the port");
    std::println("  --port P             Default upstream port (default: 53)");
    std::println(
        "  --resolv-conf FILE   Read nameservers and timeout from a resolv.conf style file");
    std::println(
        "  --timeout SEC        Per-attempt send/receive timeout (default: 5)");
    std::println(
        "  --interval MS        Delay before the next upstream is queried (default: 200)");
    std::println("  --net udp|tcp|http   Transport mode (default: udp)");
    std::println("  --tcp                Shortcut for --net tcp");
    std::println("  --http               Shortcut for --net http");
    std::println("  --remote URL         Base URL of the HTTP relay");
    std::println("  --resolver-path SEG  Resolver path segment on the HTTP relay");
    std::println("  --type RR            Query type (default: A)");
    std::println("  --rd on|off          Recursion Desired flag (default: on)");
    std::println("  --edns on|off        Attach an EDNS0 OPT record (default: off)");
    std::println("  --do on|off          DNSSEC DO flag, implies EDNS0 (default: off)");
    std::println(
        "  --trust-negative on|off  A non-SERVFAIL error rcode ends the race (default: on)");
    std::println("  --json               Output the result as JSON");
    std::println("  -v, --verbose        Debug logging on stderr");
    std::println("  -h, --help           Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} --ns 1.1.1.1 --ns 9.9.9.9#9953 example.com", prog);
    std::println(
        "  {} --http --remote https://relay.example --resolver-path resolve --type AAAA example.com",
        prog);
}

namespace {

enum class Match { No, Ok, Bad };

// "--name VALUE" or "--name=VALUE"
Match take_value(std::string_view a, std::string_view name, int argc, char **argv,
                 int &i, std::string &val)
{
    if (!a.starts_with(name)) return Match::No;
    if (a.size() == name.size())
    {
        if (i + 1 >= argc) return Match::Bad;
        val = argv[++i];
        return Match::Ok;
    }
    if (a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return Match::Ok;
    }
    return Match::No;
}

bool parse_onoff(const std::string &val, bool &out)
{
    if (val == "on" || val == "1" || val == "true") out = true;
    else if (val == "off" || val == "0" || val == "false") out = false;
    else return false;
    return true;
}

bool parse_int(const std::string &val, int &out)
{
    try
    {
        size_t pos = 0;
        out = std::stoi(val, &pos);
        return pos == val.size();
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_transport(std::string_view val, Transport &net)
{
    if (val == "udp"sv) net = Transport::Udp;
    else if (val == "tcp"sv) net = Transport::Tcp;
    else if (val == "http"sv) net = Transport::Http;
    else return false;
    return true;
}

} // namespace

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;

        auto value_of = [&](std::string_view name) -> Match
        {
            Match m = take_value(a, name, argc, argv, i, val);
            if (m == Match::Bad) std::println("invalid {} usage", name);
            return m;
        };

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return false;
        }
        if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbose = true;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--tcp"sv)
        {
            opt.net = Transport::Tcp;
        }
        else if (a == "--udp"sv)
        {
            opt.net = Transport::Udp;
        }
        else if (a == "--http"sv)
        {
            opt.net = Transport::Http;
        }
        else if (Match m = value_of("--ns"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            opt.resolv.nameservers.push_back(std::move(val));
        }
        else if (Match m = value_of("--port"sv); m != Match::No)
        {
            int port = 0;
            if (m == Match::Bad) return false;
            if (!parse_int(val, port) || port <= 0 || port > 65535)
            {
                std::println("invalid --port value: {}", val);
                return false;
            }
            opt.resolv.port = std::to_string(port);
        }
        else if (Match m = value_of("--resolv-conf"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            opt.resolv.resolv_file = std::move(val);
        }
        else if (Match m = value_of("--timeout"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_int(val, opt.resolv.timeout_s) || opt.resolv.timeout_s <= 0)
            {
                std::println("invalid --timeout value: {} (seconds, at least 1)", val);
                return false;
            }
            opt.timeout_given = true;
        }
        else if (Match m = value_of("--interval"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_int(val, opt.resolv.interval_ms))
            {
                std::println("invalid --interval value: {}", val);
                return false;
            }
            if (opt.resolv.interval_ms < 0) opt.resolv.interval_ms = 0;
        }
        else if (Match m = value_of("--net"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_transport(val, opt.net))
            {
                std::println("unknown transport: {}", val);
                return false;
            }
        }
        else if (Match m = value_of("--remote"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            opt.http.remote = std::move(val);
        }
        else if (Match m = value_of("--resolver-path"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            opt.http.resolver = std::move(val);
        }
        else if (Match m = value_of("--type"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            // Uppercase normalize
            std::ranges::transform(
                val,
                val.begin(),
                [](unsigned char c)
                {
                    return std::toupper(c);
                });
            opt.query.qtype = std::move(val);
        }
        else if (Match m = value_of("--rd"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_onoff(val, opt.query.rd))
            {
                std::println("invalid --rd value: {}", val);
                return false;
            }
        }
        else if (Match m = value_of("--edns"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_onoff(val, opt.query.edns0))
            {
                std::println("invalid --edns value: {}", val);
                return false;
            }
        }
        else if (Match m = value_of("--do"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_onoff(val, opt.query.do_bit))
            {
                std::println("invalid --do value: {}", val);
                return false;
            }
        }
        else if (Match m = value_of("--trust-negative"sv); m != Match::No)
        {
            if (m == Match::Bad) return false;
            if (!parse_onoff(val, opt.resolv.trust_negative))
            {
                std::println("invalid --trust-negative value: {}", val);
                return false;
            }
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println("unknown option: {}", a);
            return false;
        }
        else
        {
            opt.query.name = std::string(a);
        }
    }
    if (opt.query.name.empty())
    {
        print_usage(argv[0]);
        return false;
    }
    if (opt.net == Transport::Http && opt.http.remote.empty())
    {
        std::println("--net http requires --remote");
        return false;
    }
    return true;
}

} // namespace fq
