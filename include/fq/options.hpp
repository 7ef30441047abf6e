#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace fq
{
enum class Transport { Udp, Tcp, Http };

const char *transport_str(Transport net);

struct ResolvConfig
{
    std::vector<std::string> nameservers; // raw entries, '#' marks a port override
    std::string port = "53";              // appended when an entry has no override
    int timeout_s = 5;                    // per-attempt send/receive timeout
    int interval_ms = 200;                // stagger between upstream dispatches
    std::string resolv_file;              // resolv.conf style file (optional)
    bool trust_negative = true;           // NXDOMAIN & co. end the race
};

struct HttpConfig
{
    std::string remote;   // base URL of the decoding relay
    std::string resolver; // path segment on the relay
};

struct QueryOptions
{
    std::string name;
    std::string qtype = "A";
    bool rd = true;      // recursion desired bit
    bool edns0 = false;  // attach an OPT record
    bool do_bit = false; // DNSSEC DO bit in EDNS
};

struct Options
{
    Transport net = Transport::Udp;
    ResolvConfig resolv;
    HttpConfig http;
    QueryOptions query;
    bool json = false;          // JSON output mode
    bool verbose = false;       // debug level logging
    bool timeout_given = false; // --timeout seen; resolv.conf won't override it
};

std::chrono::milliseconds timeout(const ResolvConfig &cfg);

std::chrono::milliseconds interval(const ResolvConfig &cfg);
} // namespace fq
