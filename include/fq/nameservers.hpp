#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fq
{
// Ordered "host:port" upstream list built from raw configured entries.
// '#' in an entry is the port separator (dnsmasq syntax), otherwise
// default_port is appended. Hosts are not validated.
std::vector<std::string> normalize_nameservers(
    const std::vector<std::string> &servers,
    std::string_view default_port);

// "host:port", "[v6]:port" or "v6:port" (last colon wins).
bool split_hostport(std::string_view addr, std::string &host, uint16_t &port);
} // namespace fq
