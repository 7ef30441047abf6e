#include "fq/nameservers.hpp"

#include <charconv>

namespace fq
{
std::vector<std::string> normalize_nameservers(
    const std::vector<std::string> &servers,
    std::string_view default_port)
{
    std::vector<std::string> ns;
    ns.reserve(servers.size());
    for (const auto &server: servers)
    {
        const auto i = server.find('#');
        if (i != std::string::npos && i > 0)
        {
            ns.push_back(server.substr(0, i) + ":" + server.substr(i + 1));
        }
        else
        {
            ns.push_back(server + ":" + std::string(default_port));
        }
    }
    return ns;
}

bool split_hostport(std::string_view addr, std::string &host, uint16_t &port)
{
    const auto colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon == 0) return false;

    std::string_view h = addr.substr(0, colon);
    std::string_view p = addr.substr(colon + 1);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']')
    {
        h = h.substr(1, h.size() - 2);
    }
    if (h.empty() || p.empty()) return false;

    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), value);
    if (ec != std::errc{} || ptr != p.data() + p.size() || value > 65535)
    {
        return false;
    }
    host.assign(h);
    port = static_cast<uint16_t>(value);
    return true;
}
} // namespace fq
