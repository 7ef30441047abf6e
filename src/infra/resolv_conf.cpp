#include "fq/resolv_conf.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace fq
{
ResolvConfResult parse_resolv_conf(std::istream &in, ResolvConfig &cfg)
{
    ResolvConfResult out{};
    std::vector<std::string> servers;
    int timeout_s = cfg.timeout_s;

    std::string line;
    while (std::getline(in, line))
    {
        std::istringstream fields(line);
        std::string key;
        if (!(fields >> key)) continue;
        if (key[0] == '#' || key[0] == ';') continue;

        if (key == "nameserver"sv)
        {
            std::string server;
            if (fields >> server) servers.push_back(std::move(server));
        }
        else if (key == "options"sv)
        {
            std::string opt;
            while (fields >> opt)
            {
                std::string_view v = opt;
                if (!v.starts_with("timeout:"sv)) continue;
                v.remove_prefix(8);
                int n = 0;
                auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
                if (ec == std::errc{} && ptr == v.data() + v.size() && n >= 1)
                {
                    timeout_s = n;
                }
            }
        }
    }

    if (in.bad())
    {
        out.rc = -1;
        out.error = "read error";
        return out;
    }

    out.nameservers_added = servers.size();
    cfg.nameservers.insert(cfg.nameservers.end(), servers.begin(), servers.end());
    cfg.timeout_s = timeout_s;
    return out;
}

ResolvConfResult load_resolv_conf(const std::string &path, ResolvConfig &cfg)
{
    std::ifstream in(path);
    if (!in)
    {
        ResolvConfResult out{};
        out.rc = -1;
        out.error = path + ": " + std::strerror(errno);
        return out;
    }
    ResolvConfResult out = parse_resolv_conf(in, cfg);
    if (out.rc != 0) out.error = path + ": " + out.error;
    return out;
}
} // namespace fq
