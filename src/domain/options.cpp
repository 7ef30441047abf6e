#include "fq/options.hpp"

namespace fq
{
const char *transport_str(Transport net)
{
    switch (net)
    {
        case Transport::Udp: return "udp";
        case Transport::Tcp: return "tcp";
        case Transport::Http: return "http";
    }
    return "udp";
}

// A zero timeout would fail every exchange at once; fall back to the default.
std::chrono::milliseconds timeout(const ResolvConfig &cfg)
{
    if (cfg.timeout_s <= 0) return std::chrono::seconds(ResolvConfig{}.timeout_s);
    return std::chrono::seconds(cfg.timeout_s);
}

std::chrono::milliseconds interval(const ResolvConfig &cfg)
{
    return std::chrono::milliseconds(cfg.interval_ms > 0 ? cfg.interval_ms : 0);
}
} // namespace fq
