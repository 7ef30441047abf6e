#include "fq/resolver.hpp"

#include <sstream>
#include <utility>

#include "fq/nameservers.hpp"

namespace fq
{
const char *lookup_error_kind_str(LookupErrorKind kind)
{
    switch (kind)
    {
        case LookupErrorKind::None: return "none";
        case LookupErrorKind::Exhausted: return "exhausted";
        case LookupErrorKind::InvalidQuery: return "invalid_query";
        case LookupErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::string LookupError::message() const
{
    std::ostringstream os;
    switch (kind)
    {
        case LookupErrorKind::None:
            break;
        case LookupErrorKind::Exhausted:
            os << qname << " resolv failed on ";
            for (size_t i = 0; i < nameservers.size(); ++i)
            {
                if (i) os << "; ";
                os << nameservers[i];
            }
            os << " (" << transport_str(net) << ")";
            break;
        case LookupErrorKind::InvalidQuery:
            os << "query carries no question (" << transport_str(net) << ")";
            break;
        case LookupErrorKind::Unknown:
            os << "unknown error. failed to resolve...";
            break;
    }
    return os.str();
}

Resolver::Resolver(ResolvConfig resolv,
                   HttpConfig http,
                   std::shared_ptr<Exchanger> exchanger,
                   std::shared_ptr<HttpClient> http_client,
                   std::shared_ptr<Logger> log)
    : resolv_(std::move(resolv)),
      http_(std::move(http)),
      exchanger_(std::move(exchanger)),
      http_client_(std::move(http_client)),
      log_(log ? std::move(log) : std::shared_ptr<Logger>(std::make_shared<NullLogger>()))
{
}

std::vector<std::string> Resolver::nameservers() const
{
    return normalize_nameservers(resolv_.nameservers, resolv_.port);
}

LookupResult Resolver::resolve(Transport net, const ldns_pkt &req) const
{
    if (net == Transport::Http) return lookup_http(req);
    return lookup(net, req);
}
} // namespace fq
