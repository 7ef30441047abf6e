#include "fq/exchange.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <sys/time.h>

#include "fq/nameservers.hpp"

namespace fq
{
namespace
{
struct ResolverDeleter
{
    void operator()(ldns_resolver *r) const { ldns_resolver_deep_free(r); }
};

using ResolverPtr = std::unique_ptr<ldns_resolver, ResolverDeleter>;

struct RdfDeleter
{
    void operator()(ldns_rdf *rdf) const { ldns_rdf_deep_free(rdf); }
};

ldns_rdf *address_rdf(const std::string &host)
{
    if (host.find(':') != std::string::npos)
    {
        return ldns_rdf_new_frm_str(LDNS_RDF_TYPE_AAAA, host.c_str());
    }
    return ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, host.c_str());
}

double elapsed_ms(std::chrono::steady_clock::time_point t0)
{
    auto t1 = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}
} // namespace

ExchangeResult LdnsExchanger::exchange(const ldns_pkt &query,
                                       const std::string &nameserver,
                                       Transport net,
                                       std::chrono::milliseconds timeout)
{
    ExchangeResult out{};
    auto t0 = std::chrono::steady_clock::now();

    auto fail = [&](std::string err)
    {
        out.ms = elapsed_ms(t0);
        out.rc = -1;
        out.error = std::move(err);
        return std::move(out);
    };

    std::string host;
    uint16_t port = 0;
    if (!split_hostport(nameserver, host, port))
    {
        return fail("invalid nameserver address: " + nameserver);
    }

    ResolverPtr res(ldns_resolver_new());
    if (!res) return fail("ldns_resolver init failed");

    std::unique_ptr<ldns_rdf, RdfDeleter> ns_rdf(address_rdf(host));
    if (!ns_rdf) return fail("not an IP address: " + host);
    if (ldns_resolver_push_nameserver(res.get(), ns_rdf.get()) != LDNS_STATUS_OK)
    {
        return fail("ldns_resolver_push_nameserver failed");
    }

    const auto ms = timeout.count();
    struct timeval tv{
        .tv_sec = static_cast<time_t>(ms / 1000),
        .tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000)
    };
    ldns_resolver_set_port(res.get(), port);
    ldns_resolver_set_timeout(res.get(), tv);
    ldns_resolver_set_retry(res.get(), 1);
    ldns_resolver_set_random(res.get(), false);
    ldns_resolver_set_usevc(res.get(), net == Transport::Tcp);
    ldns_resolver_set_fallback(res.get(), net == Transport::Udp);

    // ldns_resolver_send_pkt wants a mutable packet; never hand it the
    // caller's query, other workers read it concurrently.
    PacketPtr req = clone_packet(&query);
    if (!req) return fail("failed to copy query packet");

    ldns_pkt *answer = nullptr;
    const ldns_status st = ldns_resolver_send_pkt(&answer, res.get(), req.get());
    if (st != LDNS_STATUS_OK || !answer)
    {
        if (answer) ldns_pkt_free(answer);
        const char *why = st != LDNS_STATUS_OK ? ldns_get_errorstr_by_id(st) : nullptr;
        return fail(why ? why : "ldns query failed");
    }

    out.ms = elapsed_ms(t0);
    out.rc = 0;
    out.response.reset(answer);
    return out;
}
} // namespace fq
