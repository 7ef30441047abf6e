#pragma once

#include <memory>
#include <string>
#include <vector>

#include "fq/exchange.hpp"
#include "fq/http.hpp"
#include "fq/logger.hpp"
#include "fq/options.hpp"
#include "fq/packet.hpp"

namespace fq
{
enum class LookupErrorKind {
    None = 0,
    Exhausted,    // every upstream failed, timed out or answered SERVFAIL
    InvalidQuery, // the query carries no question
    Unknown,      // relay path failure; details only in the log
};

const char *lookup_error_kind_str(LookupErrorKind kind);

struct LookupError
{
    LookupErrorKind kind{LookupErrorKind::None};
    std::string qname;
    Transport net{Transport::Udp};
    std::vector<std::string> nameservers; // attempted, in dispatch order

    std::string message() const;
};

// Exactly one of response / error is set.
struct LookupResult
{
    PacketPtr response;
    LookupError error;

    bool ok() const { return response != nullptr; }
};

// What a worker does with an upstream answer.
enum class Verdict { Publish, Skip };

// NOERROR publishes. SERVFAIL skips to the next upstream. Any other rcode
// is a definitive answer and publishes, unless trust_negative is off.
Verdict answer_verdict(ldns_pkt_rcode rcode, bool trust_negative);

// {remote}/{resolver}/{name without trailing dot}/{type}
std::string relay_url(const HttpConfig &http,
                      const std::string &qname,
                      const std::string &qtype);

class Resolver
{
public:
    Resolver(ResolvConfig resolv,
             HttpConfig http,
             std::shared_ptr<Exchanger> exchanger,
             std::shared_ptr<HttpClient> http_client,
             std::shared_ptr<Logger> log);

    // Configured upstreams as "host:port", in configuration order.
    std::vector<std::string> nameservers() const;

    // Races the query over the upstreams, starting one more every
    // interval, and returns the first acceptable answer. Returns without
    // waiting for the losers; they finish on their own within the
    // per-attempt timeout and their answers are dropped.
    LookupResult lookup(Transport net, const ldns_pkt &req) const;

    // Single GET against the decoding relay. The reply id is rewritten to
    // the query id.
    LookupResult lookup_http(const ldns_pkt &req) const;

    // Http goes through the relay, Udp/Tcp through the race.
    LookupResult resolve(Transport net, const ldns_pkt &req) const;

    const ResolvConfig &resolv_config() const { return resolv_; }
    const HttpConfig &http_config() const { return http_; }

private:
    ResolvConfig resolv_;
    HttpConfig http_;
    std::shared_ptr<Exchanger> exchanger_;
    std::shared_ptr<HttpClient> http_client_;
    std::shared_ptr<Logger> log_;
};
} // namespace fq
