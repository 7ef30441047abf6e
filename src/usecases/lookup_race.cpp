#include "fq/resolver.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include "fq/concurrency.hpp"

namespace fq
{
namespace
{
// Shared by the control thread and every worker of one lookup. Workers
// hold it past an early return, so it lives on the heap.
struct Race
{
    HandoffSlot<PacketPtr> winner;
    WaitGroup workers;
};

struct DoneGuard
{
    WaitGroup &wg;
    ~DoneGuard() { wg.done(); }
};

struct Attempt
{
    std::shared_ptr<Race> race;
    std::shared_ptr<Exchanger> exchanger;
    std::shared_ptr<Logger> log;
    PacketPtr query; // worker-owned copy
    std::string qname;
    std::string nameserver;
    Transport net;
    std::chrono::milliseconds timeout;
    bool trust_negative;
};

void run_attempt(Attempt a)
{
    DoneGuard done{a.race->workers};

    if (!a.query || !a.exchanger)
    {
        a.log->error("{} cannot query {}: no {}", a.qname, a.nameserver,
                     a.query ? "exchanger" : "query copy");
        return;
    }

    ExchangeResult r;
    try
    {
        r = a.exchanger->exchange(*a.query, a.nameserver, a.net, a.timeout);
    }
    catch (const std::exception &e)
    {
        r.rc = -1;
        r.error = e.what();
    }

    if (r.rc != 0 || !r.response)
    {
        a.log->warn("{} socket error on {}", a.qname, a.nameserver);
        a.log->warn("error:{}", r.error.empty() ? "no response" : r.error);
        return;
    }

    const ldns_pkt_rcode rcode = ldns_pkt_get_rcode(r.response.get());
    if (rcode != LDNS_RCODE_NOERROR)
    {
        a.log->warn("{} failed to get a valid answer on {} ({})",
                    a.qname, a.nameserver, rcode_str(rcode));
    }
    else
    {
        a.log->debug("{} resolv on {} ({}) rtt: {:.3f} ms",
                     unfqdn(a.qname), a.nameserver, transport_str(a.net), r.ms);
    }
    if (answer_verdict(rcode, a.trust_negative) == Verdict::Skip) return;

    // a full slot means another upstream already won
    a.race->winner.try_publish(std::move(r.response));
}
} // namespace

Verdict answer_verdict(ldns_pkt_rcode rcode, bool trust_negative)
{
    if (rcode == LDNS_RCODE_NOERROR) return Verdict::Publish;
    if (rcode == LDNS_RCODE_SERVFAIL) return Verdict::Skip;
    return trust_negative ? Verdict::Publish : Verdict::Skip;
}

LookupResult Resolver::lookup(Transport net, const ldns_pkt &req) const
{
    LookupResult out{};

    if (!has_question(&req))
    {
        log_->error("refusing query without question ({})", transport_str(net));
        out.error = LookupError{LookupErrorKind::InvalidQuery, {}, net, {}};
        return out;
    }

    const std::vector<std::string> ns = nameservers();

    const std::string qname = question_name(&req);
    const auto tmo = timeout(resolv_);
    const auto step = interval(resolv_);
    auto race = std::make_shared<Race>();

    // top-down, one more upstream every interval, exit early on an answer
    for (const auto &nameserver: ns)
    {
        Attempt a{race, exchanger_, log_, clone_packet(&req), qname,
                  nameserver, net, tmo, resolv_.trust_negative};
        race->workers.add();
        try
        {
            std::thread(run_attempt, std::move(a)).detach();
        }
        catch (const std::system_error &e)
        {
            race->workers.done();
            log_->error("{} failed to start worker for {}: {}",
                        qname, nameserver, e.what());
        }

        if (auto r = race->winner.take_for(step))
        {
            out.response = std::move(*r);
            return out;
        }
    }

    // every worker is bounded by its own exchange timeout
    race->workers.wait();
    if (auto r = race->winner.try_take())
    {
        out.response = std::move(*r);
        return out;
    }

    out.error = LookupError{LookupErrorKind::Exhausted, qname, net, ns};
    return out;
}
} // namespace fq
