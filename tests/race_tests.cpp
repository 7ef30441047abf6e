#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "fakes.hpp"
#include "fq/resolver.hpp"

using namespace fq;
using namespace std::chrono_literals;
using fqtest::FakeExchanger;
using fqtest::RecordingLogger;
using fqtest::Script;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_size(size_t a, size_t b, const char *msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b <<
                " actual=" << a << std::endl;
        std::exit(1);
    }
}

struct Rig
{
    std::shared_ptr<FakeExchanger> ex = std::make_shared<FakeExchanger>();
    std::shared_ptr<RecordingLogger> log = std::make_shared<RecordingLogger>();
    ResolvConfig cfg{};

    Resolver make() const
    {
        return Resolver(cfg, HttpConfig{}, ex, nullptr, log);
    }
};

static long elapsed_ms(std::chrono::steady_clock::time_point t0)
{
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count());
}

static void test_single_upstream_success()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1"};
    rig.ex->script("192.0.2.1:53", Script{.addr = "198.51.100.1"});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(r.ok(), "single: response returned");
    assert_true(r.error.kind == LookupErrorKind::None, "single: no error");
    assert_true(ldns_pkt_get_rcode(r.response.get()) == LDNS_RCODE_NOERROR, "single: NOERROR");
    assert_eq_size(ldns_pkt_ancount(r.response.get()), 1, "single: one answer");
    assert_true(rig.ex->nets().at(0) == Transport::Udp, "single: transport passed through");
    assert_true(rig.ex->last_timeout() == 5000ms, "single: default 5s per-attempt timeout");
}

static void test_all_servfail_exhausts_in_dispatch_order()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2#5353", "192.0.2.3"};
    rig.cfg.interval_ms = 10;
    for (const char *ns: {"192.0.2.1:53", "192.0.2.2:5353", "192.0.2.3:53"})
    {
        rig.ex->script(ns, Script{.rcode = LDNS_RCODE_SERVFAIL});
    }

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Tcp, *q);
    assert_true(!r.ok(), "servfail: no response");
    assert_true(r.error.kind == LookupErrorKind::Exhausted, "servfail: exhausted");
    assert_true(r.error.qname == "example.com.", "servfail: qname carried");
    assert_true(r.error.net == Transport::Tcp, "servfail: transport carried");
    const std::vector<std::string> want{"192.0.2.1:53", "192.0.2.2:5353", "192.0.2.3:53"};
    assert_true(r.error.nameservers == want, "servfail: attempted list in order");
    assert_true(r.error.message() ==
                "example.com. resolv failed on 192.0.2.1:53; 192.0.2.2:5353; 192.0.2.3:53 (tcp)",
                "servfail: message format");
    assert_true(rig.ex->calls() == want, "servfail: every upstream dispatched once, in order");
    assert_true(rig.log->contains("failed to get a valid answer"), "servfail: logged");
}

static void test_transport_errors_are_skipped()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2"};
    rig.cfg.interval_ms = 10;
    rig.ex->script("192.0.2.1:53", Script{.transport_error = true});
    rig.ex->script("192.0.2.2:53", Script{.delay = 30ms, .addr = "198.51.100.2"});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(r.ok(), "transport: second upstream answers");
    assert_true(rig.log->contains("socket error on 192.0.2.1:53"), "transport: error logged");
    assert_true(rig.log->contains("error:timed out"), "transport: error text logged");
}

static void test_all_transport_errors_exhaust()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2"};
    rig.cfg.interval_ms = 5;
    rig.ex->script("192.0.2.1:53", Script{.transport_error = true});
    rig.ex->script("192.0.2.2:53", Script{.transport_error = true});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(r.error.kind == LookupErrorKind::Exhausted, "all transport errors: exhausted");
    assert_eq_size(r.error.nameservers.size(), 2, "all transport errors: both listed");
}

static void test_negative_answer_ends_race_early()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2", "192.0.2.3", "192.0.2.4"};
    rig.cfg.interval_ms = 150;
    rig.ex->script("192.0.2.1:53", Script{.delay = 600ms, .rcode = LDNS_RCODE_SERVFAIL});
    rig.ex->script("192.0.2.2:53", Script{.rcode = LDNS_RCODE_NXDOMAIN});

    auto q = fqtest::query_for("nope.example");
    auto t0 = std::chrono::steady_clock::now();
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    const long ms = elapsed_ms(t0);

    assert_true(r.ok(), "nxdomain: returned as a response, not an error");
    assert_true(ldns_pkt_get_rcode(r.response.get()) == LDNS_RCODE_NXDOMAIN, "nxdomain: rcode kept");
    assert_eq_size(rig.ex->calls().size(), 2, "nxdomain: upstreams past the answer never dispatched");
    assert_true(ms < 500, "nxdomain: did not wait for the slow first upstream");

    std::this_thread::sleep_for(700ms); // let the slow loser finish
    assert_eq_size(rig.ex->calls().size(), 2, "nxdomain: nothing dispatched after return");
}

static void test_negative_answer_skipped_without_trust()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2"};
    rig.cfg.interval_ms = 20;
    rig.cfg.trust_negative = false;
    rig.ex->script("192.0.2.1:53", Script{.rcode = LDNS_RCODE_NXDOMAIN});
    rig.ex->script("192.0.2.2:53", Script{.delay = 20ms, .addr = "198.51.100.2"});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(r.ok(), "no-trust: later upstream answers");
    assert_true(ldns_pkt_get_rcode(r.response.get()) == LDNS_RCODE_NOERROR, "no-trust: NOERROR wins");
}

static void test_empty_upstream_list_fails_immediately()
{
    Rig rig;
    rig.cfg.interval_ms = 1000;

    auto q = fqtest::query_for("example.com");
    auto t0 = std::chrono::steady_clock::now();
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(elapsed_ms(t0) < 200, "empty: no dispatch delay");
    assert_true(r.error.kind == LookupErrorKind::Exhausted, "empty: exhausted");
    assert_true(r.error.nameservers.empty(), "empty: no attempted upstreams");
    assert_true(rig.ex->calls().empty(), "empty: no exchange");
}

static void test_exactly_one_winner_among_many()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2", "192.0.2.3"};
    rig.cfg.interval_ms = 0;
    rig.ex->script("192.0.2.1:53", Script{.delay = 20ms, .addr = "198.51.100.1"});
    rig.ex->script("192.0.2.2:53", Script{.delay = 20ms, .addr = "198.51.100.2"});
    rig.ex->script("192.0.2.3:53", Script{.delay = 20ms, .addr = "198.51.100.3"});

    for (int i = 0; i < 20; ++i)
    {
        auto q = fqtest::query_for("example.com");
        LookupResult r = rig.make().lookup(Transport::Udp, *q);
        assert_true(r.ok(), "many: a response is returned");
        assert_eq_size(ldns_pkt_ancount(r.response.get()), 1, "many: one answer, from one upstream");
        assert_true(ldns_pkt_id(r.response.get()) == 0x1234, "many: id of the query");
    }
    std::this_thread::sleep_for(100ms);
}

static void test_late_answer_picked_up_after_barrier()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1"};
    rig.cfg.interval_ms = 10;
    rig.ex->script("192.0.2.1:53", Script{.delay = 150ms, .addr = "198.51.100.1"});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(r.ok(), "late: answer after the last interval still wins");
}

static void test_duplicates_queried_independently()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.1"};
    rig.cfg.interval_ms = 5;
    rig.ex->script("192.0.2.1:53", Script{.rcode = LDNS_RCODE_SERVFAIL});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(!r.ok(), "dup: exhausted");
    assert_eq_size(rig.ex->calls().size(), 2, "dup: no dedup");
}

static void test_query_without_question_is_refused()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1"};
    PacketPtr empty(ldns_pkt_new());

    LookupResult r = rig.make().lookup(Transport::Udp, *empty);
    assert_true(r.error.kind == LookupErrorKind::InvalidQuery, "noq: invalid query");
    assert_true(rig.ex->calls().empty(), "noq: nothing dispatched");
    assert_true(r.error.nameservers.empty(), "noq: no upstream reported as attempted");
}

static void test_throwing_exchanger_counts_as_socket_error()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2"};
    rig.cfg.interval_ms = 5;
    rig.ex->script("192.0.2.1:53", Script{.throws = true});
    rig.ex->script("192.0.2.2:53", Script{.delay = 10ms, .addr = "198.51.100.2"});

    auto q = fqtest::query_for("example.com");
    LookupResult r = rig.make().lookup(Transport::Udp, *q);
    assert_true(r.ok(), "throw: other upstream still answers");
    assert_true(rig.log->contains("exchanger blew up"), "throw: exception text logged");
}

static void test_caller_may_drop_query_while_losers_run()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1", "192.0.2.2"};
    rig.cfg.interval_ms = 50;
    rig.ex->script("192.0.2.1:53", Script{.delay = 200ms, .addr = "198.51.100.1"});
    rig.ex->script("192.0.2.2:53", Script{.addr = "198.51.100.2"});

    {
        auto q = fqtest::query_for("example.com");
        Resolver res = rig.make();
        LookupResult r = res.lookup(Transport::Udp, *q);
        assert_true(r.ok(), "drop: winner returned");
    }
    // query and resolver are gone; the loser owns its copies
    std::this_thread::sleep_for(300ms);
    assert_eq_size(rig.ex->calls().size(), 2, "drop: loser ran to completion");
}

static void test_answer_verdict_policy()
{
    assert_true(answer_verdict(LDNS_RCODE_NOERROR, true) == Verdict::Publish, "verdict: noerror");
    assert_true(answer_verdict(LDNS_RCODE_NOERROR, false) == Verdict::Publish, "verdict: noerror no-trust");
    assert_true(answer_verdict(LDNS_RCODE_SERVFAIL, true) == Verdict::Skip, "verdict: servfail");
    assert_true(answer_verdict(LDNS_RCODE_NXDOMAIN, true) == Verdict::Publish, "verdict: nxdomain");
    assert_true(answer_verdict(LDNS_RCODE_REFUSED, true) == Verdict::Publish, "verdict: refused");
    assert_true(answer_verdict(LDNS_RCODE_NXDOMAIN, false) == Verdict::Skip, "verdict: nxdomain no-trust");
}

static void test_resolve_dispatches_on_transport()
{
    Rig rig;
    rig.cfg.nameservers = {"192.0.2.1"};
    rig.ex->script("192.0.2.1:53", Script{.addr = "198.51.100.1"});
    auto http = std::make_shared<fqtest::FakeHttpClient>(
        HttpResult{.rc = -1, .error = "connection refused", .kind = HttpErrorKind::Transport});
    Resolver res(rig.cfg, HttpConfig{"http://relay.test", "resolve"}, rig.ex, http, rig.log);

    auto q = fqtest::query_for("example.com");
    LookupResult viaTcp = res.resolve(Transport::Tcp, *q);
    assert_true(viaTcp.ok(), "resolve: tcp goes through the race");
    assert_true(rig.ex->nets().back() == Transport::Tcp, "resolve: tcp transport used");

    LookupResult viaHttp = res.resolve(Transport::Http, *q);
    assert_true(viaHttp.error.kind == LookupErrorKind::Unknown, "resolve: http goes through the relay");
    assert_eq_size(http->urls().size(), 1, "resolve: one relay request");
    assert_eq_size(rig.ex->calls().size(), 1, "resolve: relay never falls back to the race");
}

int main()
{
    test_single_upstream_success();
    test_all_servfail_exhausts_in_dispatch_order();
    test_transport_errors_are_skipped();
    test_all_transport_errors_exhaust();
    test_negative_answer_ends_race_early();
    test_negative_answer_skipped_without_trust();
    test_empty_upstream_list_fails_immediately();
    test_exactly_one_winner_among_many();
    test_late_answer_picked_up_after_barrier();
    test_duplicates_queried_independently();
    test_query_without_question_is_refused();
    test_throwing_exchanger_counts_as_socket_error();
    test_caller_may_drop_query_while_losers_run();
    test_answer_verdict_policy();
    test_resolve_dispatches_on_transport();
    std::cout << "race_tests: OK" << std::endl;
    return 0;
}
