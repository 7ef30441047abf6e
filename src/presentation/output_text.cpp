#include "fq/output.hpp"

#include <sstream>

#include "fq/options.hpp"
#include "fq/packet.hpp"
#include "fq/resolver.hpp"

namespace fq {

static const char *onoff(bool v)
{
    return v ? "on" : "off";
}

std::string format_header_text(const Options& opt, const std::vector<std::string>& upstreams)
{
    std::ostringstream os;
    os << "Query: " << opt.query.name
       << "  Type: " << opt.query.qtype
       << "  Transport: " << transport_str(opt.net) << '\n';
    if (opt.net == Transport::Http)
    {
        os << "Relay: " << opt.http.remote << '/' << opt.http.resolver << '\n';
    }
    else
    {
        os << "Upstreams:";
        if (upstreams.empty()) os << " (none)";
        for (size_t i = 0; i < upstreams.size(); ++i)
        {
            os << (i ? ", " : " ") << upstreams[i];
        }
        os << '\n';
        os << "Timeout: " << opt.resolv.timeout_s << " s"
           << "  Interval: " << opt.resolv.interval_ms << " ms"
           << "  Trust-negative: " << onoff(opt.resolv.trust_negative) << '\n';
    }
    os << "Flags: rd=" << onoff(opt.query.rd)
       << " edns=" << onoff(opt.query.edns0 || opt.query.do_bit)
       << " do=" << onoff(opt.query.do_bit) << '\n';
    return os.str();
}

std::string format_result_text(const LookupResult& result)
{
    std::ostringstream os;
    if (!result.ok())
    {
        os << "error: " << result.error.message() << '\n';
        return os.str();
    }

    const ldns_pkt *pkt = result.response.get();
    os << "Status: " << rcode_str(ldns_pkt_get_rcode(pkt))
       << "  id=" << ldns_pkt_id(pkt) << "  flags:";
    if (ldns_pkt_qr(pkt)) os << " qr";
    if (ldns_pkt_aa(pkt)) os << " aa";
    if (ldns_pkt_tc(pkt)) os << " tc";
    if (ldns_pkt_rd(pkt)) os << " rd";
    if (ldns_pkt_ra(pkt)) os << " ra";
    if (ldns_pkt_ad(pkt)) os << " ad";
    if (ldns_pkt_cd(pkt)) os << " cd";
    os << '\n';

    const auto answers = answer_lines(pkt);
    os << "Answers: " << answers.size() << '\n';
    for (const auto& line: answers)
    {
        os << "  " << line << '\n';
    }
    return os.str();
}

} // namespace fq
