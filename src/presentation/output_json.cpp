#include "fq/output.hpp"

#include <sstream>

#include "fq/json.hpp"
#include "fq/options.hpp"
#include "fq/packet.hpp"
#include "fq/resolver.hpp"

namespace fq
{
static const char *jbool(bool v)
{
    return v ? "true" : "false";
}

static void write_string_array(std::ostringstream &os,
                               const std::vector<std::string> &items)
{
    os << "[";
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) os << ",";
        os << R"(")" << json_escape(items[i]) << R"(")";
    }
    os << "]";
}

std::string build_result_json(const Options &opt,
                              const std::vector<std::string> &upstreams,
                              const LookupResult &result)
{
    std::ostringstream os;
    os << "{";
    os << R"("name":")" << json_escape(opt.query.name) << R"(",)";
    os << R"("type":")" << json_escape(opt.query.qtype) << R"(",)";
    os << R"("transport":")" << transport_str(opt.net) << R"(",)";
    if (opt.net == Transport::Http)
    {
        os << R"("relay":")" << json_escape(opt.http.remote + "/" + opt.http.resolver)
                << R"(",)";
    }
    else
    {
        os << R"("upstreams":)";
        write_string_array(os, upstreams);
        os << R"(,"timeout_s":)" << opt.resolv.timeout_s
                << R"(,"interval_ms":)" << opt.resolv.interval_ms << ",";
    }
    os << R"("ok":)" << jbool(result.ok());

    if (!result.ok())
    {
        os << R"(,"error":{"kind":")" << lookup_error_kind_str(result.error.kind)
                << R"(","message":")" << json_escape(result.error.message())
                << R"("})";
        os << "}";
        return os.str();
    }

    const ldns_pkt *pkt = result.response.get();
    const ldns_pkt_rcode rcode = ldns_pkt_get_rcode(pkt);
    os << R"(,"rcode":")" << json_escape(rcode_str(rcode))
            << R"(","rcode_value":)" << static_cast<int>(rcode)
            << R"(,"id":)" << ldns_pkt_id(pkt);
    os << R"(,"flags":{"qr":)" << jbool(ldns_pkt_qr(pkt))
            << R"(,"aa":)" << jbool(ldns_pkt_aa(pkt))
            << R"(,"tc":)" << jbool(ldns_pkt_tc(pkt))
            << R"(,"rd":)" << jbool(ldns_pkt_rd(pkt))
            << R"(,"ra":)" << jbool(ldns_pkt_ra(pkt))
            << R"(,"ad":)" << jbool(ldns_pkt_ad(pkt))
            << R"(,"cd":)" << jbool(ldns_pkt_cd(pkt)) << "}";
    os << R"(,"counts":{"answer":)" << ldns_pkt_ancount(pkt)
            << R"(,"authority":)" << ldns_pkt_nscount(pkt)
            << R"(,"additional":)" << ldns_pkt_arcount(pkt) << "}";
    os << R"(,"answers":)";
    write_string_array(os, answer_lines(pkt));
    os << "}";
    return os.str();
}
} // namespace fq
