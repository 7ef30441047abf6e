#include "fq/packet.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace fq
{
namespace
{
// ldns hands out malloc'd C strings; take ownership into std::string.
std::string take_ldns_str(char *s)
{
    if (!s) return {};
    std::string out(s);
    LDNS_FREE(s);
    return out;
}

const ldns_rr *first_question(const ldns_pkt *pkt)
{
    if (!pkt || ldns_pkt_qdcount(pkt) == 0) return nullptr;
    const ldns_rr_list *q = ldns_pkt_question(pkt);
    if (!q || ldns_rr_list_rr_count(q) == 0) return nullptr;
    return ldns_rr_list_rr(q, 0);
}
} // namespace

PacketPtr clone_packet(const ldns_pkt *pkt)
{
    if (!pkt) return nullptr;
    return PacketPtr(ldns_pkt_clone(pkt));
}

ldns_rr_type parse_rr_type(std::string_view name)
{
    std::string upper(name);
    std::ranges::transform(
        upper,
        upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return ldns_get_rr_type_by_name(upper.c_str());
}

bool seed_query_ids()
{
    return ldns_init_random(nullptr, 0) == 0;
}

QueryBuildResult make_query(const QueryOptions &opt, uint16_t id)
{
    QueryBuildResult out{};

    const ldns_rr_type qtype = parse_rr_type(opt.qtype);
    if (qtype == 0)
    {
        out.kind = QueryErrorKind::UnknownType;
        out.error = "unknown query type: " + opt.qtype;
        return out;
    }

    ldns_rdf *name = opt.name.empty()
                         ? nullptr
                         : ldns_dname_new_frm_str(opt.name.c_str());
    if (!name)
    {
        out.kind = QueryErrorKind::InvalidQname;
        out.error = "invalid qname: " + opt.name;
        return out;
    }

    // the packet takes ownership of name
    ldns_pkt *pkt = ldns_pkt_query_new(
        name,
        qtype,
        LDNS_RR_CLASS_IN,
        opt.rd ? LDNS_RD : 0);
    if (!pkt)
    {
        out.kind = QueryErrorKind::BuildFailed;
        out.error = "failed to allocate query packet";
        return out;
    }

    ldns_pkt_set_id(pkt, id);
    if (opt.edns0 || opt.do_bit)
    {
        ldns_pkt_set_edns_udp_size(pkt, 1232);
        ldns_pkt_set_edns_do(pkt, opt.do_bit);
    }
    out.query.reset(pkt);
    return out;
}

bool has_question(const ldns_pkt *pkt)
{
    return first_question(pkt) != nullptr;
}

std::string question_name(const ldns_pkt *pkt)
{
    const ldns_rr *q = first_question(pkt);
    if (!q) return {};
    return take_ldns_str(ldns_rdf2str(ldns_rr_owner(q)));
}

std::string question_type_str(const ldns_pkt *pkt)
{
    const ldns_rr *q = first_question(pkt);
    if (!q) return {};
    return take_ldns_str(ldns_rr_type2str(ldns_rr_get_type(q)));
}

std::string unfqdn(std::string_view name)
{
    if (!name.empty() && name.back() == '.') name.remove_suffix(1);
    return std::string(name);
}

std::string rcode_str(ldns_pkt_rcode rcode)
{
    std::string s = take_ldns_str(ldns_pkt_rcode2str(rcode));
    if (s.empty()) s = "RCODE" + std::to_string(static_cast<int>(rcode));
    return s;
}

std::vector<std::string> answer_lines(const ldns_pkt *pkt)
{
    std::vector<std::string> out;
    const ldns_rr_list *ans = pkt ? ldns_pkt_answer(pkt) : nullptr;
    if (!ans) return out;

    const size_t n = ldns_rr_list_rr_count(ans);
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        std::string line = take_ldns_str(ldns_rr2str(ldns_rr_list_rr(ans, i)));
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        {
            line.pop_back();
        }
        out.push_back(std::move(line));
    }
    return out;
}

PacketPtr decode_wire(const std::vector<uint8_t> &wire)
{
    if (wire.empty()) return nullptr;
    ldns_pkt *pkt = nullptr;
    const ldns_status st = ldns_wire2pkt(&pkt, wire.data(), wire.size());
    if (st != LDNS_STATUS_OK)
    {
        if (pkt) ldns_pkt_free(pkt);
        return nullptr;
    }
    return PacketPtr(pkt);
}

bool encode_wire(const ldns_pkt *pkt, std::vector<uint8_t> &wire)
{
    if (!pkt) return false;
    uint8_t *buf = nullptr;
    size_t size = 0;
    if (ldns_pkt2wire(&buf, pkt, &size) != LDNS_STATUS_OK || !buf) return false;
    wire.assign(buf, buf + size);
    LDNS_FREE(buf);
    return true;
}

bool decode_base64(std::string_view text, std::vector<uint8_t> &out)
{
    // ldns_b64_pton stops at the first NUL, which would accept a prefix
    if (text.find('\0') != std::string_view::npos) return false;
    const std::string src(text);
    std::vector<uint8_t> buf(ldns_b64_pton_calculate_size(src.size()) + 1);
    const int n = ldns_b64_pton(src.c_str(), buf.data(), buf.size());
    if (n < 0) return false;
    buf.resize(static_cast<size_t>(n));
    out = std::move(buf);
    return true;
}
} // namespace fq
