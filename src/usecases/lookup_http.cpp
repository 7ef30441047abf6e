#include "fq/resolver.hpp"

#include <cstdint>
#include <vector>

namespace fq
{
std::string relay_url(const HttpConfig &http,
                      const std::string &qname,
                      const std::string &qtype)
{
    return http.remote + "/" + http.resolver + "/" + unfqdn(qname) + "/" + qtype;
}

LookupResult Resolver::lookup_http(const ldns_pkt &req) const
{
    LookupResult out{};
    const std::string qname = question_name(&req);
    out.error = LookupError{LookupErrorKind::Unknown, qname, Transport::Http, {}};

    if (!has_question(&req)) return out;
    if (!http_client_)
    {
        log_->error("http.get: err=no http client configured");
        return out;
    }

    const std::string url = relay_url(http_, qname, question_type_str(&req));
    log_->debug("http.get: url={}", url);

    HttpResult hr = http_client_->get(url, timeout(resolv_));
    if (hr.rc != 0)
    {
        if (hr.kind == HttpErrorKind::BodyRead) log_->error("http.read: err={}", hr.error);
        else log_->error("http.get: err={}", hr.error);
        return out;
    }
    if (hr.status != 200)
    {
        log_->warn("http.get: status={} url={}", hr.status, url);
    }

    std::vector<uint8_t> wire;
    if (!decode_base64(hr.body, wire))
    {
        log_->error("http.DecodeString: err=illegal base64 data ({} bytes)", hr.body.size());
        return out;
    }

    PacketPtr msg = decode_wire(wire);
    if (!msg)
    {
        log_->error("http.Unpack: err=malformed message ({} bytes)", wire.size());
        return out;
    }

    ldns_pkt_set_id(msg.get(), ldns_pkt_id(&req));
    out.response = std::move(msg);
    out.error = LookupError{};
    return out;
}
} // namespace fq
