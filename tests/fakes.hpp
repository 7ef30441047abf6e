#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "fq/exchange.hpp"
#include "fq/http.hpp"
#include "fq/logger.hpp"
#include "fq/packet.hpp"

namespace fqtest
{
class RecordingLogger : public fq::Logger
{
public:
    RecordingLogger() : fq::Logger(fq::LogLevel::Debug) {}

    bool contains(std::string_view needle) const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &l: lines_)
        {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return lines_;
    }

protected:
    void write(fq::LogLevel level, std::string_view msg) override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        lines_.push_back(std::string(fq::level_str(level)) + " " + std::string(msg));
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::string> lines_;
};

inline fq::PacketPtr query_for(const std::string &name,
                               const std::string &qtype = "A",
                               uint16_t id = 0x1234)
{
    fq::QueryOptions q{};
    q.name = name;
    q.qtype = qtype;
    return std::move(fq::make_query(q, id).query);
}

// Reply to `query` with the given rcode and, when addr is non-empty, one
// A record for the question name pointing at addr.
inline fq::PacketPtr reply_for(const ldns_pkt &query,
                               ldns_pkt_rcode rcode,
                               const std::string &addr = {})
{
    fq::PacketPtr resp = fq::clone_packet(&query);
    ldns_pkt_set_qr(resp.get(), true);
    ldns_pkt_set_ra(resp.get(), true);
    ldns_pkt_set_rcode(resp.get(), static_cast<uint8_t>(rcode));
    if (!addr.empty())
    {
        const std::string text = fq::question_name(&query) + " 300 IN A " + addr;
        ldns_rr *rr = nullptr;
        if (ldns_rr_new_frm_str(&rr, text.c_str(), 0, nullptr, nullptr) == LDNS_STATUS_OK)
        {
            ldns_pkt_push_rr(resp.get(), LDNS_SECTION_ANSWER, rr);
        }
    }
    return resp;
}

// Scripted upstream behaviour, keyed by "host:port".
struct Script
{
    std::chrono::milliseconds delay{0};
    bool transport_error = false;
    bool throws = false;
    ldns_pkt_rcode rcode = LDNS_RCODE_NOERROR;
    std::string addr; // answer A record, empty for none
};

class FakeExchanger : public fq::Exchanger
{
public:
    void script(const std::string &nameserver, Script s)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        scripts_[nameserver] = std::move(s);
    }

    fq::ExchangeResult exchange(const ldns_pkt &query,
                                const std::string &nameserver,
                                fq::Transport net,
                                std::chrono::milliseconds timeout) override
    {
        Script s;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            calls_.push_back(nameserver);
            nets_.push_back(net);
            last_timeout_ = timeout;
            auto it = scripts_.find(nameserver);
            if (it != scripts_.end()) s = it->second;
        }
        if (s.delay.count() > 0) std::this_thread::sleep_for(s.delay);

        fq::ExchangeResult out{};
        out.ms = static_cast<double>(s.delay.count());
        if (s.throws) throw std::runtime_error("exchanger blew up");
        if (s.transport_error)
        {
            out.rc = -1;
            out.error = "timed out";
            return out;
        }
        out.response = reply_for(query, s.rcode, s.addr);
        return out;
    }

    std::vector<std::string> calls() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_;
    }

    std::vector<fq::Transport> nets() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return nets_;
    }

    std::chrono::milliseconds last_timeout() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return last_timeout_;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, Script> scripts_;
    std::vector<std::string> calls_;
    std::vector<fq::Transport> nets_;
    std::chrono::milliseconds last_timeout_{0};
};

class FakeHttpClient : public fq::HttpClient
{
public:
    explicit FakeHttpClient(fq::HttpResult reply = {}) : reply_(std::move(reply)) {}

    fq::HttpResult get(const std::string &url, std::chrono::milliseconds) override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        urls_.push_back(url);
        return reply_;
    }

    std::vector<std::string> urls() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return urls_;
    }

private:
    mutable std::mutex mtx_;
    fq::HttpResult reply_;
    std::vector<std::string> urls_;
};

inline std::string base64_of(const std::vector<uint8_t> &bytes)
{
    std::string out(ldns_b64_ntop_calculate_size(bytes.size()) + 1, '\0');
    const int n = ldns_b64_ntop(bytes.data(), bytes.size(), out.data(), out.size());
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}
} // namespace fqtest
