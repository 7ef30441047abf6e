#pragma once

#include <chrono>
#include <string>

#include "fq/options.hpp"
#include "fq/packet.hpp"

namespace fq {

struct ExchangeResult {
    double ms{};
    int rc{};            // 0 on success, -1 on error
    std::string error;   // error message when rc != 0
    PacketPtr response;  // set when rc == 0
};

// One query/response exchange against one upstream.
class Exchanger {
public:
    virtual ~Exchanger() = default;

    // `timeout` bounds both the send and the receive side.
    virtual ExchangeResult exchange(const ldns_pkt& query,
                                    const std::string& nameserver,
                                    Transport net,
                                    std::chrono::milliseconds timeout) = 0;
};

// UDP/TCP exchange through a single-nameserver ldns resolver.
// Upstream hosts must be IPv4 or IPv6 literals.
class LdnsExchanger : public Exchanger {
public:
    ExchangeResult exchange(const ldns_pkt& query,
                            const std::string& nameserver,
                            Transport net,
                            std::chrono::milliseconds timeout) override;
};

} // namespace fq
