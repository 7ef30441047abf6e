#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <ldns/ldns.h>

#include "fq/options.hpp"

namespace fq
{
struct PacketDeleter
{
    void operator()(ldns_pkt *pkt) const { ldns_pkt_free(pkt); }
};

using PacketPtr = std::unique_ptr<ldns_pkt, PacketDeleter>;

PacketPtr clone_packet(const ldns_pkt *pkt);

enum class QueryErrorKind {
    None = 0,
    InvalidQname,
    UnknownType,
    BuildFailed,
};

struct QueryBuildResult
{
    PacketPtr query;
    QueryErrorKind kind{QueryErrorKind::None};
    std::string error; // set when kind != None
};

// Seeds the generator behind ldns_get_random() from /dev/urandom. Call once
// before drawing transaction ids; without it ldns builds lacking OpenSSL
// hand out the same id sequence on every run. Returns false when no
// entropy source could be read.
bool seed_query_ids();

// One-question IN-class query with the given transaction id.
QueryBuildResult make_query(const QueryOptions &opt, uint16_t id);

ldns_rr_type parse_rr_type(std::string_view name);

bool has_question(const ldns_pkt *pkt);

// Owner name of the first question, FQDN form ("example.com.").
// Empty when the packet carries no question.
std::string question_name(const ldns_pkt *pkt);

std::string question_type_str(const ldns_pkt *pkt);

std::string unfqdn(std::string_view name);

std::string rcode_str(ldns_pkt_rcode rcode);

// Answer section, one presentation-format line per record.
std::vector<std::string> answer_lines(const ldns_pkt *pkt);

PacketPtr decode_wire(const std::vector<uint8_t> &wire);

bool encode_wire(const ldns_pkt *pkt, std::vector<uint8_t> &wire);

// Standard (RFC 4648 section 4) alphabet. Returns false on malformed input.
bool decode_base64(std::string_view text, std::vector<uint8_t> &out);
} // namespace fq
