#pragma once

#include <string>
#include <vector>

namespace fq
{
struct Options;
struct LookupResult;

// Text formatting (returns complete text block with trailing newlines)
std::string format_header_text(const Options &opt,
                               const std::vector<std::string> &upstreams);

std::string format_result_text(const LookupResult &result);

// Single JSON object without trailing newline
std::string build_result_json(const Options &opt,
                              const std::vector<std::string> &upstreams,
                              const LookupResult &result);
} // namespace fq
