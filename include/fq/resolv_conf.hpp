#pragma once

#include <istream>
#include <string>

#include "fq/options.hpp"

namespace fq
{
struct ResolvConfResult
{
    int rc{};          // 0 on success, -1 on error
    std::string error; // error message when rc != 0
    size_t nameservers_added{};
};

// Appends "nameserver" entries in file order and applies "options timeout:N".
// Only lines *starting* with '#' or ';' are comments, so "1.2.3.4#5353"
// keeps its port override. cfg is left untouched when the file can't be read.
ResolvConfResult load_resolv_conf(const std::string &path, ResolvConfig &cfg);

ResolvConfResult parse_resolv_conf(std::istream &in, ResolvConfig &cfg);
} // namespace fq
