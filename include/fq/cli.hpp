#pragma once

#include "fq/options.hpp"

namespace fq
{
void print_usage(const char *prog);

// Returns false on usage errors (already reported) or when no name was given.
bool parse_args(int argc, char **argv, Options &opt);
} // namespace fq
