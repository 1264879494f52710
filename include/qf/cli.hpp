#pragma once

#include "qf/options.hpp"

namespace qf {

void print_usage(const char *prog);

// Fills `opt` from argv. Prints a diagnostic and returns false on invalid
// input or when help was requested.
bool parse_args(int argc, char **argv, Options &opt);

} // namespace qf
