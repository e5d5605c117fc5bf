#pragma once

#include "sb/options.hpp"

namespace sb
{
void print_usage(const char *prog);

// Fills `opt` from argv. Returns false after printing the problem (or the
// usage for -h/--help); the caller exits without running.
bool parse_args(int argc, char **argv, Options &opt);
} // namespace sb
