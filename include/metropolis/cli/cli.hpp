#pragma once
#include <ostream>

namespace metropolis::cli {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfiguration = 2;
constexpr int kExitEvaluation = 3;

// Parses argv, samples and writes the chain(s) to `out` (or --output).
// Diagnostics go to the logger; usage text goes to stderr. Returns one of
// the kExit* codes and never throws.
int run_cli(int argc, char *argv[], std::ostream &out);

} // namespace metropolis::cli
