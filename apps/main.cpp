/**
 * metropolis: draw a random-walk Metropolis chain from the command line.
 *
 * Usage:
 *   metropolis [--density NAME[:p,...]] [--chain N] [--init X]
 *              [--jump NAME[:p,...]] [--min X] [--max X] [--burnin N]
 *              [--seed S] [--chains N] [--threads N] [--output <path>]
 *              [--log-level LEVEL]
 *
 * Exit codes: 0 ok, 1 usage, 2 configuration, 3 sampling failure.
 */

#include <metropolis/cli/cli.hpp>
#include <iostream>

int main(int argc, char *argv[]) {
  return metropolis::cli::run_cli(argc, argv, std::cout);
}
