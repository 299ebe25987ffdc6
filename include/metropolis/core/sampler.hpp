#pragma once
#include <metropolis/core/errors.hpp>
#include <metropolis/math/rng.hpp>
#include <metropolis/sample/density.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>

namespace metropolis::core {

using metropolis::math::Rng;
using metropolis::sample::DensityFunction;

// Zero-argument source of independent increments. Must be symmetric for
// the Metropolis ratio to target the density (not checked).
using ProposalSampler = std::function<double()>;

struct Bounds {
  double lower = -std::numeric_limits<double>::infinity();
  double upper = std::numeric_limits<double>::infinity();

  bool contains(double x) const { return x >= lower && x <= upper; }
};

struct ChainResult {
  std::vector<double> samples; // after burn-in
  std::size_t burnin = 0;
  std::size_t proposals = 0;
  std::size_t accepted = 0;

  double acceptance_rate() const {
    return proposals == 0 ? 0.0 : static_cast<double>(accepted) / static_cast<double>(proposals);
  }
};

// Throws ConfigurationError for chain_length < 1 or too large to store,
// burnin outside [0, chain_length], NaN bounds or lower > upper.
void check_chain_settings(std::int64_t chain_length, const Bounds &bounds, std::int64_t burnin);

// check_chain_settings plus empty callables.
void check_chain_arguments(const DensityFunction &density, const ProposalSampler &proposal,
                           std::int64_t chain_length, const Bounds &bounds, std::int64_t burnin);

// Random-walk Metropolis. Element 0 of the untrimmed chain is `initial`;
// each further element is the accepted proposal or a repeat of the
// current state. The first `burnin` elements are dropped.
//
// Throws ConfigurationError before sampling, EvaluationError if the
// density or proposal fails mid-chain, CancelledError if `cancel` is set.
ChainResult run_chain(const DensityFunction &density, const ProposalSampler &proposal,
                      std::int64_t chain_length, double initial, const Bounds &bounds,
                      std::int64_t burnin, Rng &rng, const std::atomic<bool> *cancel = nullptr);

std::vector<double> run(const DensityFunction &density, const ProposalSampler &proposal,
                        std::int64_t chain_length, double initial, double lower, double upper,
                        std::int64_t burnin, Rng &rng);

// Seeded variant; std::nullopt draws the seed from the entropy source.
std::vector<double> run(const DensityFunction &density, const ProposalSampler &proposal,
                        std::int64_t chain_length, double initial, double lower, double upper,
                        std::int64_t burnin, std::optional<std::uint64_t> seed);

} // namespace metropolis::core
