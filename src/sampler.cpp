#include <metropolis/core/sampler.hpp>
#include <metropolis/log/logger.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>

namespace metropolis::core {

namespace {

double draw_increment(const ProposalSampler &proposal, double current, const std::vector<double> &chain) {
  double delta = 0.0;
  try {
    delta = proposal();
  } catch (const std::exception &e) {
    throw EvaluationError(std::format("proposal sampler failed after {} samples: {}", chain.size(), e.what()),
                          current, chain);
  }
  if (!std::isfinite(delta)) {
    throw EvaluationError(std::format("proposal sampler returned non-finite increment {} after {} samples", delta,
                                      chain.size()),
                          current, chain);
  }
  return delta;
}

double evaluate_density(const DensityFunction &density, double theta, const std::vector<double> &chain) {
  double value = 0.0;
  try {
    value = density(theta);
  } catch (const std::exception &e) {
    throw EvaluationError(std::format("density failed at theta = {} after {} samples: {}", theta, chain.size(),
                                      e.what()),
                          theta, chain);
  }
  if (!std::isfinite(value)) {
    throw EvaluationError(std::format("density returned non-finite value {} at theta = {} after {} samples", value,
                                      theta, chain.size()),
                          theta, chain);
  }
  if (value < 0.0) {
    throw EvaluationError(std::format("density returned negative value {} at theta = {} after {} samples", value,
                                      theta, chain.size()),
                          theta, chain);
  }
  return value;
}

} // namespace

void check_chain_settings(std::int64_t chain_length, const Bounds &bounds, std::int64_t burnin) {
  if (chain_length < 1) {
    throw ConfigurationError(std::format("chain length must be at least 1, got {}", chain_length));
  }
  if (static_cast<std::uint64_t>(chain_length) > std::vector<double>().max_size()) {
    throw ConfigurationError(std::format("chain length {} exceeds the largest storable chain", chain_length));
  }
  if (burnin < 0 || burnin > chain_length) {
    throw ConfigurationError(
        std::format("burn-in must be in [0, {}], got {}", chain_length, burnin));
  }
  if (std::isnan(bounds.lower) || std::isnan(bounds.upper)) {
    throw ConfigurationError("bounds must not be NaN");
  }
  if (bounds.lower > bounds.upper) {
    throw ConfigurationError(
        std::format("lower bound {} is greater than upper bound {}", bounds.lower, bounds.upper));
  }
}

void check_chain_arguments(const DensityFunction &density, const ProposalSampler &proposal,
                           std::int64_t chain_length, const Bounds &bounds, std::int64_t burnin) {
  if (!density) {
    throw ConfigurationError("density must be a callable");
  }
  if (!proposal) {
    throw ConfigurationError("proposal sampler must be a callable");
  }
  check_chain_settings(chain_length, bounds, burnin);
}

ChainResult run_chain(const DensityFunction &density, const ProposalSampler &proposal,
                      std::int64_t chain_length, double initial, const Bounds &bounds,
                      std::int64_t burnin, Rng &rng, const std::atomic<bool> *cancel) {
  check_chain_arguments(density, proposal, chain_length, bounds, burnin);

  const auto n = static_cast<std::size_t>(chain_length);
  MLOG_DEBUG("Metropolis chain: length {}, initial {}, bounds [{}, {}], burn-in {}", n, initial, bounds.lower,
             bounds.upper, burnin);

  ChainResult result;
  result.burnin = static_cast<std::size_t>(burnin);

  std::vector<double> chain;
  chain.reserve(n);
  chain.push_back(initial);

  double current = initial;
  // density(current), evaluated the first time an in-bounds proposal needs it
  std::optional<double> current_density;

  while (chain.size() < n) {
    if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
      throw CancelledError(std::format("chain cancelled after {} samples", chain.size()), chain.size());
    }

    const double proposed = current + draw_increment(proposal, current, chain);
    ++result.proposals;

    const bool in_bounds = bounds.contains(proposed);
    double p_move = 0.0;
    std::optional<double> proposed_density;

    if (in_bounds) {
      if (!current_density) {
        current_density = evaluate_density(density, current, chain);
      }
      if (*current_density == 0.0) {
        p_move = 1.0; // ratio undefined; let the chain leave the zero-density region
      } else {
        proposed_density = evaluate_density(density, proposed, chain);
        p_move = std::min(1.0, *proposed_density / *current_density);
      }
    }

    // One uniform per step, also for out-of-bounds proposals.
    const double u = rng.uniform();
    if (in_bounds && u <= p_move) {
      chain.push_back(proposed);
      current = proposed;
      current_density = proposed_density;
      ++result.accepted;
    } else {
      chain.push_back(current);
    }
  }

  result.samples.assign(chain.begin() + static_cast<std::ptrdiff_t>(burnin), chain.end());

  MLOG_DEBUG("Metropolis chain done: {} samples kept, acceptance rate {:.3f}", result.samples.size(),
             result.acceptance_rate());
  return result;
}

std::vector<double> run(const DensityFunction &density, const ProposalSampler &proposal,
                        std::int64_t chain_length, double initial, double lower, double upper,
                        std::int64_t burnin, Rng &rng) {
  return run_chain(density, proposal, chain_length, initial, Bounds{lower, upper}, burnin, rng).samples;
}

std::vector<double> run(const DensityFunction &density, const ProposalSampler &proposal,
                        std::int64_t chain_length, double initial, double lower, double upper,
                        std::int64_t burnin, std::optional<std::uint64_t> seed) {
  Rng rng = math::make_rng(seed);
  return run(density, proposal, chain_length, initial, lower, upper, burnin, rng);
}

} // namespace metropolis::core
