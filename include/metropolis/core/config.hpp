#pragma once
#include <metropolis/core/sampler.hpp>
#include <metropolis/sample/jump.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace metropolis::core {

using metropolis::sample::JumpDistribution;

std::shared_ptr<const JumpDistribution> default_jump(); // Normal(0, 0.2)

struct SamplerConfig
{
  DensityFunction density;
  std::int64_t chain_length = 5000;
  double initial = 0.5;
  std::shared_ptr<const JumpDistribution> jump;
  Bounds bounds;
  std::int64_t burnin = 0;
  std::optional<std::uint64_t> seed;

  // Validates on construction; throws ConfigurationError.
  SamplerConfig(DensityFunction d, std::int64_t chain = 5000, double init = 0.5,
                std::shared_ptr<const JumpDistribution> j = default_jump(), Bounds b = {},
                std::int64_t burn = 0, std::optional<std::uint64_t> s = std::nullopt);

  void validate() const;
};

// Runs one chain. Proposal and acceptance draws share one stream seeded
// from `config.seed`, so a fixed seed reproduces the chain exactly.
ChainResult run_chain(const SamplerConfig &config, const std::atomic<bool> *cancel = nullptr);

// As above with an explicit stream, ignoring `config.seed`.
ChainResult run_chain(const SamplerConfig &config, Rng &rng, const std::atomic<bool> *cancel = nullptr);

} // namespace metropolis::core
