#include <metropolis/core/config.hpp>
#include <metropolis/log/logger.hpp>
#include <cmath>
#include <utility>

namespace metropolis::core {

std::shared_ptr<const JumpDistribution> default_jump() {
  return std::make_shared<sample::NormalJump>(0.0, 0.2);
}

SamplerConfig::SamplerConfig(DensityFunction d, std::int64_t chain, double init,
                             std::shared_ptr<const JumpDistribution> j, Bounds b,
                             std::int64_t burn, std::optional<std::uint64_t> s)
    : density(std::move(d)), chain_length(chain), initial(init), jump(std::move(j)), bounds(b),
      burnin(burn), seed(s) {
  validate();

  if (!bounds.contains(initial)) {
    MLOG_WARN("SamplerConfig: initial value {} lies outside [{}, {}]", initial, bounds.lower, bounds.upper);
  }
  if (!jump->symmetric()) {
    MLOG_WARN("SamplerConfig: jump distribution {} is not symmetric, the chain will not target the density",
              jump->name());
  }
}

void SamplerConfig::validate() const {
  if (!jump) {
    MLOG_ERROR("SamplerConfig: jump distribution is not defined!");
    throw ConfigurationError("jump distribution must not be null");
  }
  if (!std::isfinite(initial)) {
    MLOG_ERROR("SamplerConfig: initial value must be finite, got {}", initial);
    throw ConfigurationError("initial value must be finite");
  }
  if (!density) {
    MLOG_ERROR("SamplerConfig: density is not defined!");
    throw ConfigurationError("density must be a callable");
  }
  try {
    check_chain_settings(chain_length, bounds, burnin);
  } catch (const ConfigurationError &e) {
    MLOG_ERROR("SamplerConfig: {}", e.what());
    throw;
  }
}

ChainResult run_chain(const SamplerConfig &config, Rng &rng, const std::atomic<bool> *cancel) {
  config.validate();
  const JumpDistribution &jump = *config.jump;
  return run_chain(config.density, [&jump, &rng] { return jump.sample(rng); }, config.chain_length,
                   config.initial, config.bounds, config.burnin, rng, cancel);
}

ChainResult run_chain(const SamplerConfig &config, const std::atomic<bool> *cancel) {
  Rng rng = math::make_rng(config.seed);
  return run_chain(config, rng, cancel);
}

} // namespace metropolis::core
