#pragma once
#include <metropolis/core/config.hpp>
#include <cstddef>
#include <vector>

namespace metropolis::core {

// Runs `n_chains` independent chains of `config` on worker threads.
// Chain i is seeded with mix_seed(base, i), base being config.seed or one
// entropy draw, so with a fixed seed the result does not depend on
// `n_threads` (0 = hardware concurrency). The density is called from
// several threads at once and must not mutate shared state.
//
// The first failing chain stops the others; its exception is rethrown
// once every worker has joined.
std::vector<ChainResult> run_chains(const SamplerConfig &config, std::size_t n_chains, std::size_t n_threads = 1);

} // namespace metropolis::core
