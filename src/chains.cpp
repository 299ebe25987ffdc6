#include <metropolis/core/chains.hpp>
#include <metropolis/log/logger.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace metropolis::core {

using metropolis::math::mix_seed;

std::vector<ChainResult> run_chains(const SamplerConfig &config, std::size_t n_chains, std::size_t n_threads) {
  config.validate();
  if (n_chains == 0) {
    MLOG_ERROR("run_chains: number of chains must be at least 1");
    throw ConfigurationError("number of chains must be at least 1");
  }

  // Determine number of threads to use
  if (n_threads == 0)
    n_threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  if (n_threads > n_chains)
    n_threads = n_chains;

  const std::uint64_t base_seed = config.seed ? *config.seed : math::entropy_seed();
  MLOG_INFO("Running {} chains on {} threads with base seed {}", n_chains, n_threads, base_seed);

  std::vector<ChainResult> results(n_chains);

  std::atomic<bool> any_error{false};
  std::exception_ptr first_exception = nullptr;
  std::mutex exception_mu;

  // Launch threads; worker t takes chains t, t + n_threads, ...
  std::vector<std::thread> workers;
  workers.reserve(n_threads);

  for (std::size_t t = 0; t < n_threads; ++t) {
    workers.emplace_back([&, t]() {
      for (std::size_t c = t; c < n_chains; c += n_threads) {
        if (any_error.load(std::memory_order_relaxed))
          return;
        try {
          const std::uint64_t chain_seed = mix_seed(base_seed, static_cast<std::uint64_t>(c));
          Rng rng(chain_seed);

          MLOG_DEBUG("Thread {} running chain {} with seed {}", t, c, chain_seed);

          results[c] = run_chain(config, rng, &any_error);
        } catch (const CancelledError &) {
          // another chain failed first
          return;
        } catch (...) {
          std::scoped_lock lk(exception_mu);
          if (!first_exception)
            first_exception = std::current_exception();
          any_error.store(true, std::memory_order_relaxed);
          return;
        }
      }
    });
  }

  // Join threads
  for (auto &w : workers)
    w.join();

  if (first_exception) {
    std::rethrow_exception(first_exception);
  }

  return results;
}

} // namespace metropolis::core
