#pragma once
#include <cstdint>
#include <optional>
#include <random>

namespace metropolis::math {

// Derives an independent stream seed for worker/chain `tid` (splitmix64).
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t tid);

std::uint64_t entropy_seed();

struct Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> uni{0.0, 1.0};

  explicit Rng(std::uint64_t seed = entropy_seed()) : gen(seed) {}

  // [0, 1)
  double uniform();
  // [a, b)
  double uniform(const double a, const double b);
  double normal(const double mean, const double stddev);
  double student_t(const double nu);
};

// A deterministic stream when `seed` is set, an entropy-seeded one otherwise.
Rng make_rng(std::optional<std::uint64_t> seed);

} // namespace metropolis::math
