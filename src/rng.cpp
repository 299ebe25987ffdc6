#include <metropolis/math/rng.hpp>
#include <cmath>
#include <numbers>

namespace metropolis::math {

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t tid) {
  std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (tid + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

std::uint64_t entropy_seed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

double Rng::uniform() {
  return uni(gen);
}

double Rng::uniform(const double a, const double b) {
  // b - a overflows for ranges wider than the largest double
  const double u = uniform();
  return a * (1.0 - u) + b * u;
}

double Rng::normal(const double mean, const double stddev) {
  // 1 - u keeps the log argument in (0, 1]
  const double u1 = 1.0 - uniform();
  const double u2 = uniform();
  const double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
  return z0 * stddev + mean;
}

double Rng::student_t(const double nu) {
  std::student_t_distribution<double> dist(nu);
  return dist(gen);
}

Rng make_rng(std::optional<std::uint64_t> seed) {
  return seed ? Rng(*seed) : Rng(entropy_seed());
}

} // namespace metropolis::math
