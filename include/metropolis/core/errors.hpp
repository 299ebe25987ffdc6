#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace metropolis::core {

// Invalid sampler setup, detected before the chain starts.
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// The density or proposal callable failed while the chain was running.
// Carries the untrimmed samples produced before the failure.
class EvaluationError : public std::runtime_error {
public:
  EvaluationError(const std::string &what, double theta, std::vector<double> partial_chain)
      : std::runtime_error(what), theta_(theta), partial_chain_(std::move(partial_chain)) {}

  double theta() const { return theta_; }
  std::size_t samples_generated() const { return partial_chain_.size(); }
  const std::vector<double> &partial_chain() const { return partial_chain_; }

private:
  double theta_;
  std::vector<double> partial_chain_;
};

class CancelledError : public std::runtime_error {
public:
  CancelledError(const std::string &what, std::size_t samples_generated)
      : std::runtime_error(what), samples_generated_(samples_generated) {}

  std::size_t samples_generated() const { return samples_generated_; }

private:
  std::size_t samples_generated_;
};

} // namespace metropolis::core
