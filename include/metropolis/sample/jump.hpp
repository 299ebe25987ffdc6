#pragma once
#include <metropolis/math/rng.hpp>
#include <string>

namespace metropolis::sample {

using metropolis::math::Rng;

// Distribution of the random-walk increment. The plain Metropolis ratio
// is only valid for symmetric jumps, q(d) == q(-d); this is the caller's
// responsibility and is never enforced.
class JumpDistribution {
public:
  virtual ~JumpDistribution() = default;
  virtual double sample(Rng &rng) const = 0;
  virtual bool symmetric() const = 0;
  virtual std::string name() const = 0;
};

class NormalJump : public JumpDistribution {
public:
  NormalJump(double mu = 0.0, double sigma = 0.2);
  double sample(Rng &rng) const override;
  bool symmetric() const override;
  std::string name() const override;
private:
  double mu;
  double sigma;
};

class UniformJump : public JumpDistribution {
public:
  UniformJump(double a, double b);
  double sample(Rng &rng) const override;
  bool symmetric() const override;
  std::string name() const override;
private:
  double a;
  double b;
};

class StudentTJump : public JumpDistribution {
public:
  StudentTJump(double nu, double scale = 1.0);
  double sample(Rng &rng) const override;
  bool symmetric() const override;
  std::string name() const override;
private:
  double nu;    // degrees of freedom
  double scale;
};

// Always returns `delta`; does not consume the stream.
class ConstantJump : public JumpDistribution {
public:
  explicit ConstantJump(double delta);
  double sample(Rng &rng) const override;
  bool symmetric() const override;
  std::string name() const override;
private:
  double delta;
};

} // namespace metropolis::sample
