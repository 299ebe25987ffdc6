#pragma once
#include <functional>
#include <memory>

namespace metropolis::sample {

// Unnormalized target density, theta -> value >= 0.
using DensityFunction = std::function<double(double)>;

class TargetDensity {
public:
  virtual ~TargetDensity() = default;
  virtual double evaluate(double x) const = 0;

  double operator()(double x) const { return evaluate(x); }
};

// Wraps a shared density into a callable the sampler accepts.
DensityFunction as_function(std::shared_ptr<const TargetDensity> density);

class UniformDensity : public TargetDensity {
public:
  UniformDensity(double a, double b);
  double evaluate(double x) const override;
private:
  double a;
  double b;
};

class NormalDensity : public TargetDensity {
public:
  NormalDensity(double mu, double sigma);
  double evaluate(double x) const override;
private:
  double mu;
  double sigma;
};

class BetaDensity : public TargetDensity {
public:
  BetaDensity(double a, double b);
  double evaluate(double x) const override;
private:
  double a;
  double b;
  double log_norm; // log B(a, b)
};

class GammaDensity : public TargetDensity {
public:
  GammaDensity(double shape, double scale, double loc = 0.0);
  double evaluate(double x) const override;
private:
  double shape;
  double scale;
  double loc;
  double log_norm; // log Gamma(shape) + shape * log(scale)
};

class ExponentialDensity : public TargetDensity {
public:
  ExponentialDensity(double rate);
  double evaluate(double x) const override;
private:
  double rate;
};

} // namespace metropolis::sample
