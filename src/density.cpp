#include <metropolis/sample/density.hpp>
#include <metropolis/log/logger.hpp>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace metropolis::sample {

DensityFunction as_function(std::shared_ptr<const TargetDensity> density) {
  if (!density) {
    throw std::invalid_argument("as_function: density is null");
  }
  return [density](double x) { return density->evaluate(x); };
}



UniformDensity::UniformDensity(double a, double b) {
  if (!(a < b) || !std::isfinite(b - a)) {
    MLOG_ERROR("UniformDensity: need finite a < b, got a: {}, b: {}", a, b);
    throw std::invalid_argument("UniformDensity: need finite a < b");
  }
  this->a = a;
  this->b = b;
}

double UniformDensity::evaluate(double x) const {
  if (x < a || x > b) return 0.0;
  return 1.0 / (b - a);
}



NormalDensity::NormalDensity(double mu, double sigma) {
  if (!(sigma > 0.0) || !std::isfinite(sigma) || !std::isfinite(mu)) {
    MLOG_ERROR("NormalDensity: need finite mu and positive finite sigma, got mu: {}, sigma: {}", mu, sigma);
    throw std::invalid_argument("NormalDensity: need finite mu and positive finite sigma");
  }
  this->mu = mu;
  this->sigma = sigma;
}

double NormalDensity::evaluate(double x) const {
  const double z = (x - mu) / sigma;
  return std::exp(-0.5 * z * z) / (sigma * std::sqrt(2.0 * std::numbers::pi));
}



BetaDensity::BetaDensity(double a, double b) {
  if (!(a > 0.0) || !(b > 0.0) || !std::isfinite(a) || !std::isfinite(b)) {
    MLOG_ERROR("BetaDensity: shape parameters must be positive and finite, got a: {}, b: {}", a, b);
    throw std::invalid_argument("BetaDensity: shape parameters must be positive and finite");
  }
  this->a = a;
  this->b = b;
  this->log_norm = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
}

double BetaDensity::evaluate(double x) const {
  if (x < 0.0 || x > 1.0) return 0.0;
  // Endpoints: finite only when the matching exponent is >= 0
  if ((x == 0.0 && a < 1.0) || (x == 1.0 && b < 1.0)) {
    return std::numeric_limits<double>::infinity();
  }
  if ((x == 0.0 && a > 1.0) || (x == 1.0 && b > 1.0)) return 0.0;
  const double log_x = (a == 1.0) ? 0.0 : (a - 1.0) * std::log(x);
  const double log_1mx = (b == 1.0) ? 0.0 : (b - 1.0) * std::log1p(-x);
  return std::exp(log_x + log_1mx - log_norm);
}



GammaDensity::GammaDensity(double shape, double scale, double loc) {
  if (!(shape > 0.0) || !(scale > 0.0) || !std::isfinite(shape) || !std::isfinite(scale) || !std::isfinite(loc)) {
    MLOG_ERROR("GammaDensity: need positive finite shape and scale and finite loc, got shape: {}, scale: {}, loc: {}",
               shape, scale, loc);
    throw std::invalid_argument("GammaDensity: need positive finite shape and scale and finite loc");
  }
  this->shape = shape;
  this->scale = scale;
  this->loc = loc;
  this->log_norm = std::lgamma(shape) + shape * std::log(scale);
}

double GammaDensity::evaluate(double x) const {
  const double y = x - loc;
  if (y < 0.0) return 0.0;
  if (y == 0.0) {
    if (shape < 1.0) return std::numeric_limits<double>::infinity();
    if (shape > 1.0) return 0.0;
    return 1.0 / scale;
  }
  return std::exp((shape - 1.0) * std::log(y) - y / scale - log_norm);
}



ExponentialDensity::ExponentialDensity(double rate) {
  if (!(rate > 0.0) || !std::isfinite(rate)) {
    MLOG_ERROR("ExponentialDensity: rate must be positive and finite, got {}", rate);
    throw std::invalid_argument("ExponentialDensity: rate must be positive and finite");
  }
  this->rate = rate;
}

double ExponentialDensity::evaluate(double x) const {
  if (x < 0.0) return 0.0; // defined for x >= 0
  return rate * std::exp(-rate * x);
}

} // namespace metropolis::sample
