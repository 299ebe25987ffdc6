#include <metropolis/sample/jump.hpp>
#include <metropolis/log/logger.hpp>
#include <cmath>
#include <format>
#include <stdexcept>

namespace metropolis::sample {

NormalJump::NormalJump(double mu, double sigma) {
  if (!(sigma > 0.0) || !std::isfinite(sigma) || !std::isfinite(mu)) {
    MLOG_ERROR("NormalJump: sigma must be positive and finite, got mu: {}, sigma: {}", mu, sigma);
    throw std::invalid_argument("NormalJump: sigma must be positive and finite");
  }
  this->mu = mu;
  this->sigma = sigma;
}
double NormalJump::sample(Rng &rng) const {
  return rng.normal(mu, sigma);
}
bool NormalJump::symmetric() const {
  return mu == 0.0;
}
std::string NormalJump::name() const {
  return std::format("normal({}, {})", mu, sigma);
}



UniformJump::UniformJump(double a, double b) {
  if (!(a < b) || !std::isfinite(a) || !std::isfinite(b)) {
    MLOG_ERROR("UniformJump: need finite a < b, got a: {}, b: {}", a, b);
    throw std::invalid_argument("UniformJump: need finite a < b");
  }
  this->a = a;
  this->b = b;
}
double UniformJump::sample(Rng &rng) const {
  return rng.uniform(a, b);
}
bool UniformJump::symmetric() const {
  return a == -b;
}
std::string UniformJump::name() const {
  return std::format("uniform({}, {})", a, b);
}



StudentTJump::StudentTJump(double nu, double scale) {
  if (!(nu > 0.0) || !(scale > 0.0) || !std::isfinite(nu) || !std::isfinite(scale)) {
    MLOG_ERROR("StudentTJump: nu and scale must be positive and finite, got nu: {}, scale: {}", nu, scale);
    throw std::invalid_argument("StudentTJump: nu and scale must be positive and finite");
  }
  this->nu = nu;
  this->scale = scale;
}
double StudentTJump::sample(Rng &rng) const {
  return scale * rng.student_t(nu);
}
bool StudentTJump::symmetric() const {
  return true;
}
std::string StudentTJump::name() const {
  return std::format("student_t({}, {})", nu, scale);
}



ConstantJump::ConstantJump(double delta) {
  if (!std::isfinite(delta)) {
    MLOG_ERROR("ConstantJump: delta must be finite, got {}", delta);
    throw std::invalid_argument("ConstantJump: delta must be finite");
  }
  this->delta = delta;
}
double ConstantJump::sample(Rng &) const {
  return delta;
}
bool ConstantJump::symmetric() const {
  return delta == 0.0;
}
std::string ConstantJump::name() const {
  return std::format("constant({})", delta);
}

} // namespace metropolis::sample
