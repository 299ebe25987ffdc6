#pragma once
#include <metropolis/sample/density.hpp>
#include <metropolis/sample/jump.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace metropolis::sample {

// "name" or "name:p1,p2,..."
struct DistributionSpec {
  std::string name;
  std::vector<double> params;
};

DistributionSpec parse_spec(std::string_view text);

// Accepts "inf", "-inf", "+inf". Throws core::ConfigurationError naming `what`.
double parse_real(std::string_view text, std::string_view what);
std::int64_t parse_integer(std::string_view text, std::string_view what);

// uniform:a,b  normal:mu,sigma  beta:a,b  gamma:shape,scale[,loc]  exponential:rate
std::shared_ptr<const TargetDensity> make_density(const DistributionSpec &spec);

// normal[:[mu,]sigma]  uniform:halfwidth | uniform:a,b  t:nu[,scale]  constant:delta
std::shared_ptr<const JumpDistribution> make_jump(const DistributionSpec &spec);

} // namespace metropolis::sample
