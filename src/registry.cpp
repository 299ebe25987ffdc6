#include <metropolis/sample/registry.hpp>
#include <metropolis/core/errors.hpp>
#include <metropolis/log/logger.hpp>
#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

using metropolis::core::ConfigurationError;

namespace metropolis::sample {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void expect_params(const DistributionSpec &spec, std::size_t min_count, std::size_t max_count) {
  const std::size_t n = spec.params.size();
  if (n < min_count || n > max_count) {
    const std::string expected = (min_count == max_count)
                                     ? std::format("{}", min_count)
                                     : std::format("{} to {}", min_count, max_count);
    throw ConfigurationError(std::format("'{}' takes {} parameter(s), got {}", spec.name, expected, n));
  }
}

// Parameter validation in the distribution constructors reports with
// std::invalid_argument; at this layer it is a configuration problem.
template <class T, class... Args>
std::shared_ptr<const T> build(const DistributionSpec &spec, Args... args) {
  try {
    return std::make_shared<T>(args...);
  } catch (const ConfigurationError &) {
    throw;
  } catch (const std::invalid_argument &e) {
    throw ConfigurationError(std::format("invalid parameters for '{}': {}", spec.name, e.what()));
  }
}

} // namespace

DistributionSpec parse_spec(std::string_view text) {
  text = trim(text);
  DistributionSpec spec;

  const auto colon = text.find(':');
  spec.name = lower(trim(text.substr(0, colon)));
  if (spec.name.empty()) {
    throw ConfigurationError(std::format("missing distribution name in '{}'", text));
  }
  if (colon == std::string_view::npos) {
    return spec;
  }

  std::string_view rest = text.substr(colon + 1);
  while (true) {
    const auto comma = rest.find(',');
    spec.params.push_back(parse_real(rest.substr(0, comma), spec.name));
    if (comma == std::string_view::npos) break;
    rest.remove_prefix(comma + 1);
  }
  return spec;
}

double parse_real(std::string_view text, std::string_view what) {
  const std::string s(trim(text));
  if (s.empty()) {
    throw ConfigurationError(std::format("{}: empty number", what));
  }
  std::size_t pos = 0;
  double value = 0.0;
  try {
    value = std::stod(s, &pos);
  } catch (const std::invalid_argument &) {
    throw ConfigurationError(std::format("{}: '{}' is not a number", what, s));
  } catch (const std::out_of_range &) {
    throw ConfigurationError(std::format("{}: '{}' is out of range", what, s));
  }
  if (pos != s.size()) {
    throw ConfigurationError(std::format("{}: trailing characters in '{}'", what, s));
  }
  return value;
}

std::int64_t parse_integer(std::string_view text, std::string_view what) {
  const std::string s(trim(text));
  std::size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(s, &pos);
  } catch (const std::invalid_argument &) {
    throw ConfigurationError(std::format("{}: '{}' is not an integer", what, s));
  } catch (const std::out_of_range &) {
    throw ConfigurationError(std::format("{}: '{}' is out of range", what, s));
  }
  if (pos != s.size()) {
    throw ConfigurationError(std::format("{}: trailing characters in '{}'", what, s));
  }
  return static_cast<std::int64_t>(value);
}

std::shared_ptr<const TargetDensity> make_density(const DistributionSpec &spec) {
  const auto &p = spec.params;
  MLOG_DEBUG("Resolving density '{}' with {} parameter(s)", spec.name, p.size());

  if (spec.name == "uniform") {
    expect_params(spec, 2, 2);
    return build<UniformDensity>(spec, p[0], p[1]);
  }
  if (spec.name == "normal") {
    expect_params(spec, 2, 2);
    return build<NormalDensity>(spec, p[0], p[1]);
  }
  if (spec.name == "beta") {
    expect_params(spec, 2, 2);
    return build<BetaDensity>(spec, p[0], p[1]);
  }
  if (spec.name == "gamma") {
    expect_params(spec, 2, 3);
    return build<GammaDensity>(spec, p[0], p[1], p.size() == 3 ? p[2] : 0.0);
  }
  if (spec.name == "exponential" || spec.name == "exp") {
    expect_params(spec, 1, 1);
    return build<ExponentialDensity>(spec, p[0]);
  }

  MLOG_ERROR("Unknown density '{}'", spec.name);
  throw ConfigurationError(std::format("unknown density '{}'", spec.name));
}

std::shared_ptr<const JumpDistribution> make_jump(const DistributionSpec &spec) {
  const auto &p = spec.params;
  MLOG_DEBUG("Resolving jump distribution '{}' with {} parameter(s)", spec.name, p.size());

  if (spec.name == "normal") {
    expect_params(spec, 0, 2);
    if (p.empty()) return build<NormalJump>(spec, 0.0, 0.2);
    if (p.size() == 1) return build<NormalJump>(spec, 0.0, p[0]);
    return build<NormalJump>(spec, p[0], p[1]);
  }
  if (spec.name == "uniform") {
    expect_params(spec, 1, 2);
    if (p.size() == 1) return build<UniformJump>(spec, -p[0], p[0]);
    return build<UniformJump>(spec, p[0], p[1]);
  }
  if (spec.name == "t" || spec.name == "student_t") {
    expect_params(spec, 1, 2);
    return build<StudentTJump>(spec, p[0], p.size() == 2 ? p[1] : 1.0);
  }
  if (spec.name == "constant") {
    expect_params(spec, 1, 1);
    return build<ConstantJump>(spec, p[0]);
  }

  MLOG_ERROR("Unknown jump distribution '{}'", spec.name);
  throw ConfigurationError(std::format("unknown jump distribution '{}'", spec.name));
}

} // namespace metropolis::sample
