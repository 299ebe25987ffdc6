#include <metropolis/core/chains.hpp>
#include <metropolis/core/config.hpp>
#include <metropolis/core/errors.hpp>
#include <metropolis/core/sampler.hpp>
#include <metropolis/log/logger.hpp>
#include <metropolis/math/rng.hpp>
#include <metropolis/sample/density.hpp>
#include <metropolis/sample/jump.hpp>
#include <metropolis/sample/registry.hpp>

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <limits>

namespace py = pybind11;
using namespace metropolis::core;
using namespace metropolis::sample;
using metropolis::log::Level;
using metropolis::log::Logger;

PYBIND11_MODULE(metropolis_mc, m) {
  m.doc() = "Python bindings for the metropolis-mc random-walk Metropolis sampler";

  constexpr double inf = std::numeric_limits<double>::infinity();

  // Exceptions
  py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
  py::register_exception<EvaluationError>(m, "EvaluationError", PyExc_RuntimeError);
  py::register_exception<CancelledError>(m, "CancelledError", PyExc_RuntimeError);

  // Rng bindings
  py::class_<Rng>(m, "Rng")
      .def(py::init([](std::optional<std::uint64_t> seed) { return metropolis::math::make_rng(seed); }),
           py::arg("seed") = py::none(), "Initialize the RNG with an optional seed")
      .def("uniform", py::overload_cast<>(&Rng::uniform),
           "Generate a uniform random number in [0, 1)")
      .def("normal", &Rng::normal, py::arg("mean"), py::arg("stddev"),
           "Generate a normally distributed random number with given mean and stddev");

  // Target densities
  py::class_<TargetDensity, std::shared_ptr<TargetDensity>>(m, "TargetDensity")
      .def("__call__", &TargetDensity::evaluate, py::arg("x"))
      .def("pdf", &TargetDensity::evaluate, py::arg("x"));

  py::class_<UniformDensity, TargetDensity, std::shared_ptr<UniformDensity>>(m, "UniformDensity")
      .def(py::init<double, double>(), py::arg("a"), py::arg("b"));
  py::class_<NormalDensity, TargetDensity, std::shared_ptr<NormalDensity>>(m, "NormalDensity")
      .def(py::init<double, double>(), py::arg("mu"), py::arg("sigma"));
  py::class_<BetaDensity, TargetDensity, std::shared_ptr<BetaDensity>>(m, "BetaDensity")
      .def(py::init<double, double>(), py::arg("a"), py::arg("b"));
  py::class_<GammaDensity, TargetDensity, std::shared_ptr<GammaDensity>>(m, "GammaDensity")
      .def(py::init<double, double, double>(), py::arg("shape"), py::arg("scale"), py::arg("loc") = 0.0);
  py::class_<ExponentialDensity, TargetDensity, std::shared_ptr<ExponentialDensity>>(m, "ExponentialDensity")
      .def(py::init<double>(), py::arg("rate"));

  m.def(
      "density",
      [](const std::string &spec) { return std::const_pointer_cast<TargetDensity>(make_density(parse_spec(spec))); },
      py::arg("spec"), "Build a density from a spec such as 'beta:15,7'");

  // Jump distributions
  py::class_<JumpDistribution, std::shared_ptr<JumpDistribution>>(m, "JumpDistribution")
      .def("sample", &JumpDistribution::sample, py::arg("rng"))
      .def("symmetric", &JumpDistribution::symmetric)
      .def("__repr__", &JumpDistribution::name);

  py::class_<NormalJump, JumpDistribution, std::shared_ptr<NormalJump>>(m, "NormalJump")
      .def(py::init<double, double>(), py::arg("mu") = 0.0, py::arg("sigma") = 0.2);
  py::class_<UniformJump, JumpDistribution, std::shared_ptr<UniformJump>>(m, "UniformJump")
      .def(py::init<double, double>(), py::arg("a"), py::arg("b"));
  py::class_<StudentTJump, JumpDistribution, std::shared_ptr<StudentTJump>>(m, "StudentTJump")
      .def(py::init<double, double>(), py::arg("nu"), py::arg("scale") = 1.0);
  py::class_<ConstantJump, JumpDistribution, std::shared_ptr<ConstantJump>>(m, "ConstantJump")
      .def(py::init<double>(), py::arg("delta"));

  m.def(
      "jump",
      [](const std::string &spec) { return std::const_pointer_cast<JumpDistribution>(make_jump(parse_spec(spec))); },
      py::arg("spec"), "Build a jump distribution from a spec such as 'normal:0,0.2'");

  // Sampler bindings
  py::class_<Bounds>(m, "Bounds")
      .def(py::init<double, double>(), py::arg("lower") = -inf, py::arg("upper") = inf)
      .def_readwrite("lower", &Bounds::lower)
      .def_readwrite("upper", &Bounds::upper)
      .def("contains", &Bounds::contains, py::arg("x"));

  py::class_<ChainResult>(m, "ChainResult")
      .def_readonly("samples", &ChainResult::samples)
      .def_readonly("burnin", &ChainResult::burnin)
      .def_readonly("proposals", &ChainResult::proposals)
      .def_readonly("accepted", &ChainResult::accepted)
      .def_property_readonly("acceptance_rate", &ChainResult::acceptance_rate);

  py::class_<SamplerConfig>(m, "SamplerConfig")
      .def(py::init([](DensityFunction density, std::int64_t chain, double init,
                       std::shared_ptr<JumpDistribution> jump, Bounds bounds, std::int64_t burnin,
                       std::optional<std::uint64_t> seed) {
             return SamplerConfig(std::move(density), chain, init,
                                  jump ? std::shared_ptr<const JumpDistribution>(jump) : default_jump(),
                                  bounds, burnin, seed);
           }),
           py::arg("density"), py::arg("chain") = 5000, py::arg("init") = 0.5,
           py::arg("jump") = nullptr, py::arg("bounds") = Bounds{}, py::arg("burnin") = 0,
           py::arg("seed") = py::none())
      .def_readonly("chain", &SamplerConfig::chain_length)
      .def_readonly("init", &SamplerConfig::initial)
      .def_readonly("bounds", &SamplerConfig::bounds)
      .def_readonly("burnin", &SamplerConfig::burnin)
      .def_readonly("seed", &SamplerConfig::seed);

  m.def(
      "run",
      [](DensityFunction density, ProposalSampler proposal, std::int64_t chain, double init, double lower,
         double upper, std::int64_t burnin, std::optional<std::uint64_t> seed) {
        return run(density, proposal, chain, init, lower, upper, burnin, seed);
      },
      py::arg("density"), py::arg("proposal"), py::arg("chain"), py::arg("init"), py::arg("lower") = -inf,
      py::arg("upper") = inf, py::arg("burnin") = 0, py::arg("seed") = py::none(),
      "Run a Metropolis chain with Python callables for the density and the proposal increment");

  m.def(
      "run_config", [](const SamplerConfig &config) { return run_chain(config); }, py::arg("config"),
      "Run one chain described by a SamplerConfig");

  m.def(
      "run_chains",
      [](const SamplerConfig &config, std::size_t n_chains, std::size_t n_threads) {
        py::gil_scoped_release release;
        return run_chains(config, n_chains, n_threads);
      },
      py::arg("config"), py::arg("n_chains"), py::arg("n_threads") = 1,
      "Run independent chains on worker threads");

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); },
      py::arg("level"), "Set the logging level for the metropolis-mc module");
}
