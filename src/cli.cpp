#include <metropolis/cli/cli.hpp>
#include <metropolis/core/chains.hpp>
#include <metropolis/core/config.hpp>
#include <metropolis/log/logger.hpp>
#include <metropolis/sample/registry.hpp>
#include <cstdint>
#include <exception>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace metropolis::cli {

namespace sample = metropolis::sample;
using namespace metropolis::core;

namespace {

struct CliOptions {
  std::string density = "beta:15,7";
  std::string jump = "normal:0,0.2";
  std::string chain = "5000";
  std::string init = "0.5";
  std::string min = "-inf";
  std::string max = "inf";
  std::string burnin = "0";
  std::optional<std::string> seed;
  std::string chains = "1";
  std::string threads = "1";
  std::string output_path;
};

void print_usage(const char *prog) {
  std::cerr << "Usage: " << prog << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  --density NAME[:p,...]  Target density (default: beta:15,7)\n"
            << "                          uniform:a,b normal:mu,sigma beta:a,b\n"
            << "                          gamma:shape,scale[,loc] exponential:rate\n"
            << "  --jump NAME[:p,...]     Jump distribution (default: normal:0,0.2)\n"
            << "                          normal[:[mu,]sigma] uniform:w|a,b t:nu[,scale] constant:d\n"
            << "  --chain N               Chain length (default: 5000)\n"
            << "  --init X                Initial value (default: 0.5)\n"
            << "  --min X                 Lower bound (default: -inf)\n"
            << "  --max X                 Upper bound (default: inf)\n"
            << "  --burnin N              Leading samples to drop (default: 0)\n"
            << "  --seed S                RNG seed (default: random)\n"
            << "  --chains N              Independent chains (default: 1)\n"
            << "  --threads N             Worker threads, 0 = all cores (default: 1)\n"
            << "  --output <path>         Output file (default: stdout)\n"
            << "  --log-level LEVEL       debug|info|warn|error|off (default: info)\n"
            << "  --help                  Show this message\n";
}

void write_chains(std::ostream &out, const std::vector<ChainResult> &results) {
  if (results.size() == 1) {
    for (double x : results.front().samples)
      out << std::format("{}\n", x);
    return;
  }
  out << "chain,index,value\n";
  for (std::size_t c = 0; c < results.size(); ++c) {
    const auto &samples = results[c].samples;
    for (std::size_t i = 0; i < samples.size(); ++i)
      out << std::format("{},{},{}\n", c, i, samples[i]);
  }
}

struct RunPlan {
  SamplerConfig config;
  std::size_t n_chains;
  std::size_t n_threads;
};

RunPlan build_plan(const CliOptions &opts) {
  auto density = sample::make_density(sample::parse_spec(opts.density));
  auto jump = sample::make_jump(sample::parse_spec(opts.jump));

  std::optional<std::uint64_t> seed;
  if (opts.seed) {
    const std::int64_t s = sample::parse_integer(*opts.seed, "--seed");
    if (s < 0)
      throw ConfigurationError("--seed must be non-negative");
    seed = static_cast<std::uint64_t>(s);
  }

  const std::int64_t n_chains = sample::parse_integer(opts.chains, "--chains");
  const std::int64_t n_threads = sample::parse_integer(opts.threads, "--threads");
  if (n_chains < 1)
    throw ConfigurationError("--chains must be at least 1");
  if (n_threads < 0)
    throw ConfigurationError("--threads must be non-negative");

  SamplerConfig config(sample::as_function(density),
                       sample::parse_integer(opts.chain, "--chain"),
                       sample::parse_real(opts.init, "--init"),
                       jump,
                       Bounds{sample::parse_real(opts.min, "--min"), sample::parse_real(opts.max, "--max")},
                       sample::parse_integer(opts.burnin, "--burnin"),
                       seed);
  return RunPlan{std::move(config), static_cast<std::size_t>(n_chains), static_cast<std::size_t>(n_threads)};
}

} // namespace

int run_cli(int argc, char *argv[], std::ostream &out) {
  const char *prog = argc > 0 ? argv[0] : "metropolis";
  CliOptions opts;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      print_usage(prog);
      return kExitOk;
    } else if (arg == "--density" && i + 1 < argc) {
      opts.density = argv[++i];
    } else if (arg == "--jump" && i + 1 < argc) {
      opts.jump = argv[++i];
    } else if (arg == "--chain" && i + 1 < argc) {
      opts.chain = argv[++i];
    } else if (arg == "--init" && i + 1 < argc) {
      opts.init = argv[++i];
    } else if (arg == "--min" && i + 1 < argc) {
      opts.min = argv[++i];
    } else if (arg == "--max" && i + 1 < argc) {
      opts.max = argv[++i];
    } else if (arg == "--burnin" && i + 1 < argc) {
      opts.burnin = argv[++i];
    } else if (arg == "--seed" && i + 1 < argc) {
      opts.seed = argv[++i];
    } else if (arg == "--chains" && i + 1 < argc) {
      opts.chains = argv[++i];
    } else if (arg == "--threads" && i + 1 < argc) {
      opts.threads = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      opts.output_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      const auto level = metropolis::log::parse_level(argv[++i]);
      if (!level) {
        std::cerr << "Unknown log level: " << argv[i] << "\n";
        return kExitUsage;
      }
      metropolis::log::Logger::instance().set_level(*level);
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage(prog);
      return kExitUsage;
    }
  }

  std::optional<RunPlan> plan;
  try {
    plan.emplace(build_plan(opts));
  } catch (const std::exception &e) {
    MLOG_ERROR("Configuration failed: {}", e.what());
    return kExitConfiguration;
  }

  std::vector<ChainResult> results;
  try {
    results = run_chains(plan->config, plan->n_chains, plan->n_threads);
  } catch (const ConfigurationError &e) {
    MLOG_ERROR("Configuration failed: {}", e.what());
    return kExitConfiguration;
  } catch (const EvaluationError &e) {
    MLOG_ERROR("Sampling failed after {} samples at theta = {}: {}", e.samples_generated(), e.theta(), e.what());
    return kExitEvaluation;
  } catch (const std::exception &e) {
    // e.g. std::bad_alloc for a chain that does not fit in memory
    MLOG_ERROR("Sampling failed: {}", e.what());
    return kExitEvaluation;
  }

  for (std::size_t c = 0; c < results.size(); ++c) {
    MLOG_INFO("Chain {}: {} samples, acceptance rate {:.3f}", c, results[c].samples.size(),
              results[c].acceptance_rate());
  }

  if (opts.output_path.empty()) {
    write_chains(out, results);
  } else {
    std::ofstream file(opts.output_path);
    if (!file.is_open()) {
      MLOG_ERROR("Cannot open output file: {}", opts.output_path);
      return kExitUsage;
    }
    write_chains(file, results);
  }

  return kExitOk;
}

} // namespace metropolis::cli
