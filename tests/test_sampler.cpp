#include <metropolis/core/sampler.hpp>
#include <metropolis/sample/density.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>
#include <string>
#include <stdexcept>
#include <vector>

using namespace metropolis::core;
using metropolis::sample::as_function;
using metropolis::sample::BetaDensity;

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

double unit_uniform(double x) { return (x >= 0.0 && x <= 1.0) ? 1.0 : 0.0; }

DensityFunction beta_15_7() {
  return as_function(std::make_shared<const BetaDensity>(15.0, 7.0));
}

} // namespace

TEST(SamplerTest, NoOpJumpsKeepTheInitialValue) {
  Rng rng(1);
  const auto chain = run(unit_uniform, [] { return 0.0; }, 5, 0.3, 0.0, 1.0, 0, rng);
  EXPECT_EQ(chain, (std::vector<double>{0.3, 0.3, 0.3, 0.3, 0.3}));
}

TEST(SamplerTest, ZeroDensityAcceptsEveryInBoundsMove) {
  Rng rng(1);
  const auto result = run_chain([](double) { return 0.0; }, [] { return 1.0; }, 4, 0.0, Bounds{0.0, 10.0}, 0, rng);
  EXPECT_EQ(result.samples, (std::vector<double>{0.0, 1.0, 2.0, 3.0}));
  EXPECT_EQ(result.proposals, 3u);
  EXPECT_EQ(result.accepted, 3u);
  EXPECT_DOUBLE_EQ(result.acceptance_rate(), 1.0);
}

TEST(SamplerTest, LengthIsChainMinusBurnin) {
  const std::int64_t lengths[] = {1, 2, 10, 257};
  for (std::int64_t n : lengths) {
    for (std::int64_t burnin : {std::int64_t{0}, n / 2, n}) {
      Rng rng(static_cast<std::uint64_t>(n * 31 + burnin));
      const auto chain = run(beta_15_7(), [&rng] { return rng.normal(0.0, 0.2); }, n, 0.5, 0.0, 1.0, burnin, rng);
      EXPECT_EQ(chain.size(), static_cast<std::size_t>(n - burnin)) << "n=" << n << " burnin=" << burnin;
    }
  }
}

TEST(SamplerTest, SamplesStayInsideBounds) {
  Rng rng(17);
  const auto chain = run(beta_15_7(), [&rng] { return rng.normal(0.0, 0.8); }, 5000, 0.1, 0.0, 1.0, 0, rng);
  for (double x : chain) {
    EXPECT_GE(x, 0.0);
    EXPECT_LE(x, 1.0);
  }
}

TEST(SamplerTest, SameSeedSameChain) {
  auto sample_once = [](std::uint64_t seed) {
    Rng rng(seed);
    return run(beta_15_7(), [&rng] { return rng.normal(0.0, 0.2); }, 500, 0.5, 0.0, 1.0, 50, rng);
  };
  const auto a = sample_once(42);
  const auto b = sample_once(42);
  EXPECT_EQ(a, b);
  EXPECT_NE(a, sample_once(43));
}

TEST(SamplerTest, SeededOverloadIsReproducible) {
  auto sample_once = [] {
    Rng proposal_rng(5);
    return run(beta_15_7(), [&proposal_rng] { return proposal_rng.normal(0.0, 0.3); }, 300, 0.5, 0.0, 1.0, 0,
               std::optional<std::uint64_t>(8));
  };
  EXPECT_EQ(sample_once(), sample_once());
}

TEST(SamplerTest, RejectedProposalsRepeatThePreviousSample) {
  Rng rng(123);
  std::vector<double> deltas;
  auto proposal = [&] {
    deltas.push_back(rng.normal(0.0, 0.5));
    return deltas.back();
  };
  const auto chain = run(beta_15_7(), proposal, 2000, 0.5, 0.0, 1.0, 0, rng);
  ASSERT_EQ(deltas.size(), chain.size() - 1);

  std::size_t rejected = 0;
  for (std::size_t i = 1; i < chain.size(); ++i) {
    const double proposed = chain[i - 1] + deltas[i - 1];
    if (chain[i] != proposed) {
      EXPECT_EQ(chain[i], chain[i - 1]) << "at " << i;
      ++rejected;
    }
  }
  EXPECT_GT(rejected, 0u);
}

TEST(SamplerTest, FirstSampleIsInitialWithoutBurnin) {
  Rng rng(4);
  const auto chain = run(beta_15_7(), [&rng] { return rng.normal(0.0, 0.2); }, 100, 0.27, 0.0, 1.0, 0, rng);
  ASSERT_FALSE(chain.empty());
  EXPECT_EQ(chain.front(), 0.27);
}

TEST(SamplerTest, SingleElementChainNeverCallsTheCallables) {
  Rng rng(4);
  auto density = [](double) -> double { throw std::runtime_error("density called"); };
  auto proposal = []() -> double { throw std::runtime_error("proposal called"); };
  EXPECT_EQ(run(density, proposal, 1, 0.7, 0.0, 1.0, 0, rng), std::vector<double>{0.7});
}

TEST(SamplerTest, OutOfBoundsProposalsAreAlwaysRejected) {
  Rng rng(4);
  int density_calls = 0;
  auto density = [&](double) {
    ++density_calls;
    return 1.0;
  };
  const auto result = run_chain(density, [] { return 5.0; }, 200, 0.5, Bounds{0.0, 1.0}, 0, rng);
  for (double x : result.samples)
    EXPECT_EQ(x, 0.5);
  EXPECT_EQ(density_calls, 0);
  EXPECT_EQ(result.accepted, 0u);
  EXPECT_EQ(result.proposals, 199u);
}

TEST(SamplerTest, BurninDropsLeadingSamplesInOrder) {
  auto sample = [](std::int64_t burnin) {
    Rng rng(77);
    return run(beta_15_7(), [&rng] { return rng.normal(0.0, 0.2); }, 40, 0.5, 0.0, 1.0, burnin, rng);
  };
  const auto full = sample(0);
  const auto trimmed = sample(15);
  EXPECT_EQ(trimmed, std::vector<double>(full.begin() + 15, full.end()));
  EXPECT_TRUE(sample(40).empty());
}

TEST(SamplerTest, UnboundedDefaultsAcceptEverything) {
  Rng rng(2);
  const auto result = run_chain([](double) { return 1.0; }, [] { return -3.0; }, 4, 0.0, Bounds{}, 0, rng);
  EXPECT_EQ(result.samples, (std::vector<double>{0.0, -3.0, -6.0, -9.0}));
}

TEST(SamplerTest, ConfigurationErrorsAreRaisedBeforeSampling) {
  Rng rng(1);
  auto density = [](double) -> double { throw std::runtime_error("must not be called"); };
  auto proposal = []() -> double { throw std::runtime_error("must not be called"); };

  EXPECT_THROW(run(density, proposal, 0, 0.5, 0.0, 1.0, 0, rng), ConfigurationError);
  EXPECT_THROW(run(density, proposal, -5, 0.5, 0.0, 1.0, 0, rng), ConfigurationError);
  EXPECT_THROW(run(density, proposal, 10, 0.5, 0.0, 1.0, -1, rng), ConfigurationError);
  EXPECT_THROW(run(density, proposal, 10, 0.5, 0.0, 1.0, 11, rng), ConfigurationError);
  EXPECT_THROW(run(density, proposal, 10, 0.5, 1.0, 0.0, 0, rng), ConfigurationError);
  EXPECT_THROW(run(density, proposal, 10, 0.5, std::nan(""), 1.0, 0, rng), ConfigurationError);
  EXPECT_THROW(run(DensityFunction{}, proposal, 10, 0.5, 0.0, 1.0, 0, rng), ConfigurationError);
  EXPECT_THROW(run(density, ProposalSampler{}, 10, 0.5, 0.0, 1.0, 0, rng), ConfigurationError);
}

TEST(SamplerTest, UnstorableChainLengthIsAConfigurationError) {
  Rng rng(1);
  auto proposal = []() -> double { throw std::runtime_error("must not be called"); };
  EXPECT_THROW(run(unit_uniform, proposal, std::numeric_limits<std::int64_t>::max(), 0.5, 0.0, 1.0, 0, rng),
               ConfigurationError);
  EXPECT_THROW(run(unit_uniform, proposal, 4'000'000'000'000'000'000, 0.5, 0.0, 1.0, 0, rng), ConfigurationError);
}

TEST(SamplerTest, EqualBoundsAreValid) {
  Rng rng(1);
  const auto chain = run([](double) { return 1.0; }, [&rng] { return rng.normal(0.0, 1.0); }, 10, 2.0, 2.0, 2.0, 0,
                         rng);
  EXPECT_EQ(chain, std::vector<double>(10, 2.0));
}

TEST(SamplerTest, DensityFailureReportsPartialChain) {
  Rng rng(1);
  int calls = 0;
  auto density = [&](double) {
    if (++calls == 3)
      throw std::domain_error("overflow");
    return 1.0;
  };
  try {
    run(density, [] { return 0.1; }, 10, 0.0, -kInf, kInf, 0, rng);
    FAIL() << "expected EvaluationError";
  } catch (const EvaluationError &e) {
    EXPECT_EQ(e.samples_generated(), 2u);
    EXPECT_EQ(e.partial_chain(), (std::vector<double>{0.0, 0.1}));
    EXPECT_DOUBLE_EQ(e.theta(), 0.1 + 0.1);
    EXPECT_NE(std::string(e.what()).find("overflow"), std::string::npos);
  }
}

TEST(SamplerTest, NegativeDensityIsAnEvaluationError) {
  Rng rng(1);
  try {
    run([](double) { return -1.0; }, [] { return 0.1; }, 10, 0.5, 0.0, 1.0, 0, rng);
    FAIL() << "expected EvaluationError";
  } catch (const EvaluationError &e) {
    EXPECT_EQ(e.samples_generated(), 1u);
    EXPECT_EQ(e.theta(), 0.5);
  }
}

TEST(SamplerTest, NonFiniteDensityIsAnEvaluationError) {
  Rng rng(1);
  auto nan_at_proposal = [](double x) { return x > 0.55 ? std::nan("") : 1.0; };
  EXPECT_THROW(run(nan_at_proposal, [] { return 0.1; }, 10, 0.5, 0.0, 1.0, 0, rng), EvaluationError);
  auto inf_density = [](double) { return kInf; };
  EXPECT_THROW(run(inf_density, [] { return 0.1; }, 10, 0.5, 0.0, 1.0, 0, rng), EvaluationError);
}

TEST(SamplerTest, ProposalFailureIsAnEvaluationError) {
  Rng rng(1);
  EXPECT_THROW(run(unit_uniform, [] { return std::nan(""); }, 10, 0.5, 0.0, 1.0, 0, rng), EvaluationError);
  EXPECT_THROW(run(unit_uniform, []() -> double { throw std::runtime_error("no draw"); }, 10, 0.5, 0.0, 1.0, 0, rng),
               EvaluationError);
}

TEST(SamplerTest, CancellationStopsTheChain) {
  Rng rng(1);
  std::atomic<bool> cancel{true};
  try {
    run_chain(unit_uniform, [] { return 0.0; }, 100, 0.5, Bounds{0.0, 1.0}, 0, rng, &cancel);
    FAIL() << "expected CancelledError";
  } catch (const CancelledError &e) {
    EXPECT_EQ(e.samples_generated(), 1u);
  }
}

TEST(SamplerTest, ChainMeanApproachesBetaMean) {
  Rng rng(7);
  const auto chain = run(beta_15_7(), [&rng] { return rng.normal(0.0, 0.2); }, 60000, 0.5, 0.0, 1.0, 5000, rng);
  const double mean = std::accumulate(chain.begin(), chain.end(), 0.0) / static_cast<double>(chain.size());
  EXPECT_NEAR(mean, 15.0 / 22.0, 0.02);
}
