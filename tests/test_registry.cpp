#include <metropolis/sample/registry.hpp>
#include <metropolis/core/errors.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace metropolis::sample;
using metropolis::core::ConfigurationError;

TEST(RegistryTest, ParseSpecWithParameters) {
  const auto spec = parse_spec("beta:15,7");
  EXPECT_EQ(spec.name, "beta");
  ASSERT_EQ(spec.params.size(), 2u);
  EXPECT_DOUBLE_EQ(spec.params[0], 15.0);
  EXPECT_DOUBLE_EQ(spec.params[1], 7.0);
}

TEST(RegistryTest, ParseSpecTrimsAndLowercases) {
  const auto spec = parse_spec("  Gamma : 2, 5 ,4 ");
  EXPECT_EQ(spec.name, "gamma");
  ASSERT_EQ(spec.params.size(), 3u);
  EXPECT_DOUBLE_EQ(spec.params[2], 4.0);

  const auto bare = parse_spec("normal");
  EXPECT_EQ(bare.name, "normal");
  EXPECT_TRUE(bare.params.empty());
}

TEST(RegistryTest, ParseSpecErrors) {
  EXPECT_THROW(parse_spec(":1,2"), ConfigurationError);
  EXPECT_THROW(parse_spec("beta:1,x"), ConfigurationError);
  EXPECT_THROW(parse_spec("beta:1,"), ConfigurationError);
}

TEST(RegistryTest, ParseNumbers) {
  EXPECT_DOUBLE_EQ(parse_real("0.25", "x"), 0.25);
  EXPECT_EQ(parse_real("inf", "x"), std::numeric_limits<double>::infinity());
  EXPECT_EQ(parse_real("-inf", "x"), -std::numeric_limits<double>::infinity());
  EXPECT_THROW(parse_real("1.5abc", "x"), ConfigurationError);
  EXPECT_THROW(parse_real("", "x"), ConfigurationError);

  EXPECT_EQ(parse_integer("5000", "n"), 5000);
  EXPECT_EQ(parse_integer("-3", "n"), -3);
  EXPECT_THROW(parse_integer("1.5", "n"), ConfigurationError);
  EXPECT_THROW(parse_integer("many", "n"), ConfigurationError);
}

TEST(RegistryTest, MakeDensity) {
  auto beta = make_density(parse_spec("beta:2,2"));
  EXPECT_NEAR(beta->evaluate(0.5), 1.5, 1e-12);

  auto gamma = make_density(parse_spec("gamma:2,5,4"));
  EXPECT_NEAR(gamma->evaluate(9.0), 0.2 * std::exp(-1.0), 1e-12);

  auto expo = make_density(parse_spec("exp:2"));
  EXPECT_DOUBLE_EQ(expo->evaluate(0.0), 2.0);
}

TEST(RegistryTest, MakeDensityErrors) {
  EXPECT_THROW(make_density(parse_spec("cauchy:0,1")), ConfigurationError);
  EXPECT_THROW(make_density(parse_spec("beta:1")), ConfigurationError);
  EXPECT_THROW(make_density(parse_spec("beta:-1,2")), ConfigurationError);
  EXPECT_THROW(make_density(parse_spec("uniform:1,0")), ConfigurationError);
  EXPECT_THROW(make_density(parse_spec("normal:inf,1")), ConfigurationError);
}

TEST(RegistryTest, MakeJump) {
  EXPECT_EQ(make_jump(parse_spec("normal"))->name(), "normal(0, 0.2)");
  EXPECT_EQ(make_jump(parse_spec("normal:0.5"))->name(), "normal(0, 0.5)");
  EXPECT_EQ(make_jump(parse_spec("normal:0,2"))->name(), "normal(0, 2)");
  EXPECT_EQ(make_jump(parse_spec("uniform:0.5"))->name(), "uniform(-0.5, 0.5)");
  EXPECT_TRUE(make_jump(parse_spec("t:5"))->symmetric());
  EXPECT_EQ(make_jump(parse_spec("constant:1"))->name(), "constant(1)");
}

TEST(RegistryTest, MakeJumpErrors) {
  EXPECT_THROW(make_jump(parse_spec("laplace:1")), ConfigurationError);
  EXPECT_THROW(make_jump(parse_spec("normal:0,1,2")), ConfigurationError);
  EXPECT_THROW(make_jump(parse_spec("normal:0,-1")), ConfigurationError);
  EXPECT_THROW(make_jump(parse_spec("constant")), ConfigurationError);
  EXPECT_THROW(make_jump(parse_spec("t:inf")), ConfigurationError);
  EXPECT_NO_THROW(make_jump(parse_spec("uniform:-1e308,1e308")));
}
