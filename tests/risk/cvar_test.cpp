#include "core/rng.hpp"
#include "risk/cvar.hpp"
#include "risk/risk_evaluator.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <numbers>
#include <string>
#include <vector>

namespace {

struct NormalTail {
  double alpha;
  // Phi^-1(alpha)
  double quantile;
};

constexpr NormalTail kNormalTails[] = {
    {0.05, -1.6448536269514726},
    {0.10, -1.2815515655446008},
    {0.25, -0.6744897501960817},
    {0.50, 0.0},
};

std::vector<double> NormalSample(const std::uint64_t seed, const std::size_t n) {
  rsa::core::Rng rng(seed);
  std::vector<double> samples(n);
  for (double& v : samples) {
    v = rng.Normal();
  }
  return samples;
}

} // namespace

TEST_CASE("CVaR of a standard normal matches the closed form", "[risk][cvar]") {
  const std::vector<double> samples = NormalSample(2024, 1000000);
  std::string error;
  for (const NormalTail& tail : kNormalTails) {
    // -phi(Phi^-1(alpha)) / alpha
    const double density =
        std::exp(-0.5 * tail.quantile * tail.quantile) / std::sqrt(2.0 * std::numbers::pi);
    const double expected = -density / tail.alpha;

    double cvar = 0.0;
    REQUIRE(rsa::risk::Cvar(samples, tail.alpha, cvar, error));
    REQUIRE(cvar == Catch::Detail::Approx(expected).epsilon(0.01));
  }
}

TEST_CASE("CVaR of a uniform sample is the mean of its lower tail", "[risk][cvar]") {
  rsa::core::Rng rng(99);
  std::vector<double> samples(4000000);
  for (double& v : samples) {
    v = 10.0 * rng.Uniform();
  }

  std::string error;
  for (const double alpha : {0.05, 0.1, 0.25, 0.5}) {
    double cvar = 0.0;
    REQUIRE(rsa::risk::Cvar(samples, alpha, cvar, error));
    REQUIRE(cvar == Catch::Detail::Approx(5.0 * alpha).epsilon(0.01));
  }
}

TEST_CASE("CVaR never decreases as alpha grows on a large sample", "[risk][cvar]") {
  const std::vector<double> samples = NormalSample(7, 100000);
  rsa::core::Rng rng(8);
  rsa::core::Vector log_weights(static_cast<Eigen::Index>(samples.size()));
  for (Eigen::Index i = 0; i < log_weights.size(); ++i) {
    log_weights[i] = rng.Normal();
  }

  std::string error;
  double previous = -std::numeric_limits<double>::infinity();
  double previous_weighted = -std::numeric_limits<double>::infinity();
  for (int step = 1; step <= 100; ++step) {
    const double alpha = 0.01 * static_cast<double>(step);
    double cvar = 0.0;
    REQUIRE(rsa::risk::Cvar(samples, alpha, cvar, error));
    REQUIRE(cvar >= previous);
    previous = cvar;

    double weighted = 0.0;
    REQUIRE(rsa::risk::CvarWeighted(log_weights, samples, alpha, weighted, error));
    REQUIRE(weighted >= previous_weighted);
    previous_weighted = weighted;
  }
}

TEST_CASE("CVaR is monotone in alpha and equals the mean at alpha 1", "[risk][cvar]") {
  const std::vector<double> values{4.0, -1.0, 2.0, 8.0, 0.5, -3.0, 6.0};
  std::string error;
  double previous = -std::numeric_limits<double>::infinity();
  for (const double alpha : {0.01, 0.1, 0.25, 0.5, 0.75, 1.0}) {
    double cvar = 0.0;
    REQUIRE(rsa::risk::Cvar(values, alpha, cvar, error));
    REQUIRE(cvar >= previous);
    previous = cvar;
  }

  double mean = 0.0;
  for (const double v : values) {
    mean += v;
  }
  mean /= static_cast<double>(values.size());
  double full = 0.0;
  REQUIRE(rsa::risk::Cvar(values, 1.0, full, error));
  REQUIRE(full == Catch::Detail::Approx(mean));

  double worst = 0.0;
  REQUIRE(rsa::risk::Cvar(values, 0.01, worst, error));
  REQUIRE(worst == -3.0);
}

TEST_CASE("CVaR rejects bad alphas and values", "[risk][cvar]") {
  double cvar = 0.0;
  std::string error;
  REQUIRE_FALSE(rsa::risk::Cvar({}, 0.1, cvar, error));
  REQUIRE_FALSE(rsa::risk::Cvar({1.0}, 0.0, cvar, error));
  REQUIRE_FALSE(rsa::risk::Cvar({1.0}, 1.5, cvar, error));
  REQUIRE_FALSE(rsa::risk::Cvar({1.0, std::nan("")}, 0.5, cvar, error));
  REQUIRE_FALSE(
      rsa::risk::CvarWeighted(rsa::core::MakeVector({0.0}), {1.0, 2.0}, 0.5, cvar, error));
}

TEST_CASE("Weighted CVaR follows the particle weights", "[risk][cvar]") {
  const std::vector<double> values{-10.0, 0.0, 1.0, 2.0};
  std::string error;

  // Uniform weights: the worst half is {-10, 0}.
  double uniform = 0.0;
  REQUIRE(rsa::risk::CvarWeighted(rsa::core::Vector::Zero(4), values, 0.5, uniform, error));
  REQUIRE(uniform == Catch::Detail::Approx(-5.0));

  // Almost no weight on -10: the tail is dominated by 0.
  const double tiny = std::log(1e-6);
  double tilted = 0.0;
  REQUIRE(rsa::risk::CvarWeighted(rsa::core::MakeVector({tiny, 0.0, 0.0, 0.0}), values, 0.5,
                                  tilted, error));
  REQUIRE(tilted > -0.01);
  REQUIRE(tilted <= 0.0);
}

TEST_CASE("Return summaries report mean, extremes and the CVaR curve", "[risk]") {
  rsa::risk::ReturnSummary summary;
  std::string error;
  REQUIRE(rsa::risk::SummarizeReturns({-5.0, 1.0, 3.0, 9.0}, {0.25, 1.0}, summary, error));
  REQUIRE(summary.episodes == 4U);
  REQUIRE(summary.mean == Catch::Detail::Approx(2.0));
  REQUIRE(summary.worst == -5.0);
  REQUIRE(summary.best == 9.0);
  REQUIRE(summary.cvar_curve.size() == 2U);
  REQUIRE(summary.cvar_curve[0].cvar == Catch::Detail::Approx(-5.0));
  REQUIRE(summary.cvar_curve[1].cvar == Catch::Detail::Approx(2.0));

  REQUIRE_FALSE(rsa::risk::SummarizeReturns({}, {0.1}, summary, error));
  REQUIRE_FALSE(rsa::risk::SummarizeReturns({1.0}, {2.0}, summary, error));
}
