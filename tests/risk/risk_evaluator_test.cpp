#include "belief/particle_belief.hpp"
#include "core/rng.hpp"
#include "credal/credal_set.hpp"
#include "risk/cvar.hpp"
#include "risk/risk_evaluator.hpp"
#include "semantics/claim.hpp"

#include <catch2/catch.hpp>

#include <string>

using rsa::core::MakeVector;

namespace {

double NegY(const rsa::core::Vector& x) {
  return -x[1];
}

} // namespace

TEST_CASE("Belief CVaR is below the belief mean value", "[risk]") {
  rsa::core::Rng rng(5);
  rsa::belief::ParticleBelief belief;
  std::string error;
  REQUIRE(belief.Initialize(MakeVector({0.0, 0.0}), MakeVector({0.2, 0.2}), 2000, rng, error));

  const rsa::risk::RiskEvaluator evaluator(0.1, 0.98);
  double cvar = 0.0;
  REQUIRE(evaluator.EvaluateBelief(belief, NegY, cvar, error));
  REQUIRE(cvar < belief.Expectation(NegY));
  // Lower 10% tail of N(0, 0.2^2) has mean -0.2 * 1.755.
  REQUIRE(cvar == Catch::Detail::Approx(-0.351).margin(0.03));

  REQUIRE_FALSE(evaluator.EvaluateBelief(rsa::belief::ParticleBelief{}, NegY, cvar, error));
}

TEST_CASE("Credal CVaR is the worst member CVaR", "[risk][credal]") {
  rsa::core::Rng rng(6);
  rsa::belief::ParticleBelief belief;
  std::string error;
  REQUIRE(belief.Initialize(MakeVector({0.0, 0.0}), MakeVector({0.3, 0.3}), 2000, rng, error));

  rsa::credal::CredalSet set;
  REQUIRE(set.Build(belief, rsa::semantics::MakeHalfSpaceRegion(1U, 0.0), 1.0, {}, error));

  const rsa::risk::RiskEvaluator evaluator(0.1, 0.98);
  double robust = 0.0;
  REQUIRE(evaluator.EvaluateCredal(set, NegY, robust, error));
  double single = 0.0;
  REQUIRE(evaluator.EvaluateBelief(belief, NegY, single, error));
  REQUIRE(robust <= single + 1e-12);

  REQUIRE_FALSE(evaluator.EvaluateCredal(rsa::credal::CredalSet{}, NegY, robust, error));
}

TEST_CASE("Bellman backup adds discounted successor values", "[risk]") {
  rsa::core::Rng rng(7);
  rsa::belief::ParticleBelief belief;
  std::string error;
  REQUIRE(belief.Initialize(MakeVector({1.0, 2.0}), MakeVector({0.0, 0.0}), 50, rng, error));

  const rsa::risk::RiskEvaluator evaluator(0.5, 0.5);
  const auto reward = [](const rsa::core::Vector& x, const rsa::core::Vector& u) {
    return -x[0] - u[0];
  };
  const auto transition = [](const rsa::core::Vector& x, const rsa::core::Vector& u) {
    return rsa::core::Vector(x + u);
  };
  const auto value = [](const rsa::core::Vector& x) { return x[1]; };

  double backup = 0.0;
  const rsa::core::Vector action = MakeVector({1.0, 2.0});
  REQUIRE(evaluator.BellmanBackup(belief, action, reward, transition, value, 20, rng, backup,
                                  error));
  // reward -2, successor y = 4, discounted by 0.5.
  REQUIRE(backup == Catch::Detail::Approx(0.0).margin(1e-12));

  REQUIRE_FALSE(evaluator.BellmanBackup(belief, action, reward, transition, value, 0, rng,
                                        backup, error));
  REQUIRE_FALSE(evaluator.BellmanBackup(belief, action, nullptr, transition, value, 5, rng,
                                        backup, error));
}
