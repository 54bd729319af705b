#pragma once

#include "belief/particle_belief.hpp"
#include "core/linalg.hpp"
#include "core/rng.hpp"
#include "credal/credal_set.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace rsa::risk {

using RewardFunction = std::function<double(const core::Vector& state, const core::Vector& action)>;
using TransitionFunction =
    std::function<core::Vector(const core::Vector& state, const core::Vector& action)>;

struct CvarPoint {
  double alpha = 0.0;
  double cvar = 0.0;
};

// Aggregate view over episode returns.
struct ReturnSummary {
  std::size_t episodes = 0;
  double mean = 0.0;
  double worst = 0.0;
  double best = 0.0;
  std::vector<CvarPoint> cvar_curve;
};

bool SummarizeReturns(const std::vector<double>& returns, const std::vector<double>& alphas,
                      ReturnSummary& summary, std::string& error);

// Tail scoring of beliefs and credal sets at a fixed CVaR level.
class RiskEvaluator {
public:
  RiskEvaluator() = default;
  RiskEvaluator(double alpha, double discount) : alpha_(alpha), discount_(discount) {}

  double Alpha() const {
    return alpha_;
  }
  double Discount() const {
    return discount_;
  }

  // Weighted CVaR of value_fn over the belief particles.
  bool EvaluateBelief(const belief::ParticleBelief& belief, const belief::StateFunction& value_fn,
                      double& result, std::string& error) const;

  // Minimum member CVaR over the credal set.
  bool EvaluateCredal(const credal::CredalSet& set, const belief::StateFunction& value_fn,
                      double& result, std::string& error) const;

  // CVaR over `samples` particles drawn from the belief of
  //   reward(x, u) + discount * value(transition(x, u)).
  bool BellmanBackup(const belief::ParticleBelief& belief, const core::Vector& action,
                     const RewardFunction& reward, const TransitionFunction& transition,
                     const belief::StateFunction& value_fn, std::size_t samples, core::Rng& rng,
                     double& result, std::string& error) const;

private:
  double alpha_ = 0.1;
  double discount_ = 0.98;
};

} // namespace rsa::risk
