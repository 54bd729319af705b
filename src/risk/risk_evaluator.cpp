#include "risk/risk_evaluator.hpp"

#include "risk/cvar.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rsa::risk {

bool SummarizeReturns(const std::vector<double>& returns, const std::vector<double>& alphas,
                      ReturnSummary& summary, std::string& error) {
  if (returns.empty()) {
    error = "cannot summarize an empty set of returns";
    return false;
  }

  summary = ReturnSummary{};
  summary.episodes = returns.size();
  double sum = 0.0;
  summary.worst = std::numeric_limits<double>::infinity();
  summary.best = -std::numeric_limits<double>::infinity();
  for (const double r : returns) {
    sum += r;
    summary.worst = std::min(summary.worst, r);
    summary.best = std::max(summary.best, r);
  }
  summary.mean = sum / static_cast<double>(returns.size());

  for (const double alpha : alphas) {
    CvarPoint point;
    point.alpha = alpha;
    if (!Cvar(returns, alpha, point.cvar, error)) {
      return false;
    }
    summary.cvar_curve.push_back(point);
  }
  return true;
}

bool RiskEvaluator::EvaluateBelief(const belief::ParticleBelief& belief,
                                   const belief::StateFunction& value_fn, double& result,
                                   std::string& error) const {
  if (belief.Empty()) {
    error = "cannot evaluate an empty belief";
    return false;
  }
  std::vector<double> values(belief.Size(), 0.0);
  core::Vector x;
  for (std::size_t i = 0; i < belief.Size(); ++i) {
    belief.CopyParticle(i, x);
    values[i] = value_fn(x);
  }
  return CvarWeighted(belief.LogWeights(), values, alpha_, result, error);
}

bool RiskEvaluator::EvaluateCredal(const credal::CredalSet& set,
                                   const belief::StateFunction& value_fn, double& result,
                                   std::string& error) const {
  if (set.Empty()) {
    error = "credal set is empty";
    return false;
  }

  const core::ParticleMatrix& snapshot = set.SnapshotPositions();
  std::vector<double> values(set.ParticleCount(), 0.0);
  core::Vector x;
  for (std::size_t i = 0; i < set.ParticleCount(); ++i) {
    x = snapshot.row(static_cast<Eigen::Index>(i)).transpose();
    values[i] = value_fn(x);
  }

  double robust = std::numeric_limits<double>::infinity();
  for (std::size_t k = 0; k < set.Size(); ++k) {
    double member = 0.0;
    if (!CvarWeighted(set.MemberLogWeights(k), values, alpha_, member, error)) {
      return false;
    }
    robust = std::min(robust, member);
  }
  result = robust;
  return true;
}

bool RiskEvaluator::BellmanBackup(const belief::ParticleBelief& belief, const core::Vector& action,
                                  const RewardFunction& reward,
                                  const TransitionFunction& transition,
                                  const belief::StateFunction& value_fn, const std::size_t samples,
                                  core::Rng& rng, double& result, std::string& error) const {
  if (belief.Empty()) {
    error = "cannot back up an empty belief";
    return false;
  }
  if (samples == 0U) {
    error = "bellman backup needs at least one sample";
    return false;
  }
  if (!reward || !transition || !value_fn) {
    error = "bellman backup needs reward, transition and value functions";
    return false;
  }

  const std::vector<std::size_t> indices = belief::SampleIndices(belief.Weights(), samples, rng);
  std::vector<double> returns;
  returns.reserve(indices.size());
  core::Vector x;
  for (const std::size_t index : indices) {
    belief.CopyParticle(index, x);
    returns.push_back(reward(x, action) + discount_ * value_fn(transition(x, action)));
  }
  return Cvar(returns, alpha_, result, error);
}

} // namespace rsa::risk
