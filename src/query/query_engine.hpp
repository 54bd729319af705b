#pragma once

#include "belief/particle_belief.hpp"
#include "core/rng.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace rsa::query {

// Value of a belief, e.g. negative distance of the mean to a goal.
using BeliefValueFunction = std::function<double(const belief::ParticleBelief&)>;

struct QueryConfig {
  bool enabled = true;
  // Fixed reward penalty charged each time a query fires.
  double cost = 0.2;
  // Query when EVI >= delta_star.
  double delta_star = 0.15;
  std::size_t samples = 50;
  // Query observations use obs_noise * noise_scale.
  double noise_scale = 0.5;
};

bool ShouldQuery(double evi, double delta_star);

// Monte-Carlo expected value of information of one extra observation.
class QueryDecisionEngine {
public:
  QueryDecisionEngine() = default;
  explicit QueryDecisionEngine(const QueryConfig& config) : config_(config) {}

  const QueryConfig& Config() const {
    return config_;
  }

  // EVI = mean_j V(b | o_j) - V(b), with o_j = x_j + N(0, obs_noise^2) and
  // x_j drawn from the belief weights. Each what-if posterior is a copy; the
  // belief passed in is never modified.
  bool ExpectedValueOfInformation(const belief::ParticleBelief& belief,
                                  const BeliefValueFunction& value_fn, double obs_noise,
                                  std::size_t samples, core::Rng& rng, double& evi,
                                  std::string& error) const;

  bool ShouldQuery(double evi) const {
    return query::ShouldQuery(evi, config_.delta_star);
  }

private:
  QueryConfig config_;
};

} // namespace rsa::query
