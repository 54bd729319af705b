#include "query/query_engine.hpp"

#include <cmath>
#include <vector>

namespace rsa::query {

bool ShouldQuery(const double evi, const double delta_star) {
  return evi >= delta_star;
}

bool QueryDecisionEngine::ExpectedValueOfInformation(const belief::ParticleBelief& belief,
                                                     const BeliefValueFunction& value_fn,
                                                     const double obs_noise,
                                                     const std::size_t samples, core::Rng& rng,
                                                     double& evi, std::string& error) const {
  if (belief.Empty()) {
    error = "cannot compute EVI on an empty belief";
    return false;
  }
  if (!value_fn) {
    error = "EVI needs a belief value function";
    return false;
  }
  if (!std::isfinite(obs_noise) || obs_noise <= 0.0) {
    error = "EVI observation noise must be finite and > 0";
    return false;
  }
  if (samples == 0U) {
    error = "EVI needs at least one sample";
    return false;
  }

  const double current = value_fn(belief);
  const std::vector<std::size_t> indices = belief::SampleIndices(belief.Weights(), samples, rng);

  belief::ParticleBelief posterior;
  core::Vector observation;
  double total = 0.0;
  for (const std::size_t index : indices) {
    belief.CopyParticle(index, observation);
    for (Eigen::Index d = 0; d < observation.size(); ++d) {
      observation[d] += obs_noise * rng.Normal();
    }

    posterior = belief;
    belief::AddGaussianLogLikelihood(posterior.Positions(), observation, obs_noise,
                                     posterior.MutableLogWeights());
    // A degenerate what-if posterior falls back to uniform weights and is
    // still scored.
    static_cast<void>(posterior.Normalize());
    total += value_fn(posterior);
  }

  evi = total / static_cast<double>(indices.size()) - current;
  if (!std::isfinite(evi)) {
    error = "EVI evaluated to a non-finite value";
    return false;
  }
  return true;
}

} // namespace rsa::query
