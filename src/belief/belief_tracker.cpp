#include "belief/belief_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rsa::belief {

BeliefTracker::BeliefTracker(const BeliefConfig& config, const credal::CredalConfig& credal_config)
    : config_(config), credal_(credal_config) {}

bool BeliefTracker::Reset(const core::Vector& mean, const core::Vector& std_dev, core::Rng& rng,
                          std::string& error) {
  ParticleBelief fresh;
  if (!fresh.Initialize(mean, std_dev, config_.particles, rng, error)) {
    return false;
  }
  belief_ = std::move(fresh);
  credal_.Discard();
  return true;
}

bool BeliefTracker::ValidateObservation(const core::Vector& observation, const double noise_std,
                                        std::string& error) const {
  if (belief_.Empty()) {
    error = "belief is not initialized";
    return false;
  }
  if (observation.size() == 0) {
    error = "observation is empty";
    return false;
  }
  if (core::Dim(observation) != belief_.Dimension()) {
    error = "observation dimension " + std::to_string(observation.size()) +
            " does not match state dimension " + std::to_string(belief_.Dimension());
    return false;
  }
  if (!observation.allFinite()) {
    error = "observation contains non-finite values";
    return false;
  }
  if (!std::isfinite(noise_std) || noise_std <= 0.0) {
    error = "observation noise std must be finite and > 0";
    return false;
  }
  return true;
}

bool BeliefTracker::UpdateObservation(const core::Vector& observation, const double noise_std,
                                      UpdateReport& report, std::string& error) {
  if (!ValidateObservation(observation, noise_std, error)) {
    return false;
  }

  AddGaussianLogLikelihood(belief_.Positions(), observation, noise_std,
                           belief_.MutableLogWeights());
  if (!belief_.Normalize()) {
    report.numeric_degeneracy = true;
  }
  if (credal_.Active() && !credal_.MutableSet().ApplyObservation(observation, noise_std)) {
    report.numeric_degeneracy = true;
  }
  return true;
}

bool BeliefTracker::ApplyClaim(const semantics::Claim& claim, const semantics::SourceTrust& trust,
                               UpdateReport& report, std::string& error) {
  if (!semantics::ValidateClaim(claim, error)) {
    return false;
  }
  if (belief_.Empty()) {
    error = "belief is not initialized";
    return false;
  }

  const double lambda = trust.LogOdds();
  switch (claim.value) {
  case semantics::BelnapValue::kUnknown:
    return true;
  case semantics::BelnapValue::kContradictory:
    if (!credal_.Expand(belief_, claim.id, claim.region, lambda, error)) {
      return false;
    }
    report.credal_created = true;
    return true;
  case semantics::BelnapValue::kTrue:
  case semantics::BelnapValue::kFalse:
    break;
  }

  const double inside = claim.value == semantics::BelnapValue::kTrue ? lambda : -lambda;
  core::Vector& log_weights = belief_.MutableLogWeights();
  core::Vector x;
  for (std::size_t i = 0; i < belief_.Size(); ++i) {
    belief_.CopyParticle(i, x);
    log_weights[static_cast<Eigen::Index>(i)] += claim.region.contains(x) ? inside : -inside;
  }
  if (!belief_.Normalize()) {
    report.numeric_degeneracy = true;
  }
  return true;
}

bool BeliefTracker::Predict(const core::Vector& displacement, const double process_noise_std,
                            core::Rng& rng, std::string& error) {
  if (belief_.Empty()) {
    error = "belief is not initialized";
    return false;
  }
  if (core::Dim(displacement) != belief_.Dimension() || !displacement.allFinite()) {
    error = "displacement must be finite with the state dimension";
    return false;
  }
  if (!std::isfinite(process_noise_std) || process_noise_std < 0.0) {
    error = "process noise std must be finite and >= 0";
    return false;
  }

  core::ParticleMatrix& positions = belief_.MutablePositions();
  positions.rowwise() += displacement.transpose();
  if (process_noise_std > 0.0) {
    for (Eigen::Index i = 0; i < positions.rows(); ++i) {
      for (Eigen::Index d = 0; d < positions.cols(); ++d) {
        positions(i, d) += process_noise_std * rng.Normal();
      }
    }
  }
  if (credal_.Active()) {
    credal_.MutableSet().Translate(displacement);
  }
  return true;
}

bool BeliefTracker::ResampleIfNeeded(core::Rng& rng) {
  if (belief_.Empty()) {
    return false;
  }
  const double threshold = config_.resample_fraction * static_cast<double>(belief_.Size());
  if (belief_.Ess() >= threshold) {
    return false;
  }
  Resample(rng);
  return true;
}

void BeliefTracker::Resample(core::Rng& rng) {
  const std::size_t n = belief_.Size();
  if (n == 0U) {
    return;
  }

  const core::Vector weights = belief_.Weights();
  const core::ParticleMatrix& old_positions = belief_.Positions();
  core::ParticleMatrix resampled(old_positions.rows(), old_positions.cols());

  const double offset = rng.Uniform();
  double cumulative = weights[0];
  std::size_t source = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const double position = (static_cast<double>(i) + offset) / static_cast<double>(n);
    while (position > cumulative && source + 1U < n) {
      ++source;
      cumulative += weights[static_cast<Eigen::Index>(source)];
    }
    resampled.row(static_cast<Eigen::Index>(i)) =
        old_positions.row(static_cast<Eigen::Index>(source));
  }

  if (config_.jitter_std > 0.0) {
    // Row-major storage: jitter is drawn particle by particle.
    double* data = resampled.data();
    for (Eigen::Index k = 0; k < resampled.size(); ++k) {
      data[k] += config_.jitter_std * rng.Normal();
    }
  }

  belief_.MutablePositions() = std::move(resampled);
  belief_.ResetWeightsUniform();
}

bool BeliefTracker::Support(const semantics::Region& region, double& support,
                            double& counter_support, std::string& error) const {
  if (!region.Valid()) {
    error = "support needs a region predicate";
    return false;
  }
  if (belief_.Empty()) {
    error = "belief is not initialized";
    return false;
  }

  if (!credal_.Active()) {
    support = std::clamp(belief_.Probability(region), 0.0, 1.0);
    counter_support = 1.0 - support;
    return true;
  }

  semantics::Region complement;
  complement.name = "not(" + region.name + ")";
  complement.contains = [&region](const core::Vector& x) { return !region.contains(x); };
  const credal::CredalSet& set = credal_.Set();
  if (!set.UpperProbability(region, support, error) ||
      !set.UpperProbability(complement, counter_support, error)) {
    return false;
  }
  support = std::clamp(support, 0.0, 1.0);
  counter_support = std::clamp(counter_support, 0.0, 1.0);
  return true;
}

} // namespace rsa::belief
