#pragma once

#include "belief/particle_belief.hpp"
#include "core/linalg.hpp"
#include "core/rng.hpp"
#include "credal/credal_set.hpp"
#include "semantics/claim.hpp"

#include <cstddef>
#include <string>

namespace rsa::belief {

struct BeliefConfig {
  std::size_t particles = 5000;
  // Resample when ESS < resample_fraction * N.
  double resample_fraction = 0.5;
  double jitter_std = 0.01;
};

// Outcome flags of one belief mutation.
struct UpdateReport {
  bool numeric_degeneracy = false;
  bool credal_created = false;
};

// Particle filter over the hidden state plus the credal set built from
// contradictory claims.
//
// Every mutating call validates its inputs first and leaves the belief
// untouched when it returns false. Observation and claim updates are additive
// in log space, so their order does not matter.
class BeliefTracker {
public:
  BeliefTracker() = default;
  BeliefTracker(const BeliefConfig& config, const credal::CredalConfig& credal_config);

  // Re-initializes the particles around `mean` and discards any credal set.
  bool Reset(const core::Vector& mean, const core::Vector& std_dev, core::Rng& rng,
             std::string& error);

  bool ValidateObservation(const core::Vector& observation, double noise_std,
                           std::string& error) const;

  // Gaussian likelihood update; also conditions the active credal members.
  bool UpdateObservation(const core::Vector& observation, double noise_std, UpdateReport& report,
                         std::string& error);

  // TRUE/FALSE tilt weights by +-log-odds inside/outside the region, UNKNOWN
  // is a no-op, CONTRADICTORY builds a credal set and leaves the base belief
  // unchanged.
  bool ApplyClaim(const semantics::Claim& claim, const semantics::SourceTrust& trust,
                  UpdateReport& report, std::string& error);

  // Single-integrator motion: each particle moves by `displacement` plus
  // N(0, process_noise_std^2) per coordinate. The credal snapshot receives
  // the displacement only.
  bool Predict(const core::Vector& displacement, double process_noise_std, core::Rng& rng,
               std::string& error);

  // Systematic resampling followed by Gaussian jitter when
  // ESS < resample_fraction * N. Returns whether it resampled.
  bool ResampleIfNeeded(core::Rng& rng);

  // Unconditional systematic resample (used by ResampleIfNeeded and tests).
  void Resample(core::Rng& rng);

  double Ess() const {
    return belief_.Ess();
  }
  core::Vector Mean() const {
    return belief_.Mean();
  }
  core::Matrix Covariance() const {
    return belief_.Covariance();
  }
  double Entropy() const {
    return belief_.Entropy();
  }

  // Support for `region`: (P(region), P(not region)). Uses upper probabilities
  // over the credal set when one is active.
  bool Support(const semantics::Region& region, double& support, double& counter_support,
               std::string& error) const;

  const ParticleBelief& Belief() const {
    return belief_;
  }
  ParticleBelief& MutableBelief() {
    return belief_;
  }
  const credal::CredalSetManager& Credal() const {
    return credal_;
  }
  credal::CredalSetManager& MutableCredal() {
    return credal_;
  }
  const BeliefConfig& Config() const {
    return config_;
  }

private:
  BeliefConfig config_;
  ParticleBelief belief_;
  credal::CredalSetManager credal_;
};

} // namespace rsa::belief
