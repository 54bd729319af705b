#pragma once

#include "belief/particle_belief.hpp"
#include "core/linalg.hpp"
#include "semantics/claim.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rsa::credal {

inline constexpr std::size_t kMaxMembers = 8;

// How member logits are spread over [-lambda, +lambda].
enum class PlacementPolicy {
  kEvenlySpaced,
  // lambda_k = -lambda * cos(pi * k / (K - 1)); denser near the extremes.
  kEndpointClustered,
};

const char* ToString(PlacementPolicy policy);
bool ParsePlacementPolicy(std::string_view raw, PlacementPolicy& policy, std::string& error);

// Member logits for a set of `members` slots. Both endpoints are always
// included; a single member uses logit 0.
std::vector<double> PlaceLogits(double lambda, std::size_t members, PlacementPolicy policy);

struct CredalConfig {
  std::size_t members = 5;
  PlacementPolicy placement = PlacementPolicy::kEvenlySpaced;
};

// Fixed-capacity ensemble of posteriors over one shared particle snapshot.
//
// The set owns its snapshot copy of the particle positions; each member slot
// owns its log-weights. Nothing aliases the live belief, so the base filter
// can resample freely while the set is active.
class CredalSet {
public:
  CredalSet() = default;

  // Contract:
  // - copies `base` positions, then member k applies +lambda_k inside
  //   `region` and -lambda_k outside on top of the base log-weights.
  // - returns false (set left empty) when `base` is empty, members is not in
  //   [1, kMaxMembers], lambda is not finite, or the region is missing.
  bool Build(const belief::ParticleBelief& base, const semantics::Region& region, double lambda,
             const CredalConfig& config, std::string& error);

  void Clear();

  std::size_t Size() const {
    return size_;
  }
  bool Empty() const {
    return size_ == 0U;
  }
  std::size_t Dimension() const {
    return dimension_;
  }
  std::size_t ParticleCount() const {
    return particle_count_;
  }

  double MemberLogit(std::size_t index) const {
    return member_logits_[index];
  }
  const core::Vector& MemberLogWeights(std::size_t index) const {
    return member_log_weights_[index];
  }
  const core::ParticleMatrix& SnapshotPositions() const {
    return snapshot_;
  }

  bool MemberExpectation(std::size_t index, const belief::StateFunction& f, double& value,
                         std::string& error) const;
  bool LowerExpectation(const belief::StateFunction& f, double& value, std::string& error) const;
  bool UpperExpectation(const belief::StateFunction& f, double& value, std::string& error) const;

  // Per-dimension minimum of member means.
  bool LowerMean(core::Vector& mean, std::string& error) const;
  // Per-dimension maximum of member variances.
  bool UpperVariance(core::Vector& variance, std::string& error) const;
  bool UpperProbability(const semantics::Region& region, double& probability,
                        std::string& error) const;

  // Conditions every member on an observation over the snapshot particles.
  // Returns false if any member degenerated (that member is reset to uniform).
  bool ApplyObservation(const core::Vector& observation, double sigma);

  // Moves the snapshot by a deterministic displacement.
  void Translate(const core::Vector& displacement);

private:
  bool RequireNonEmpty(std::string& error) const;

  std::size_t dimension_ = 0;
  std::size_t particle_count_ = 0;
  core::ParticleMatrix snapshot_;
  std::array<core::Vector, kMaxMembers> member_log_weights_;
  std::array<double, kMaxMembers> member_logits_{};
  std::size_t size_ = 0;
};

// Lifecycle owner of the single active credal set.
//
// A set is created by a contradictory claim, replaced when another
// contradictory claim arrives, and discarded when its originating claim is
// re-assessed as non-contradictory or the controller resets.
class CredalSetManager {
public:
  CredalSetManager() = default;
  explicit CredalSetManager(const CredalConfig& config) : config_(config) {}

  bool Expand(const belief::ParticleBelief& belief, const std::string& claim_id,
              const semantics::Region& region, double lambda, std::string& error);
  void Discard();

  bool Active() const {
    return !set_.Empty();
  }
  const std::string& OriginClaimId() const {
    return origin_claim_id_;
  }
  const CredalSet& Set() const {
    return set_;
  }
  CredalSet& MutableSet() {
    return set_;
  }
  const CredalConfig& Config() const {
    return config_;
  }

private:
  CredalConfig config_;
  CredalSet set_;
  std::string origin_claim_id_;
};

} // namespace rsa::credal
