#include "credal/credal_set.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace rsa::credal {

const char* ToString(const PlacementPolicy policy) {
  switch (policy) {
  case PlacementPolicy::kEvenlySpaced:
    return "evenly_spaced";
  case PlacementPolicy::kEndpointClustered:
    return "endpoint_clustered";
  }
  return "evenly_spaced";
}

bool ParsePlacementPolicy(std::string_view raw, PlacementPolicy& policy, std::string& error) {
  if (raw == "evenly_spaced") {
    policy = PlacementPolicy::kEvenlySpaced;
    return true;
  }
  if (raw == "endpoint_clustered") {
    policy = PlacementPolicy::kEndpointClustered;
    return true;
  }
  error = "invalid credal placement '" + std::string(raw) +
          "' (expected evenly_spaced|endpoint_clustered)";
  return false;
}

std::vector<double> PlaceLogits(const double lambda, const std::size_t members,
                                const PlacementPolicy policy) {
  std::vector<double> logits;
  if (members == 0U) {
    return logits;
  }
  if (members == 1U) {
    logits.push_back(0.0);
    return logits;
  }

  logits.reserve(members);
  const double last = static_cast<double>(members - 1U);
  for (std::size_t k = 0; k < members; ++k) {
    const double t = static_cast<double>(k) / last;
    if (policy == PlacementPolicy::kEndpointClustered) {
      logits.push_back(-lambda * std::cos(std::numbers::pi * t));
    } else {
      logits.push_back(-lambda + 2.0 * lambda * t);
    }
  }
  // Pin the endpoints exactly; cos(pi) is not exactly -1 in floating point.
  logits.front() = -lambda;
  logits.back() = lambda;
  return logits;
}

bool CredalSet::Build(const belief::ParticleBelief& base, const semantics::Region& region,
                      const double lambda, const CredalConfig& config, std::string& error) {
  Clear();
  if (base.Empty()) {
    error = "cannot build credal set from an empty belief";
    return false;
  }
  if (config.members == 0U || config.members > kMaxMembers) {
    error = "credal member count must be in [1, " + std::to_string(kMaxMembers) + "]";
    return false;
  }
  if (!std::isfinite(lambda)) {
    error = "credal logit bound must be finite";
    return false;
  }
  if (!region.Valid()) {
    error = "credal set needs a region predicate";
    return false;
  }

  dimension_ = base.Dimension();
  particle_count_ = base.Size();
  snapshot_ = base.Positions();

  // +1 inside the region, -1 outside.
  core::Vector sign(static_cast<Eigen::Index>(particle_count_));
  core::Vector x;
  for (std::size_t i = 0; i < particle_count_; ++i) {
    base.CopyParticle(i, x);
    sign[static_cast<Eigen::Index>(i)] = region.contains(x) ? 1.0 : -1.0;
  }

  const std::vector<double> logits = PlaceLogits(std::abs(lambda), config.members, config.placement);
  for (std::size_t k = 0; k < logits.size(); ++k) {
    core::Vector& lw = member_log_weights_[k];
    lw = base.LogWeights() + logits[k] * sign;
    if (!belief::NormalizeLogWeights(lw)) {
      Clear();
      error = "credal member " + std::to_string(k) + " degenerated while tilting";
      return false;
    }
    member_logits_[k] = logits[k];
  }
  size_ = logits.size();
  return true;
}

void CredalSet::Clear() {
  for (core::Vector& member : member_log_weights_) {
    member.resize(0);
  }
  snapshot_.resize(0, 0);
  member_logits_.fill(0.0);
  size_ = 0;
  dimension_ = 0;
  particle_count_ = 0;
}

bool CredalSet::RequireNonEmpty(std::string& error) const {
  if (size_ == 0U) {
    error = "credal set is empty";
    return false;
  }
  return true;
}

bool CredalSet::MemberExpectation(const std::size_t index, const belief::StateFunction& f,
                                  double& value, std::string& error) const {
  if (!RequireNonEmpty(error)) {
    return false;
  }
  if (index >= size_) {
    error = "credal member index " + std::to_string(index) + " out of range";
    return false;
  }

  const core::Vector w = belief::NormalizedWeights(member_log_weights_[index]);
  core::Vector x;
  double total = 0.0;
  for (Eigen::Index i = 0; i < snapshot_.rows(); ++i) {
    x = snapshot_.row(i).transpose();
    total += w[i] * f(x);
  }
  value = total;
  return true;
}

bool CredalSet::LowerExpectation(const belief::StateFunction& f, double& value,
                                 std::string& error) const {
  if (!RequireNonEmpty(error)) {
    return false;
  }
  double lowest = std::numeric_limits<double>::infinity();
  for (std::size_t k = 0; k < size_; ++k) {
    double member = 0.0;
    if (!MemberExpectation(k, f, member, error)) {
      return false;
    }
    lowest = std::min(lowest, member);
  }
  value = lowest;
  return true;
}

bool CredalSet::UpperExpectation(const belief::StateFunction& f, double& value,
                                 std::string& error) const {
  if (!RequireNonEmpty(error)) {
    return false;
  }
  double highest = -std::numeric_limits<double>::infinity();
  for (std::size_t k = 0; k < size_; ++k) {
    double member = 0.0;
    if (!MemberExpectation(k, f, member, error)) {
      return false;
    }
    highest = std::max(highest, member);
  }
  value = highest;
  return true;
}

bool CredalSet::LowerMean(core::Vector& mean, std::string& error) const {
  if (!RequireNonEmpty(error)) {
    return false;
  }
  mean.setZero(static_cast<Eigen::Index>(dimension_));
  for (Eigen::Index d = 0; d < mean.size(); ++d) {
    if (!LowerExpectation([d](const core::Vector& x) { return x[d]; }, mean[d], error)) {
      return false;
    }
  }
  return true;
}

bool CredalSet::UpperVariance(core::Vector& variance, std::string& error) const {
  if (!RequireNonEmpty(error)) {
    return false;
  }
  variance.setZero(static_cast<Eigen::Index>(dimension_));
  for (std::size_t k = 0; k < size_; ++k) {
    const core::Vector w = belief::NormalizedWeights(member_log_weights_[k]);
    const core::Vector mean = snapshot_.transpose() * w;
    const core::Vector var =
        (snapshot_.rowwise() - mean.transpose()).array().square().matrix().transpose() * w;
    variance = variance.cwiseMax(var);
  }
  return true;
}

bool CredalSet::UpperProbability(const semantics::Region& region, double& probability,
                                 std::string& error) const {
  if (!region.Valid()) {
    error = "upper probability needs a region predicate";
    return false;
  }
  return UpperExpectation(
      [&region](const core::Vector& x) { return region.contains(x) ? 1.0 : 0.0; }, probability,
      error);
}

bool CredalSet::ApplyObservation(const core::Vector& observation, const double sigma) {
  bool all_finite = true;
  for (std::size_t k = 0; k < size_; ++k) {
    belief::AddGaussianLogLikelihood(snapshot_, observation, sigma, member_log_weights_[k]);
    if (!belief::NormalizeLogWeights(member_log_weights_[k])) {
      all_finite = false;
    }
  }
  return all_finite;
}

void CredalSet::Translate(const core::Vector& displacement) {
  if (core::Dim(displacement) != dimension_ || snapshot_.rows() == 0) {
    return;
  }
  snapshot_.rowwise() += displacement.transpose();
}

bool CredalSetManager::Expand(const belief::ParticleBelief& belief, const std::string& claim_id,
                              const semantics::Region& region, const double lambda,
                              std::string& error) {
  if (!set_.Build(belief, region, lambda, config_, error)) {
    origin_claim_id_.clear();
    return false;
  }
  origin_claim_id_ = claim_id;
  return true;
}

void CredalSetManager::Discard() {
  set_.Clear();
  origin_claim_id_.clear();
}

} // namespace rsa::credal
