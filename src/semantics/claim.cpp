#include "semantics/claim.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rsa::semantics {

namespace {

constexpr double kReliabilityClip = 1e-6;

} // namespace

Region MakeHalfSpaceRegion(const std::size_t axis, const double threshold, const bool above) {
  Region region;
  region.name = "x[" + std::to_string(axis) + (above ? "] > " : "] <= ") + std::to_string(threshold);
  region.contains = [axis, threshold, above](const core::Vector& x) {
    if (axis >= core::Dim(x)) {
      return false;
    }
    const double value = x[static_cast<Eigen::Index>(axis)];
    return above ? value > threshold : value <= threshold;
  };
  return region;
}

Region MakeBallRegion(core::Vector center, const double radius) {
  Region region;
  region.name = "ball(r=" + std::to_string(radius) + ")";
  region.contains = [center = std::move(center), radius](const core::Vector& x) {
    if (x.size() != center.size()) {
      return false;
    }
    return (x - center).norm() <= radius;
  };
  return region;
}

bool ValidateClaim(const Claim& claim, std::string& error) {
  if (claim.id.empty()) {
    error = "claim id must not be empty";
    return false;
  }
  if (claim.source_id.empty()) {
    error = "claim '" + claim.id + "' has an empty source id";
    return false;
  }
  if (!claim.region.Valid()) {
    error = "claim '" + claim.id + "' has no region predicate";
    return false;
  }
  return true;
}

SourceTrust::SourceTrust(const TrustPrior& prior)
    : prior_(prior), alpha_(prior.alpha), beta_(prior.beta) {}

double SourceTrust::Reliability() const {
  return alpha_ / (alpha_ + beta_);
}

double SourceTrust::LogOdds() const {
  const double r = std::clamp(Reliability(), kReliabilityClip, 1.0 - kReliabilityClip);
  return std::log(r / (1.0 - r));
}

void SourceTrust::Update(const bool success, const double weight) {
  const double gamma = prior_.forgetting;
  alpha_ = prior_.alpha + gamma * (alpha_ - prior_.alpha);
  beta_ = prior_.beta + gamma * (beta_ - prior_.beta);
  if (success) {
    alpha_ += weight;
  } else {
    beta_ += weight;
  }
}

SourceTrust& TrustRegistry::Get(const std::string& source_id) {
  auto it = sources_.find(source_id);
  if (it == sources_.end()) {
    it = sources_.emplace(source_id, SourceTrust(prior_)).first;
  }
  return it->second;
}

const SourceTrust* TrustRegistry::Find(const std::string& source_id) const {
  const auto it = sources_.find(source_id);
  return it == sources_.end() ? nullptr : &it->second;
}

} // namespace rsa::semantics
