#include "belief/particle_belief.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace rsa::belief {

namespace {

constexpr double kEntropyWeightFloor = 1e-12;

} // namespace

bool NormalizeLogWeights(core::Vector& log_weights) {
  if (log_weights.size() == 0) {
    return true;
  }

  const double uniform = -std::log(static_cast<double>(log_weights.size()));
  if (log_weights.hasNaN()) {
    log_weights.setConstant(uniform);
    return false;
  }
  const double max_log = log_weights.maxCoeff();
  if (!std::isfinite(max_log)) {
    log_weights.setConstant(uniform);
    return false;
  }

  const double log_sum = max_log + std::log((log_weights.array() - max_log).exp().sum());
  if (!std::isfinite(log_sum)) {
    log_weights.setConstant(uniform);
    return false;
  }
  log_weights.array() -= log_sum;
  return true;
}

core::Vector NormalizedWeights(const core::Vector& log_weights) {
  const Eigen::Index n = log_weights.size();
  if (n == 0) {
    return core::Vector();
  }
  const auto is_nan = log_weights.array().isNaN();
  const double lowest = -std::numeric_limits<double>::infinity();
  const double max_log = is_nan.select(lowest, log_weights.array()).maxCoeff();
  if (!std::isfinite(max_log)) {
    return core::Vector::Constant(n, 1.0 / static_cast<double>(n));
  }

  core::Vector weights = is_nan.select(0.0, (log_weights.array() - max_log).exp()).matrix();
  weights /= weights.sum();
  return weights;
}

void AddGaussianLogLikelihood(const core::ParticleMatrix& positions,
                              const core::Vector& observation, const double sigma,
                              core::Vector& log_weights) {
  const double dimension = static_cast<double>(positions.cols());
  const double log_norm = -std::log(sigma) - 0.5 * std::log(2.0 * std::numbers::pi);
  const double inv_var = 1.0 / (sigma * sigma);
  const core::Vector squared_distance =
      (positions.rowwise() - observation.transpose()).rowwise().squaredNorm();
  log_weights.array() += dimension * log_norm - 0.5 * inv_var * squared_distance.array();
}

std::vector<std::size_t> SampleIndices(const core::Vector& weights, const std::size_t count,
                                       core::Rng& rng) {
  std::vector<std::size_t> indices;
  if (weights.size() == 0) {
    return indices;
  }
  std::vector<double> cdf(static_cast<std::size_t>(weights.size()), 0.0);
  double running = 0.0;
  for (Eigen::Index i = 0; i < weights.size(); ++i) {
    running += weights[i];
    cdf[static_cast<std::size_t>(i)] = running;
  }

  indices.reserve(count);
  for (std::size_t n = 0; n < count; ++n) {
    const double u = rng.Uniform() * running;
    auto it = std::upper_bound(cdf.begin(), cdf.end(), u);
    if (it == cdf.end()) {
      --it;
    }
    indices.push_back(static_cast<std::size_t>(it - cdf.begin()));
  }
  return indices;
}

bool ParticleBelief::Initialize(const core::Vector& mean, const core::Vector& std_dev,
                                const std::size_t count, core::Rng& rng, std::string& error) {
  if (count == 0U) {
    error = "particle count must be > 0";
    return false;
  }
  if (mean.size() == 0) {
    error = "belief mean must not be empty";
    return false;
  }
  if (std_dev.size() != mean.size()) {
    error = "belief std dimension " + std::to_string(std_dev.size()) +
            " does not match mean dimension " + std::to_string(mean.size());
    return false;
  }
  if (!mean.allFinite() || !std_dev.allFinite()) {
    error = "belief mean and std must be finite";
    return false;
  }
  if ((std_dev.array() < 0.0).any()) {
    error = "belief std must be non-negative";
    return false;
  }

  const auto rows = static_cast<Eigen::Index>(count);
  positions_.resize(rows, mean.size());
  // Row by row so the draw order is independent of the storage layout.
  for (Eigen::Index i = 0; i < rows; ++i) {
    for (Eigen::Index d = 0; d < mean.size(); ++d) {
      positions_(i, d) = mean[d] + std_dev[d] * rng.Normal();
    }
  }
  log_weights_.resize(rows);
  ResetWeightsUniform();
  return true;
}

core::Vector ParticleBelief::Particle(const std::size_t index) const {
  return positions_.row(static_cast<Eigen::Index>(index)).transpose();
}

void ParticleBelief::CopyParticle(const std::size_t index, core::Vector& out) const {
  out = positions_.row(static_cast<Eigen::Index>(index)).transpose();
}

void ParticleBelief::ResetWeightsUniform() {
  if (log_weights_.size() == 0) {
    return;
  }
  log_weights_.setConstant(-std::log(static_cast<double>(log_weights_.size())));
}

double ParticleBelief::Ess() const {
  const double sum_sq = Weights().squaredNorm();
  return sum_sq > 0.0 ? 1.0 / sum_sq : 0.0;
}

core::Vector ParticleBelief::Mean() const {
  if (Empty()) {
    return core::Vector::Zero(positions_.cols());
  }
  return positions_.transpose() * Weights();
}

core::Matrix ParticleBelief::Covariance() const {
  if (Empty()) {
    return core::Matrix::Zero(positions_.cols(), positions_.cols());
  }
  const core::Vector w = Weights();
  const core::Vector mean = positions_.transpose() * w;
  const core::ParticleMatrix centered = positions_.rowwise() - mean.transpose();
  return centered.transpose() * w.asDiagonal() * centered;
}

core::Vector ParticleBelief::StdDev() const {
  return Covariance().diagonal().cwiseMax(0.0).cwiseSqrt();
}

double ParticleBelief::Entropy() const {
  const Eigen::ArrayXd w = Weights().array();
  return (w > kEntropyWeightFloor).select(-w * w.log(), 0.0).sum();
}

double ParticleBelief::Expectation(const StateFunction& f) const {
  const core::Vector w = Weights();
  core::Vector x;
  double total = 0.0;
  for (Eigen::Index i = 0; i < positions_.rows(); ++i) {
    x = positions_.row(i).transpose();
    total += w[i] * f(x);
  }
  return total;
}

double ParticleBelief::Probability(const semantics::Region& region) const {
  return Expectation([&region](const core::Vector& x) { return region.contains(x) ? 1.0 : 0.0; });
}

} // namespace rsa::belief
