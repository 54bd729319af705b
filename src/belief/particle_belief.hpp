#pragma once

#include "core/linalg.hpp"
#include "core/rng.hpp"
#include "semantics/claim.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace rsa::belief {

// Scalar function of a state vector (value functions, indicators, ...).
using StateFunction = std::function<double(const core::Vector&)>;

// Shifts `log_weights` so they log-sum to zero.
//
// Contract:
// - returns true when at least one log-weight was finite and the result is a
//   proper distribution.
// - returns false on degeneracy (no finite maximum); weights are then reset
//   to uniform so callers can keep running.
bool NormalizeLogWeights(core::Vector& log_weights);

// exp() of normalized log-weights. Input need not be normalized; NaN entries
// get zero weight.
core::Vector NormalizedWeights(const core::Vector& log_weights);

// Adds sum_d log N(obs_d; x_d, sigma^2) to the log-weight of every row of
// `positions`.
void AddGaussianLogLikelihood(const core::ParticleMatrix& positions,
                              const core::Vector& observation, double sigma,
                              core::Vector& log_weights);

// Draws `count` indices with probability proportional to `weights` (inverse
// CDF, with replacement). `weights` must be normalized.
std::vector<std::size_t> SampleIndices(const core::Vector& weights, std::size_t count,
                                       core::Rng& rng);

// Weighted sample of N particles with fixed state dimension D.
//
// Positions are an N x D row-major matrix; the log-weights are kept
// normalized after every mutation made through the tracker.
class ParticleBelief {
public:
  ParticleBelief() = default;

  // Draws `count` particles from N(mean, diag(std_dev^2)) with uniform weights.
  bool Initialize(const core::Vector& mean, const core::Vector& std_dev, std::size_t count,
                  core::Rng& rng, std::string& error);

  std::size_t Size() const {
    return static_cast<std::size_t>(log_weights_.size());
  }
  std::size_t Dimension() const {
    return static_cast<std::size_t>(positions_.cols());
  }
  bool Empty() const {
    return log_weights_.size() == 0;
  }

  core::Vector Particle(std::size_t index) const;
  void CopyParticle(std::size_t index, core::Vector& out) const;

  const core::ParticleMatrix& Positions() const {
    return positions_;
  }
  core::ParticleMatrix& MutablePositions() {
    return positions_;
  }
  const core::Vector& LogWeights() const {
    return log_weights_;
  }
  core::Vector& MutableLogWeights() {
    return log_weights_;
  }

  core::Vector Weights() const {
    return NormalizedWeights(log_weights_);
  }

  // See NormalizeLogWeights().
  bool Normalize() {
    return NormalizeLogWeights(log_weights_);
  }

  void ResetWeightsUniform();

  // 1 / sum(w^2), in [1, N].
  double Ess() const;
  core::Vector Mean() const;
  // D x D weighted covariance.
  core::Matrix Covariance() const;
  // Per-dimension standard deviation (sqrt of the covariance diagonal).
  core::Vector StdDev() const;
  // Shannon entropy of the weights in nats; weights <= 1e-12 are ignored.
  double Entropy() const;

  double Expectation(const StateFunction& f) const;
  double Probability(const semantics::Region& region) const;

private:
  core::ParticleMatrix positions_;
  core::Vector log_weights_;
};

} // namespace rsa::belief

