#include "risk/cvar.hpp"

#include "belief/particle_belief.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rsa::risk {

namespace {

constexpr double kTailWeightFloor = 1e-12;

bool ValidateInputs(const std::vector<double>& values, const double alpha, std::string& error) {
  if (values.empty()) {
    error = "cvar requires at least one value";
    return false;
  }
  if (!std::isfinite(alpha) || alpha <= 0.0 || alpha > 1.0) {
    error = "cvar alpha must lie in (0, 1]";
    return false;
  }
  for (const double v : values) {
    if (!std::isfinite(v)) {
      error = "cvar values must be finite";
      return false;
    }
  }
  return true;
}

} // namespace

bool Cvar(const std::vector<double>& values, const double alpha, double& result,
          std::string& error) {
  if (!ValidateInputs(values, alpha, error)) {
    return false;
  }

  std::vector<double> sorted(values);
  std::sort(sorted.begin(), sorted.end());
  const auto cutoff = std::max<std::size_t>(
      1U, static_cast<std::size_t>(std::ceil(alpha * static_cast<double>(sorted.size()))));
  const std::size_t tail = std::min(cutoff, sorted.size());

  double sum = 0.0;
  for (std::size_t i = 0; i < tail; ++i) {
    sum += sorted[i];
  }
  result = sum / static_cast<double>(tail);
  return true;
}

bool CvarWeighted(const core::Vector& log_weights, const std::vector<double>& values,
                  const double alpha, double& result, std::string& error) {
  if (!ValidateInputs(values, alpha, error)) {
    return false;
  }
  if (core::Dim(log_weights) != values.size()) {
    error = "cvar weights and values must have the same length";
    return false;
  }

  const core::Vector weights = belief::NormalizedWeights(log_weights);
  std::vector<std::size_t> order(values.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(),
                   [&values](std::size_t a, std::size_t b) { return values[a] < values[b]; });

  std::size_t cutoff = 0;
  double cumulative = 0.0;
  for (const std::size_t index : order) {
    cumulative += weights[static_cast<Eigen::Index>(index)];
    if (cumulative > alpha) {
      break;
    }
    ++cutoff;
  }
  cutoff = std::max<std::size_t>(cutoff, 1U);

  double weight_sum = 0.0;
  double weighted = 0.0;
  for (std::size_t i = 0; i < cutoff; ++i) {
    const double w = weights[static_cast<Eigen::Index>(order[i])];
    weight_sum += w;
    weighted += w * values[order[i]];
  }
  result = weight_sum > kTailWeightFloor ? weighted / weight_sum : values[order[0]];
  return true;
}

} // namespace rsa::risk
