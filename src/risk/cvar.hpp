#pragma once

#include "core/linalg.hpp"

#include <string>
#include <vector>

namespace rsa::risk {

// Lower-tail conditional value at risk of equally weighted samples: the mean
// of the worst max(1, ceil(alpha * n)) values. Higher values are better.
//
// Contract:
// - alpha must lie in (0, 1]; values must be non-empty and finite.
// - monotone non-decreasing in alpha; Cvar(v, 1) is the sample mean.
bool Cvar(const std::vector<double>& values, double alpha, double& result, std::string& error);

// Particle-weighted CVaR. Values are sorted ascending and the tail is the
// prefix whose cumulative normalized weight stays <= alpha (at least one
// element); the result is the weight-average of that prefix.
bool CvarWeighted(const core::Vector& log_weights, const std::vector<double>& values,
                  double alpha, double& result, std::string& error);

} // namespace rsa::risk
