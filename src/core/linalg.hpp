#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <initializer_list>
#include <vector>

namespace rsa::core {

// States, observations and actions.
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
// N x D particle cloud, one particle per row.
using ParticleMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

inline Vector MakeVector(std::initializer_list<double> values) {
  Vector out(static_cast<Eigen::Index>(values.size()));
  Eigen::Index i = 0;
  for (const double v : values) {
    out[i++] = v;
  }
  return out;
}

inline Vector ToVector(const std::vector<double>& values) {
  return Eigen::Map<const Vector>(values.data(), static_cast<Eigen::Index>(values.size()));
}

inline std::size_t Dim(const Vector& v) {
  return static_cast<std::size_t>(v.size());
}

// Euclidean projection onto the origin-centred ball of radius `radius`.
inline Vector ProjectOntoBall(const Vector& a, const double radius) {
  const double norm = a.norm();
  if (norm <= radius || norm == 0.0) {
    return a;
  }
  return a * (radius / norm);
}

} // namespace rsa::core

