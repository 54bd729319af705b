#include "safety/barrier.hpp"

#include <utility>

namespace rsa::safety {

namespace {

constexpr double kDifferenceStep = 1e-6;

} // namespace

CircularForbiddenRegion::CircularForbiddenRegion(core::Vector center, const double radius)
    : center_(std::move(center)), radius_(radius) {}

double CircularForbiddenRegion::Evaluate(const core::Vector& x) const {
  return radius_ * radius_ - (x - center_).squaredNorm();
}

core::Vector CircularForbiddenRegion::Gradient(const core::Vector& x) const {
  return -2.0 * (x - center_);
}

TightenedBarrier::TightenedBarrier(const IBarrierFunction& base, const double margin)
    : base_(base), margin_(margin) {}

double TightenedBarrier::Evaluate(const core::Vector& x) const {
  return base_.Evaluate(x) + margin_ * base_.Gradient(x).norm();
}

core::Vector TightenedBarrier::Gradient(const core::Vector& x) const {
  core::Vector gradient = base_.Gradient(x);
  if (margin_ == 0.0) {
    return gradient;
  }

  core::Vector shifted = x;
  for (Eigen::Index d = 0; d < x.size(); ++d) {
    shifted[d] = x[d] + kDifferenceStep;
    const double upper = base_.Gradient(shifted).norm();
    shifted[d] = x[d] - kDifferenceStep;
    const double lower = base_.Gradient(shifted).norm();
    shifted[d] = x[d];
    gradient[d] += margin_ * (upper - lower) / (2.0 * kDifferenceStep);
  }
  return gradient;
}

} // namespace rsa::safety
