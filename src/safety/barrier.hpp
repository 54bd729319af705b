#pragma once

#include "core/linalg.hpp"

#include <cstddef>

namespace rsa::safety {

// Control barrier function. The safe set is {x : Evaluate(x) <= 0}.
class IBarrierFunction {
public:
  virtual ~IBarrierFunction() = default;

  virtual double Evaluate(const core::Vector& x) const = 0;
  virtual core::Vector Gradient(const core::Vector& x) const = 0;
  virtual std::size_t Dimension() const = 0;
};

// Forbidden disc: B(x) = r^2 - |x - c|^2.
class CircularForbiddenRegion final : public IBarrierFunction {
public:
  CircularForbiddenRegion(core::Vector center, double radius);

  double Evaluate(const core::Vector& x) const override;
  core::Vector Gradient(const core::Vector& x) const override;
  std::size_t Dimension() const override {
    return core::Dim(center_);
  }

  const core::Vector& Center() const {
    return center_;
  }
  double Radius() const {
    return radius_;
  }

private:
  core::Vector center_;
  double radius_ = 0.0;
};

// Robustly tightened barrier B~(x) = B(x) + margin * |grad B(x)|.
//
// For a base barrier whose gradient norm is (locally) Lipschitz, B~(x_hat) <= 0
// keeps every state within `margin` of x_hat inside the base safe set. The
// gradient of the margin term is taken by central differences so any base
// barrier can be wrapped.
class TightenedBarrier final : public IBarrierFunction {
public:
  TightenedBarrier(const IBarrierFunction& base, double margin);

  double Evaluate(const core::Vector& x) const override;
  core::Vector Gradient(const core::Vector& x) const override;
  std::size_t Dimension() const override {
    return base_.Dimension();
  }

  double Margin() const {
    return margin_;
  }

private:
  const IBarrierFunction& base_;
  double margin_ = 0.0;
};

} // namespace rsa::safety
