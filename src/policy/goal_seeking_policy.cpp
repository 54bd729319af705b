#include "policy/goal_seeking_policy.hpp"

#include <utility>

namespace rsa::policy {

namespace {

constexpr double kArrivalTolerance = 1e-6;

} // namespace

GoalSeekingPolicy::GoalSeekingPolicy(core::Vector goal, const double gain)
    : goal_(std::move(goal)), gain_(gain) {}

core::Vector GoalSeekingPolicy::SelectAction(const controller::BeliefView& view) {
  const core::Vector& estimate = view.Estimate();
  if (estimate.size() != goal_.size()) {
    return core::Vector::Zero(goal_.size());
  }

  const core::Vector direction = goal_ - estimate;
  const double distance = direction.norm();
  if (distance < kArrivalTolerance) {
    return core::Vector::Zero(goal_.size());
  }
  return direction * (gain_ / distance);
}

} // namespace rsa::policy
