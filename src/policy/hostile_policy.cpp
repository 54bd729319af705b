#include "policy/hostile_policy.hpp"

#include <cmath>
#include <utility>

namespace rsa::policy {

HostilePolicy::HostilePolicy(core::Vector target, const double gain, const double drift,
                             const double drift_rate)
    : target_(std::move(target)), gain_(gain), drift_(drift), drift_rate_(drift_rate) {}

core::Vector HostilePolicy::SelectAction(const controller::BeliefView& view) {
  const core::Vector& estimate = view.Estimate();
  core::Vector action = core::Vector::Zero(target_.size());
  if (estimate.size() != target_.size() || target_.size() != 2) {
    return action;
  }

  const core::Vector direction = target_ - estimate;
  const double distance = direction.norm();
  const double phase = drift_rate_ * static_cast<double>(calls_++);
  if (distance > 1e-9) {
    // Unit radial push plus a tangential component that flips side over time.
    const double tangent_x = -direction[1] / distance;
    const double tangent_y = direction[0] / distance;
    const double side = drift_ * std::sin(phase);
    action[0] = gain_ * (direction[0] / distance + side * tangent_x);
    action[1] = gain_ * (direction[1] / distance + side * tangent_y);
  } else {
    action[0] = gain_ * std::cos(phase);
    action[1] = gain_ * std::sin(phase);
  }
  return action;
}

} // namespace rsa::policy
