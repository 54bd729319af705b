#pragma once

#include "controller/interfaces.hpp"
#include "core/linalg.hpp"

namespace rsa::policy {

// Proportional control toward a goal point from the belief estimate.
//
// Returns gain * (goal - estimate) / |goal - estimate|, or the zero vector
// once the estimate is within 1e-6 of the goal. The estimate is the credal
// lower mean while a credal set is active and the belief mean otherwise.
class GoalSeekingPolicy final : public controller::IPolicy {
public:
  explicit GoalSeekingPolicy(core::Vector goal, double gain = 1.0);

  core::Vector SelectAction(const controller::BeliefView& view) override;

  const core::Vector& Goal() const {
    return goal_;
  }

private:
  core::Vector goal_;
  double gain_ = 1.0;
};

} // namespace rsa::policy
