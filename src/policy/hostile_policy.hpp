#pragma once

#include "controller/interfaces.hpp"
#include "core/linalg.hpp"

#include <cstddef>

namespace rsa::policy {

// Adversarial nominal controller used to stress the safety filter: pushes
// straight at a target (normally the forbidden centre) with a tangential
// drift whose direction rotates slowly over calls.
class HostilePolicy final : public controller::IPolicy {
public:
  HostilePolicy(core::Vector target, double gain = 1.0, double drift = 0.3,
                double drift_rate = 0.2);

  core::Vector SelectAction(const controller::BeliefView& view) override;

  void Reset() {
    calls_ = 0;
  }

private:
  core::Vector target_;
  double gain_ = 1.0;
  double drift_ = 0.3;
  double drift_rate_ = 0.2;
  std::size_t calls_ = 0;
};

} // namespace rsa::policy
