#pragma once

#include "belief/particle_belief.hpp"
#include "controller/step_diagnostics.hpp"
#include "core/linalg.hpp"
#include "credal/credal_set.hpp"

#include <cstddef>
#include <string>

namespace rsa::controller {

// What a policy may look at when choosing a nominal action.
struct BeliefView {
  const belief::ParticleBelief* belief = nullptr;
  // Null unless a credal set is active.
  const credal::CredalSet* credal = nullptr;
  core::Vector mean;
  core::Vector std_dev;
  core::Vector credal_lower_mean;

  // Credal lower mean when a credal set is active, belief mean otherwise.
  const core::Vector& Estimate() const {
    return credal_lower_mean.size() == 0 ? mean : credal_lower_mean;
  }
};

class IPolicy {
public:
  virtual ~IPolicy() = default;

  virtual core::Vector SelectAction(const BeliefView& view) = 0;
};

// Source of extra low-noise observations for the query action.
class IObservationOracle {
public:
  virtual ~IObservationOracle() = default;

  virtual bool RequestObservation(double noise_std, core::Vector& observation,
                                  std::string& error) = 0;
};

class IDiagnosticsRecorder {
public:
  virtual ~IDiagnosticsRecorder() = default;

  // Called by drivers before the first step of each episode.
  virtual void BeginEpisode(std::size_t episode) {
    static_cast<void>(episode);
  }

  virtual bool Record(const StepDiagnostics& diagnostics, std::string& error) = 0;
};

} // namespace rsa::controller
