#pragma once

#include "semantics/belnap.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rsa::semantics {

// Status thresholds: `accept` (tau) must be > 0.5 and `reject` (tau') < 0.5.
struct StatusThresholds {
  double accept = 0.68;
  double reject = 0.32;
};

bool ValidateThresholds(const StatusThresholds& thresholds, std::string& error);

// Maps (support, counter-support) to a Belnap status.
//
// Contract:
// - support >= accept and counter < reject      => kTrue
// - counter >= accept and support < reject      => kFalse
// - support >= accept and counter >= accept     => kContradictory
// - otherwise                                   => kUnknown
// - returns false (status untouched) when thresholds are invalid or the
//   supports are outside [0, 1].
bool AssignStatus(double support, double counter_support, const StatusThresholds& thresholds,
                  BelnapValue& status, std::string& error);

// One labelled observation of a claim: the supports seen when the claim was
// assessed, and whether it later turned out true.
struct CalibrationSample {
  double support = 0.0;
  double counter_support = 0.0;
  bool outcome = false;
};

// Probability a status is taken to assert for calibration purposes.
double StatusProbability(BelnapValue status);

// Expected calibration error over `bins` equal-width bins of [0, 1].
// Returns 0 for empty input.
double ComputeEce(const std::vector<double>& predictions, const std::vector<bool>& outcomes,
                  std::size_t bins = 10U);

double ComputeBrier(const std::vector<double>& predictions, const std::vector<bool>& outcomes);

struct CalibrationCosts {
  double false_positive = 1.0;
  double false_negative = 1.0;
};

struct RecalibrationResult {
  StatusThresholds thresholds;
  double ece_before = 0.0;
  double ece_after = 0.0;
  double objective = 0.0;
  std::size_t samples = 0;
};

// Holds the active thresholds and the labelled samples used to retune them.
//
// Recalibrate() grid-searches tau in [0.55, 0.95] x tau' in [0.05, 0.45]
// (20 x 20 points) and keeps the pair minimising
// ECE(10 bins) + 0.1 * (c_fp * FP + c_fn * FN) / n.
class StatusEngine {
public:
  StatusEngine() = default;
  StatusEngine(StatusThresholds thresholds, CalibrationCosts costs,
               std::size_t min_calibration_samples);

  const StatusThresholds& Thresholds() const {
    return thresholds_;
  }

  bool SetThresholds(const StatusThresholds& thresholds, std::string& error);

  bool Assess(double support, double counter_support, BelnapValue& status,
              std::string& error) const;

  void AddSample(const CalibrationSample& sample);
  std::size_t SampleCount() const {
    return samples_.size();
  }
  void ClearSamples() {
    samples_.clear();
  }

  // Returns false without touching thresholds when fewer than
  // `min_calibration_samples` samples have been collected.
  bool Recalibrate(RecalibrationResult& result, std::string& error);

private:
  double EceFor(const StatusThresholds& thresholds) const;

  StatusThresholds thresholds_;
  CalibrationCosts costs_;
  std::size_t min_calibration_samples_ = 20;
  std::vector<CalibrationSample> samples_;
};

} // namespace rsa::semantics
