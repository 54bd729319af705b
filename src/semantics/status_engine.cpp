#include "semantics/status_engine.hpp"

#include <cmath>
#include <limits>

namespace rsa::semantics {

namespace {

constexpr std::size_t kGridPoints = 20;
constexpr double kAcceptGridMin = 0.55;
constexpr double kAcceptGridMax = 0.95;
constexpr double kRejectGridMin = 0.05;
constexpr double kRejectGridMax = 0.45;
constexpr double kCostWeight = 0.1;

double GridPoint(const double lo, const double hi, const std::size_t i) {
  return lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(kGridPoints - 1U);
}

bool InUnitInterval(const double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

bool ValidateThresholds(const StatusThresholds& thresholds, std::string& error) {
  if (!InUnitInterval(thresholds.accept) || !InUnitInterval(thresholds.reject)) {
    error = "status thresholds must lie in [0, 1]";
    return false;
  }
  if (thresholds.accept <= 0.5) {
    error = "accept threshold must be > 0.5";
    return false;
  }
  if (thresholds.reject >= 0.5) {
    error = "reject threshold must be < 0.5";
    return false;
  }
  return true;
}

bool AssignStatus(const double support, const double counter_support,
                  const StatusThresholds& thresholds, BelnapValue& status, std::string& error) {
  if (!ValidateThresholds(thresholds, error)) {
    return false;
  }
  if (!InUnitInterval(support) || !InUnitInterval(counter_support)) {
    error = "support values must lie in [0, 1]";
    return false;
  }

  const bool strong_for = support >= thresholds.accept;
  const bool strong_against = counter_support >= thresholds.accept;
  if (strong_for && counter_support < thresholds.reject) {
    status = BelnapValue::kTrue;
  } else if (strong_against && support < thresholds.reject) {
    status = BelnapValue::kFalse;
  } else if (strong_for && strong_against) {
    status = BelnapValue::kContradictory;
  } else {
    status = BelnapValue::kUnknown;
  }
  return true;
}

double StatusProbability(const BelnapValue status) {
  switch (status) {
  case BelnapValue::kTrue:
    return 0.9;
  case BelnapValue::kFalse:
    return 0.1;
  case BelnapValue::kUnknown:
  case BelnapValue::kContradictory:
    return 0.5;
  }
  return 0.5;
}

double ComputeEce(const std::vector<double>& predictions, const std::vector<bool>& outcomes,
                  const std::size_t bins) {
  const std::size_t n = predictions.size() < outcomes.size() ? predictions.size() : outcomes.size();
  if (n == 0U || bins == 0U) {
    return 0.0;
  }

  std::vector<double> confidence_sum(bins, 0.0);
  std::vector<double> positive_count(bins, 0.0);
  std::vector<std::size_t> bin_count(bins, 0U);
  for (std::size_t i = 0; i < n; ++i) {
    const double p = predictions[i];
    double scaled = std::floor(p * static_cast<double>(bins));
    if (scaled < 0.0) {
      scaled = 0.0;
    }
    std::size_t bin = static_cast<std::size_t>(scaled);
    if (bin >= bins) {
      bin = bins - 1U;
    }
    confidence_sum[bin] += p;
    positive_count[bin] += outcomes[i] ? 1.0 : 0.0;
    ++bin_count[bin];
  }

  double ece = 0.0;
  for (std::size_t b = 0; b < bins; ++b) {
    if (bin_count[b] == 0U) {
      continue;
    }
    const double count = static_cast<double>(bin_count[b]);
    const double accuracy = positive_count[b] / count;
    const double confidence = confidence_sum[b] / count;
    ece += (count / static_cast<double>(n)) * std::abs(accuracy - confidence);
  }
  return ece;
}

double ComputeBrier(const std::vector<double>& predictions, const std::vector<bool>& outcomes) {
  const std::size_t n = predictions.size() < outcomes.size() ? predictions.size() : outcomes.size();
  if (n == 0U) {
    return 0.0;
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double diff = predictions[i] - (outcomes[i] ? 1.0 : 0.0);
    sum += diff * diff;
  }
  return sum / static_cast<double>(n);
}

StatusEngine::StatusEngine(StatusThresholds thresholds, CalibrationCosts costs,
                           const std::size_t min_calibration_samples)
    : thresholds_(thresholds), costs_(costs), min_calibration_samples_(min_calibration_samples) {}

bool StatusEngine::SetThresholds(const StatusThresholds& thresholds, std::string& error) {
  if (!ValidateThresholds(thresholds, error)) {
    return false;
  }
  thresholds_ = thresholds;
  return true;
}

bool StatusEngine::Assess(const double support, const double counter_support, BelnapValue& status,
                          std::string& error) const {
  return AssignStatus(support, counter_support, thresholds_, status, error);
}

void StatusEngine::AddSample(const CalibrationSample& sample) {
  samples_.push_back(sample);
}

double StatusEngine::EceFor(const StatusThresholds& thresholds) const {
  std::vector<double> predictions;
  std::vector<bool> outcomes;
  predictions.reserve(samples_.size());
  outcomes.reserve(samples_.size());
  std::string ignored;
  for (const CalibrationSample& sample : samples_) {
    BelnapValue status = BelnapValue::kUnknown;
    if (!AssignStatus(sample.support, sample.counter_support, thresholds, status, ignored)) {
      continue;
    }
    predictions.push_back(StatusProbability(status));
    outcomes.push_back(sample.outcome);
  }
  return ComputeEce(predictions, outcomes);
}

bool StatusEngine::Recalibrate(RecalibrationResult& result, std::string& error) {
  if (samples_.size() < min_calibration_samples_) {
    error = "need at least " + std::to_string(min_calibration_samples_) +
            " calibration samples, have " + std::to_string(samples_.size());
    return false;
  }

  result = RecalibrationResult{};
  result.samples = samples_.size();
  result.ece_before = EceFor(thresholds_);

  const double n = static_cast<double>(samples_.size());
  double best_objective = std::numeric_limits<double>::infinity();
  StatusThresholds best = thresholds_;
  double best_ece = result.ece_before;

  for (std::size_t i = 0; i < kGridPoints; ++i) {
    for (std::size_t j = 0; j < kGridPoints; ++j) {
      const StatusThresholds candidate{.accept = GridPoint(kAcceptGridMin, kAcceptGridMax, i),
                                       .reject = GridPoint(kRejectGridMin, kRejectGridMax, j)};

      std::vector<double> predictions;
      std::vector<bool> outcomes;
      predictions.reserve(samples_.size());
      outcomes.reserve(samples_.size());
      double false_positives = 0.0;
      double false_negatives = 0.0;
      for (const CalibrationSample& sample : samples_) {
        BelnapValue status = BelnapValue::kUnknown;
        std::string ignored;
        if (!AssignStatus(sample.support, sample.counter_support, candidate, status, ignored)) {
          continue;
        }
        const double p = StatusProbability(status);
        predictions.push_back(p);
        outcomes.push_back(sample.outcome);
        const bool predicted_true = p > 0.5;
        if (predicted_true && !sample.outcome) {
          false_positives += 1.0;
        } else if (!predicted_true && sample.outcome) {
          false_negatives += 1.0;
        }
      }

      const double ece = ComputeEce(predictions, outcomes);
      const double cost =
          costs_.false_positive * false_positives + costs_.false_negative * false_negatives;
      const double objective = ece + kCostWeight * cost / n;
      if (objective < best_objective) {
        best_objective = objective;
        best = candidate;
        best_ece = ece;
      }
    }
  }

  thresholds_ = best;
  result.thresholds = best;
  result.ece_after = best_ece;
  result.objective = best_objective;
  return true;
}

} // namespace rsa::semantics
