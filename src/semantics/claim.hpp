#pragma once

#include "core/linalg.hpp"
#include "semantics/belnap.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace rsa::semantics {

// Indicator of a claim region over state vectors.
struct Region {
  std::string name;
  std::function<bool(const core::Vector&)> contains;

  bool Valid() const {
    return static_cast<bool>(contains);
  }
};

// Half-space {x : x[axis] > threshold} (or <= threshold when `above` is false).
Region MakeHalfSpaceRegion(std::size_t axis, double threshold, bool above = true);

// Closed ball {x : |x - center| <= radius}.
Region MakeBallRegion(core::Vector center, double radius);

// An exogenous statement from a named source about where the state lies.
struct Claim {
  std::string id;
  std::string source_id;
  BelnapValue value = BelnapValue::kUnknown;
  Region region;
};

// Rejects claims the controller cannot apply: empty id/source or a missing
// region predicate.
bool ValidateClaim(const Claim& claim, std::string& error);

struct TrustPrior {
  double alpha = 7.0;
  double beta = 3.0;
  // 1.0 disables forgetting.
  double forgetting = 1.0;
};

// Beta(alpha, beta) reliability of one source.
//
// Update(): both pseudo-counts decay toward the prior by `forgetting`, then
// the outcome weight is added to alpha (success) or beta (failure).
class SourceTrust {
public:
  SourceTrust() = default;
  explicit SourceTrust(const TrustPrior& prior);

  double Alpha() const {
    return alpha_;
  }
  double Beta() const {
    return beta_;
  }

  double Reliability() const;

  // log(r / (1 - r)) with r clipped to [1e-6, 1 - 1e-6].
  double LogOdds() const;

  void Update(bool success, double weight = 1.0);

private:
  TrustPrior prior_;
  double alpha_ = 7.0;
  double beta_ = 3.0;
};

// Per-source trust keyed by source id. Survives controller resets.
class TrustRegistry {
public:
  TrustRegistry() = default;
  explicit TrustRegistry(const TrustPrior& prior) : prior_(prior) {}

  // Lazily creates unknown sources with the configured prior.
  SourceTrust& Get(const std::string& source_id);

  const SourceTrust* Find(const std::string& source_id) const;

  std::size_t Size() const {
    return sources_.size();
  }

  const std::map<std::string, SourceTrust>& Sources() const {
    return sources_;
  }

private:
  TrustPrior prior_;
  std::map<std::string, SourceTrust> sources_;
};

} // namespace rsa::semantics
