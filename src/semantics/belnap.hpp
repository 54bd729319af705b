#pragma once

#include <array>
#include <string>
#include <string_view>

namespace rsa::semantics {

// Four-valued Belnap status of a claim.
//
// Each value is the pair (truth support, falsity support):
// - kUnknown        = (no, no)
// - kTrue           = (yes, no)
// - kFalse          = (no, yes)
// - kContradictory  = (yes, yes)
enum class BelnapValue {
  kUnknown,
  kTrue,
  kFalse,
  kContradictory,
};

inline constexpr std::array<BelnapValue, 4> kAllBelnapValues = {
    BelnapValue::kUnknown,
    BelnapValue::kTrue,
    BelnapValue::kFalse,
    BelnapValue::kContradictory,
};

bool HasTruthSupport(BelnapValue value);
bool HasFalsitySupport(BelnapValue value);
BelnapValue FromSupports(bool truth_support, bool falsity_support);

// Truth order.
BelnapValue And(BelnapValue a, BelnapValue b);
BelnapValue Or(BelnapValue a, BelnapValue b);
BelnapValue Not(BelnapValue value);

// Knowledge order. Consensus keeps only evidence both sides share;
// Gullibility accepts evidence from either side.
BelnapValue Consensus(BelnapValue a, BelnapValue b);
BelnapValue Gullibility(BelnapValue a, BelnapValue b);

const char* ToString(BelnapValue value);

// Accepts "unknown", "true", "false", "contradictory" (case-sensitive) and the
// aliases "neither"/"both".
bool ParseBelnapValue(std::string_view raw, BelnapValue& value, std::string& error);

} // namespace rsa::semantics
