#include "semantics/belnap.hpp"

namespace rsa::semantics {

bool HasTruthSupport(const BelnapValue value) {
  return value == BelnapValue::kTrue || value == BelnapValue::kContradictory;
}

bool HasFalsitySupport(const BelnapValue value) {
  return value == BelnapValue::kFalse || value == BelnapValue::kContradictory;
}

BelnapValue FromSupports(const bool truth_support, const bool falsity_support) {
  if (truth_support && falsity_support) {
    return BelnapValue::kContradictory;
  }
  if (truth_support) {
    return BelnapValue::kTrue;
  }
  if (falsity_support) {
    return BelnapValue::kFalse;
  }
  return BelnapValue::kUnknown;
}

BelnapValue And(const BelnapValue a, const BelnapValue b) {
  return FromSupports(HasTruthSupport(a) && HasTruthSupport(b),
                      HasFalsitySupport(a) || HasFalsitySupport(b));
}

BelnapValue Or(const BelnapValue a, const BelnapValue b) {
  return FromSupports(HasTruthSupport(a) || HasTruthSupport(b),
                      HasFalsitySupport(a) && HasFalsitySupport(b));
}

BelnapValue Not(const BelnapValue value) {
  return FromSupports(HasFalsitySupport(value), HasTruthSupport(value));
}

BelnapValue Consensus(const BelnapValue a, const BelnapValue b) {
  return FromSupports(HasTruthSupport(a) && HasTruthSupport(b),
                      HasFalsitySupport(a) && HasFalsitySupport(b));
}

BelnapValue Gullibility(const BelnapValue a, const BelnapValue b) {
  return FromSupports(HasTruthSupport(a) || HasTruthSupport(b),
                      HasFalsitySupport(a) || HasFalsitySupport(b));
}

const char* ToString(const BelnapValue value) {
  switch (value) {
  case BelnapValue::kUnknown:
    return "unknown";
  case BelnapValue::kTrue:
    return "true";
  case BelnapValue::kFalse:
    return "false";
  case BelnapValue::kContradictory:
    return "contradictory";
  }
  return "unknown";
}

bool ParseBelnapValue(std::string_view raw, BelnapValue& value, std::string& error) {
  if (raw == "unknown" || raw == "neither") {
    value = BelnapValue::kUnknown;
  } else if (raw == "true") {
    value = BelnapValue::kTrue;
  } else if (raw == "false") {
    value = BelnapValue::kFalse;
  } else if (raw == "contradictory" || raw == "both") {
    value = BelnapValue::kContradictory;
  } else {
    error = "invalid belnap value '" + std::string(raw) +
            "' (expected unknown|true|false|contradictory)";
    return false;
  }
  return true;
}

} // namespace rsa::semantics
