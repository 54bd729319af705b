#pragma once

namespace rsa::core::errors {

// Error kinds a single decision step can surface.
//
// - kInvalidInput: the step was rejected before any state mutation.
// - kSolverFailure: the safety QP failed; the step still produced the zero action.
// - kNumericDegeneracy: weights collapsed or underflowed; warning only.
enum class StepErrorKind {
  kNone,
  kInvalidInput,
  kSolverFailure,
  kNumericDegeneracy,
};

inline const char* ToString(StepErrorKind kind) {
  switch (kind) {
  case StepErrorKind::kNone:
    return "none";
  case StepErrorKind::kInvalidInput:
    return "invalid_input";
  case StepErrorKind::kSolverFailure:
    return "solver_failure";
  case StepErrorKind::kNumericDegeneracy:
    return "numeric_degeneracy";
  }
  return "none";
}

} // namespace rsa::core::errors
