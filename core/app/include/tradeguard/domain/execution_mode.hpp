#pragma once

#include <optional>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionMode
// -----------------------------------------------------------------------------
//   DryRun  validate and log only
//   Paper   validate, then fill locally against the mark price
//   Live    validate, then place on the venue
//
// The mode is stamped on each order at submission. Changing the active mode
// only affects orders created afterwards.
// -----------------------------------------------------------------------------
enum class ExecutionMode {
  DryRun,
  Paper,
  Live,
};

inline const char* toString(ExecutionMode m) {
  switch (m) {
    case ExecutionMode::DryRun: return "DRY_RUN";
    case ExecutionMode::Paper:  return "PAPER";
    case ExecutionMode::Live:   return "LIVE";
  }
  return "UNKNOWN";
}

inline std::optional<ExecutionMode> executionModeFromString(
    const std::string& s) {
  if (s == "DRY_RUN") return ExecutionMode::DryRun;
  if (s == "PAPER") return ExecutionMode::Paper;
  if (s == "LIVE") return ExecutionMode::Live;
  return std::nullopt;
}

}  // namespace domain
}  // namespace tradeguard
