#pragma once

#include "tradeguard/domain/execution_mode.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/risk/risk_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// ExecutionStatus
// -----------------------------------------------------------------------------
//   DryRun          approved, nothing sent (intent says what would have been)
//   Submitted       registered and acknowledged, working at the venue
//   PartiallyFilled / Filled   already executed (PAPER fills synchronously)
//   Rejected        risk rejection or venue refusal; see rejection_reasons
//   Indeterminate   no acknowledgement and the status query could not tell;
//                   the client id must be reconciled before any retry
// -----------------------------------------------------------------------------
enum class ExecutionStatus {
  DryRun,
  Submitted,
  PartiallyFilled,
  Filled,
  Rejected,
  Indeterminate,
};

inline const char* toString(ExecutionStatus s) {
  switch (s) {
    case ExecutionStatus::DryRun:          return "DRY_RUN";
    case ExecutionStatus::Submitted:       return "SUBMITTED";
    case ExecutionStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case ExecutionStatus::Filled:          return "FILLED";
    case ExecutionStatus::Rejected:        return "REJECTED";
    case ExecutionStatus::Indeterminate:   return "INDETERMINATE";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// ExecutionResult: what execute() returns
// -----------------------------------------------------------------------------
// order is a snapshot from OrderTracker taken right after registration; it
// is absent for DryRun, Rejected and Indeterminate. client_id is set as soon
// as one was allocated, so an Indeterminate result names the id to query.
// -----------------------------------------------------------------------------
struct ExecutionResult {
  ExecutionStatus status{ExecutionStatus::Rejected};
  domain::ExecutionMode mode{domain::ExecutionMode::DryRun};
  std::optional<domain::ClientOrderId> client_id;
  std::optional<domain::Order> order;
  std::vector<std::string> rejection_reasons;
  std::optional<OrderIntent> intent;
  std::string detail;
};

}  // namespace tradeguard
