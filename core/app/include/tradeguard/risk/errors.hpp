#pragma once

#include <stdexcept>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// TrackerError hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Invariant violations in local order state.
//
// @details
// These are programmer errors or signs that local state and the venue have
// diverged. They are thrown immediately, never swallowed. The recovery
// is full reconciliation (IReconciler), not patching the one order that
// failed.
//
// Expected outcomes (risk rejections, venue refusals) are NOT exceptions;
// see ValidationResult and VenueResult.
// -----------------------------------------------------------------------------
class TrackerError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// submit() with a client_id that is already tracked.
class DuplicateClientId : public TrackerError {
 public:
  explicit DuplicateClientId(const std::string& client_id)
      : TrackerError("duplicate client_id: " + client_id) {}
};

// Operation on a client_id the tracker has never seen.
class UnknownOrder : public TrackerError {
 public:
  explicit UnknownOrder(const std::string& client_id)
      : TrackerError("unknown client_id: " + client_id) {}
};

// State machine violation, including any change to a terminal order.
class InvalidTransition : public TrackerError {
 public:
  using TrackerError::TrackerError;
};

// A fill that would push filled_qty above requested_qty.
class FillOverflow : public TrackerError {
 public:
  using TrackerError::TrackerError;
};

}  // namespace tradeguard
