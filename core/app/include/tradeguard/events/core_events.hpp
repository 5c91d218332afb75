#pragma once

#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by ExecutionDispatcher after every OrderTracker
//         transition. Carries a snapshot of the order and the status it
//         left.
//
// @details
// Lets observers (IPC telemetry, logging, tests) follow the lifecycle
// without touching the tracker. The order field is a copy taken under the
// account lock, after the transition was applied.
//
// For the initial registration previous_status equals order.status
// (Submitted).
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Submitted};
  std::int64_t timestamp{0};
};

// -----------------------------------------------------------------------------
// KillSwitchEvent
// -----------------------------------------------------------------------------
// Published when the kill switch flips on (active == true, reason set) or is
// manually cleared (active == false, reason names the operator action).
// -----------------------------------------------------------------------------
struct KillSwitchEvent {
  bool active{true};
  std::string reason;
  std::string detail;
  std::int64_t timestamp{0};
};

}  // namespace tradeguard
