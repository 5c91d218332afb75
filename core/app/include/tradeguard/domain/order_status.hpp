#pragma once

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy between submission to
//         the venue and its final resolution.
//
// @details
// The OrderTracker enforces the legal transition graph:
//
//   Submitted ──> Open ──> PartiallyFilled ──> Filled
//      │           │  │          │  │
//      │           │  │          │  └──> Cancelled / Expired
//      │           │  └──> Filled
//      ▼           └──> Cancelled / Expired
//   Rejected
//
// PartiallyFilled is the "open and partly executed" state: it accepts
// further fills, a cancel confirmation or an expiry, exactly like Open.
//
// Terminal states: Filled, Cancelled, Rejected, Expired. The tracker keeps
// terminal orders for lookup, but any transition out of them raises
// InvalidTransition.
//
// Thread model:
//   Plain enum, value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Submitted,        // Sent to the venue, not yet acknowledged
  Open,             // Acknowledged, resting on the venue
  PartiallyFilled,  // Some quantity filled, remainder still working
  Filled,           // Fully filled, terminal
  Cancelled,        // Cancel confirmed by the venue, terminal
  Rejected,         // Rejected by the venue, terminal
  Expired,          // Expired by time-in-force, terminal
};

// Returns true for Filled, Cancelled, Rejected, Expired.
inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected ||
         status == OrderStatus::Expired;
}

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Submitted:       return "Submitted";
    case OrderStatus::Open:            return "Open";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Cancelled:       return "Cancelled";
    case OrderStatus::Rejected:        return "Rejected";
    case OrderStatus::Expired:         return "Expired";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace tradeguard
