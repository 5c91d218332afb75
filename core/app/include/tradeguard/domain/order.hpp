#pragma once

#include "tradeguard/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// ClientOrderId
// -----------------------------------------------------------------------------
// Caller-generated order identifier (see ClientIdGenerator). It is the
// correlation key for every venue event, so it is a string: venues echo it
// back verbatim. Never reused within a process.
// -----------------------------------------------------------------------------
using ClientOrderId = std::string;

// Identifier assigned by the venue on acknowledgement.
using VenueOrderId = std::string;

// -----------------------------------------------------------------------------
// Side / OrderType
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
};

inline const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

inline const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Market: return "Market";
    case OrderType::Limit:  return "Limit";
  }
  return "Unknown";
}

// +1.0 for Buy, -1.0 for Sell. Used to turn unsigned quantities into signed
// position deltas.
inline double sideSign(Side s) { return s == Side::Buy ? 1.0 : -1.0; }

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  One trade instruction sent (or about to be sent) to the venue,
//         together with its lifecycle state and accumulated fills.
//
// @details
// Invariants (enforced by OrderTracker, the only writer):
//   - client_id never changes and is never reused.
//   - filled_qty <= requested_qty.
//   - avg_fill_price has a value iff filled_qty > 0 and equals the
//     quantity-weighted mean of all recorded fills.
//   - Once status is terminal the record is frozen.
//
// Copies handed out by OrderTracker::get() / openOrders() and carried in
// OrderUpdateEvent are snapshots; mutating them has no effect on the
// tracker.
//
// Timestamps are epoch milliseconds from the injected ITimeProvider.
// -----------------------------------------------------------------------------
struct Order {
  ClientOrderId client_id;               // Caller-generated, immutable
  std::optional<VenueOrderId> venue_id;  // Bound on acknowledgement
  std::string symbol;                    // Instrument (e.g. "BTCUSDT")
  Side side{Side::Buy};
  OrderType type{OrderType::Market};
  double requested_qty{0.0};
  std::optional<double> limit_price;     // Only for OrderType::Limit
  OrderStatus status{OrderStatus::Submitted};
  double filled_qty{0.0};
  std::optional<double> avg_fill_price;  // Defined only when filled_qty > 0
  double commission_total{0.0};          // In the accounting asset
  std::int64_t created_at{0};            // Epoch ms
  std::int64_t updated_at{0};            // Epoch ms
  std::string reject_reason;             // Set when status == Rejected

  double remainingQty() const { return requested_qty - filled_qty; }
};

}  // namespace domain
}  // namespace tradeguard
