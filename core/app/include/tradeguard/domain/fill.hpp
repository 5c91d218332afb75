#pragma once

#include "tradeguard/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Fill: one partial or full execution reported by the venue
// -----------------------------------------------------------------------------
//
// @brief  Value type applied to an order by OrderTracker::applyFill().
//
// @details
// fill_id is the venue's trade id when the venue supplies one. The tracker
// uses it to drop replayed fills; without it, at-most-once delivery is the
// caller's responsibility.
//
// commission is already converted into the accounting asset by whoever
// builds the Fill; commission_asset records the original asset for
// reporting only.
//
// Fills are applied in delivery order. timestamp is informational and is
// never used to reorder.
// -----------------------------------------------------------------------------
struct Fill {
  ClientOrderId order_client_id;
  std::optional<std::string> fill_id;
  double qty{0.0};
  double price{0.0};
  double commission{0.0};
  std::string commission_asset;
  std::int64_t timestamp{0};  // Epoch ms
  bool is_final{false};       // Venue says this fill completes the order
};

}  // namespace domain
}  // namespace tradeguard
