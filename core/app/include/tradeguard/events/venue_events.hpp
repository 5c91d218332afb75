#pragma once

#include "tradeguard/domain/fill.hpp"
#include "tradeguard/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Venue stream events
// -----------------------------------------------------------------------------
//
// @brief  What the venue client's asynchronous stream delivers to the core.
//
// @details
// The venue adapter converts its wire messages into these structs and hands
// them to the core's event sink (TradingCore::onVenueEvent), which records
// connection telemetry and then enqueues them on the core's bounded event
// queue. They are applied to OrderTracker on the single core loop thread,
// in delivery order.
//
// Every event carries the adapter's receive time (epoch ms). It is never
// used to reorder.
// -----------------------------------------------------------------------------

// Venue accepted the order and assigned venue_id.
struct AcknowledgedEvent {
  domain::ClientOrderId client_id;
  domain::VenueOrderId venue_id;
  std::int64_t timestamp{0};
};

// Partial or final execution.
struct FillEvent {
  domain::Fill fill;
};

// Cancel confirmed by the venue.
struct CancelledEvent {
  domain::ClientOrderId client_id;
  std::int64_t timestamp{0};
};

// Venue refused the order after it was submitted.
struct RejectedEvent {
  domain::ClientOrderId client_id;
  std::string reason;
  std::int64_t timestamp{0};
};

// Time-in-force ran out.
struct ExpiredEvent {
  domain::ClientOrderId client_id;
  std::int64_t timestamp{0};
};

struct ConnectionUpEvent {
  std::int64_t timestamp{0};
};

struct ConnectionDownEvent {
  std::string reason;
  std::int64_t timestamp{0};
};

// Stream-level error (malformed frame, server error push, etc).
struct VenueErrorEvent {
  std::string message;
  std::int64_t timestamp{0};
};

// Keep-alive or market data frame. latency_ms is the venue-to-adapter
// delay when the adapter can measure it.
struct HeartbeatEvent {
  std::int64_t timestamp{0};
  std::optional<double> latency_ms;
};

}  // namespace tradeguard
