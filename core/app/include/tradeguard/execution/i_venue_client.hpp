#pragma once

#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/events/event.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace tradeguard {

// -----------------------------------------------------------------------------
// VenueErrorCode / VenueError
// -----------------------------------------------------------------------------
// Timeout, RateLimited, ServerError and Network are transient: an
// idempotent call that fails with one of them may be retried. Rejected,
// NotFound and InvalidRequest are final answers from the venue.
//
// For placeOrder(), Timeout means "no acknowledgement within the deadline".
// The order may or may not exist at the venue.
// -----------------------------------------------------------------------------
enum class VenueErrorCode {
  Timeout,
  RateLimited,
  ServerError,
  Network,
  Rejected,
  NotFound,
  InvalidRequest,
};

inline bool isTransient(VenueErrorCode code) {
  switch (code) {
    case VenueErrorCode::Timeout:
    case VenueErrorCode::RateLimited:
    case VenueErrorCode::ServerError:
    case VenueErrorCode::Network:
      return true;
    case VenueErrorCode::Rejected:
    case VenueErrorCode::NotFound:
    case VenueErrorCode::InvalidRequest:
      return false;
  }
  return false;
}

inline const char* toString(VenueErrorCode code) {
  switch (code) {
    case VenueErrorCode::Timeout:        return "timeout";
    case VenueErrorCode::RateLimited:    return "rate_limited";
    case VenueErrorCode::ServerError:    return "server_error";
    case VenueErrorCode::Network:        return "network";
    case VenueErrorCode::Rejected:       return "rejected";
    case VenueErrorCode::NotFound:       return "not_found";
    case VenueErrorCode::InvalidRequest: return "invalid_request";
  }
  return "unknown";
}

struct VenueError {
  VenueErrorCode code{VenueErrorCode::Network};
  std::string message;
};

// A venue call either yields T or a VenueError. Failures are values.
template <typename T>
using VenueResult = std::variant<T, VenueError>;

// -----------------------------------------------------------------------------
// Request / response payloads
// -----------------------------------------------------------------------------

// What placeOrder() sends. client_id is echoed back on every stream event.
struct OrderSpec {
  domain::ClientOrderId client_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  domain::OrderType type{domain::OrderType::Market};
  double qty{0.0};
  std::optional<double> limit_price;
};

struct VenueAck {
  domain::VenueOrderId venue_id;
};

// Answer to getOrderStatus(). NotFound is reported as a VenueError.
struct VenueOrderStatus {
  domain::ClientOrderId client_id;
  domain::VenueOrderId venue_id;
  domain::OrderStatus status{domain::OrderStatus::Open};
  double filled_qty{0.0};
  std::optional<double> avg_fill_price;
};

struct CancelAck {
  domain::ClientOrderId client_id;
};

// -----------------------------------------------------------------------------
// IVenueClient: the exchange as the core sees it
// -----------------------------------------------------------------------------
//
// @brief  Request/response half of the venue adapter.
//
// @details
// The asynchronous half (acks, fills, cancels, connection state) is not on
// this interface: the adapter pushes Event values into the sink it was
// given at construction, which TradingCore wires to its bounded queue.
//
// Implementations must not call back into the core synchronously from
// these methods; events go through the sink.
//
// Thread model:
//   Methods may be called from any thread, concurrently. Each call may
//   block on I/O; placeOrder() for at most ack_timeout.
// -----------------------------------------------------------------------------
class IVenueClient {
 public:
  using EventSink = std::function<void(Event)>;

  virtual ~IVenueClient() = default;

  // Not retried by the core. A Timeout result is ambiguous.
  virtual VenueResult<VenueAck> placeOrder(
      const OrderSpec& spec, std::chrono::milliseconds ack_timeout) = 0;

  // Idempotent. The order is cancelled only when a CancelledEvent arrives.
  virtual VenueResult<CancelAck> cancelOrder(
      const domain::ClientOrderId& client_id) = 0;

  // Idempotent. Unknown client id → VenueErrorCode::NotFound.
  virtual VenueResult<VenueOrderStatus> getOrderStatus(
      const domain::ClientOrderId& client_id) = 0;

  // Re-establishes the event stream. Returns false if the attempt failed.
  virtual bool reconnect() = 0;
};

}  // namespace tradeguard
