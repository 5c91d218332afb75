#pragma once

#include "tradeguard/domain/fill.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// OrderTracker: order lifecycle state machine and order book
// -----------------------------------------------------------------------------
//
// @brief  Authoritative local copy of every order the core has sent,
//         from submission to terminal state.
//
// @details
// Responsibilities:
//   1. Map client ids to venue ids (bound on acknowledge()).
//   2. Accumulate partial fills: filled_qty, running weighted
//      avg_fill_price, commission_total.
//   3. Enforce the OrderStatus transition graph. Any illegal transition
//      throws InvalidTransition; nothing is silently skipped.
//
// Every mutating method validates fully before touching state, so a throw
// leaves the tracker exactly as it was.
//
// Fill de-duplication:
//   If a Fill carries fill_id, the (client_id, fill_id) pair is remembered
//   and a replay returns the current order unchanged. Without fill_id the
//   tracker assumes at-most-once delivery.
//
// Terminal orders are kept (get() still finds them) so late events for a
// finished order are recognised as invalid rather than unknown.
//
// Thread model:
//   NOT thread-safe. ExecutionDispatcher guards every call with its
//   per-account mutex; the tracker itself has no lock.
//
// Ownership:
//   Owned by TradingCore. Borrows the time provider for updated_at stamps.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  explicit OrderTracker(const ITimeProvider& clock);

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;
  OrderTracker(OrderTracker&&) = delete;
  OrderTracker& operator=(OrderTracker&&) = delete;

  // -------------------------------------------------------------------------
  // submit(order)
  // -------------------------------------------------------------------------
  // @brief  Registers a new order in Submitted state.
  //
  // @details
  // status, filled_qty, avg_fill_price, commission_total and venue_id are
  // reset; the caller's values for them are ignored. created_at is kept if
  // set, otherwise stamped with now.
  //
  // @throws DuplicateClientId   client_id already tracked (any state).
  // @throws std::invalid_argument  empty client_id/symbol, qty <= 0, or a
  //                             Limit order without a positive limit_price.
  // -------------------------------------------------------------------------
  void submit(const domain::Order& order);

  // -------------------------------------------------------------------------
  // acknowledge(client_id, venue_id)
  // -------------------------------------------------------------------------
  // @brief  Submitted → Open, binding venue_id.
  //
  // @details
  // A repeat with the same venue_id on a live (non-terminal) order is a
  // no-op. A different venue_id never rebinds: it throws.
  //
  // @throws UnknownOrder, InvalidTransition
  // -------------------------------------------------------------------------
  void acknowledge(const domain::ClientOrderId& client_id,
                   const domain::VenueOrderId& venue_id);

  // -------------------------------------------------------------------------
  // applyFill(client_id, fill)
  // -------------------------------------------------------------------------
  // @brief  Adds one execution to an Open/PartiallyFilled order.
  //
  // @return Snapshot of the order after the fill.
  //
  // @details
  //   avg = (avg * filled_old + price * qty) / (filled_old + qty)
  //   commission_total += fill.commission
  //
  // Ends in Filled when fill.is_final or filled_qty reaches requested_qty,
  // otherwise PartiallyFilled.
  //
  // @throws UnknownOrder, InvalidTransition (order not working),
  //         FillOverflow (filled_qty would exceed requested_qty),
  //         std::invalid_argument (qty or price not positive).
  // -------------------------------------------------------------------------
  domain::Order applyFill(const domain::ClientOrderId& client_id,
                          const domain::Fill& fill);

  // Open/PartiallyFilled → Cancelled. Call only on venue confirmation.
  void cancel(const domain::ClientOrderId& client_id);

  // Submitted → Rejected.
  void reject(const domain::ClientOrderId& client_id,
              const std::string& reason);

  // Open/PartiallyFilled → Expired.
  void expire(const domain::ClientOrderId& client_id);

  std::optional<domain::Order> get(const domain::ClientOrderId& client_id) const;

  bool contains(const domain::ClientOrderId& client_id) const;

  // Non-terminal orders, in insertion order.
  std::vector<domain::Order> openOrders() const;

  // Every order ever tracked, in insertion order.
  std::vector<domain::Order> allOrders() const;

  std::size_t size() const { return orders_.size(); }

  // -------------------------------------------------------------------------
  // hydrateOrder(order)
  // -------------------------------------------------------------------------
  // @brief  Inserts or overwrites an order exactly as the venue reports it.
  //
  // @details
  // Reconciliation only. No validation of status: the venue is the source
  // of truth. Existing fill-id history for the client id is kept.
  // -------------------------------------------------------------------------
  void hydrateOrder(const domain::Order& order);

  // -------------------------------------------------------------------------
  // rebuildOpenOrders(venue_open_orders)
  // -------------------------------------------------------------------------
  // @brief  Replaces every non-terminal local order with the venue's view.
  //
  // @details
  // Local open orders missing from the venue list are dropped (the venue no
  // longer works them; their final fate is unknown locally). Terminal
  // history is kept. Used after a desync is detected.
  // -------------------------------------------------------------------------
  void rebuildOpenOrders(const std::vector<domain::Order>& venue_open_orders);

  // -------------------------------------------------------------------------
  // canTransition(current, next)
  // -------------------------------------------------------------------------
  //   Submitted       → Open, Rejected
  //   Open            → PartiallyFilled, Filled, Cancelled, Expired
  //   PartiallyFilled → PartiallyFilled, Filled, Cancelled, Expired
  //   terminal        → (none)
  // -------------------------------------------------------------------------
  static bool canTransition(domain::OrderStatus current,
                            domain::OrderStatus next);

 private:
  domain::Order& find(const domain::ClientOrderId& client_id);
  const domain::Order& find(const domain::ClientOrderId& client_id) const;

  // Throws InvalidTransition unless canTransition(order.status, next).
  static void requireTransition(const domain::Order& order,
                                domain::OrderStatus next);

  static std::string fillKey(const domain::ClientOrderId& client_id,
                             const std::string& fill_id);

  const ITimeProvider& clock_;

  std::unordered_map<domain::ClientOrderId, domain::Order> orders_;
  std::vector<domain::ClientOrderId> insertion_order_;
  std::unordered_set<std::string> seen_fill_ids_;
};

}  // namespace tradeguard
