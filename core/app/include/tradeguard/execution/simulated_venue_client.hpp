#pragma once

#include "tradeguard/domain/position.hpp"
#include "tradeguard/execution/i_venue_client.hpp"
#include "tradeguard/risk/i_reconciler.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// SimulatedVenueClient: in-process venue for the executable and demos
// -----------------------------------------------------------------------------
//
// @brief  Accepts every order, acknowledges it and fills it completely at
//         the current price, delivering the events through the sink exactly
//         as a real adapter would.
//
// @details
// Fill model:
//   - Market orders fill in full at price_source(symbol).
//   - Limit orders fill at the limit price.
//   - No price known → acknowledged only; the order stays open until
//     cancelled.
//
// Events are pushed synchronously from inside placeOrder(), so they reach
// the core's queue before placeOrder() returns; the dispatcher buffers
// them until the order is registered.
//
// heartbeat() emits a HeartbeatEvent; the executable calls it periodically
// to keep the stream fresh.
//
// Reconciliation:
//   The venue keeps its own order table and per-symbol positions, built
//   from the fills it generated, and serves them through IReconciler. The
//   executable attaches it to TradingCore so a desync is repaired from the
//   venue's view.
//
// Thread model:
//   Internally synchronised. The sink is invoked with no lock held.
// -----------------------------------------------------------------------------
class SimulatedVenueClient final : public IVenueClient, public IReconciler {
 public:
  using PriceSource = std::function<std::optional<double>(const std::string&)>;

  SimulatedVenueClient(const ITimeProvider& clock, PriceSource price_source,
                       double commission_rate = 0.001,
                       std::string commission_asset = "USDT");

  SimulatedVenueClient(const SimulatedVenueClient&) = delete;
  SimulatedVenueClient& operator=(const SimulatedVenueClient&) = delete;
  SimulatedVenueClient(SimulatedVenueClient&&) = delete;
  SimulatedVenueClient& operator=(SimulatedVenueClient&&) = delete;

  // Must be set before the first order.
  void setEventSink(EventSink sink);

  VenueResult<VenueAck> placeOrder(
      const OrderSpec& spec, std::chrono::milliseconds ack_timeout) override;

  VenueResult<CancelAck> cancelOrder(
      const domain::ClientOrderId& client_id) override;

  VenueResult<VenueOrderStatus> getOrderStatus(
      const domain::ClientOrderId& client_id) override;

  bool reconnect() override;

  void heartbeat();

  // --- IReconciler ----------------------------------------------------------
  // Non-flat positions, marked at the price source where it has a price.
  std::vector<domain::Position> reconcilePositions() override;

  // Working orders in placement order.
  std::vector<domain::Order> reconcileOrders() override;

 private:
  struct VenueOrder {
    OrderSpec spec;
    VenueOrderStatus status;
    std::int64_t created_at{0};
  };

  void deliver(Event event);

  const ITimeProvider& clock_;
  PriceSource price_source_;
  const double commission_rate_;
  const std::string commission_asset_;

  std::mutex mutex_;
  EventSink sink_;
  std::unordered_map<domain::ClientOrderId, VenueOrder> orders_;
  std::vector<domain::ClientOrderId> placement_order_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::uint64_t next_venue_id_{1};
  std::uint64_t next_trade_id_{1};
};

}  // namespace tradeguard
