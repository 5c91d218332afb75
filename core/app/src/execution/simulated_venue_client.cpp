#include "tradeguard/execution/simulated_venue_client.hpp"
#include "tradeguard/risk/position_book.hpp"

#include <iostream>
#include <utility>

namespace tradeguard {

SimulatedVenueClient::SimulatedVenueClient(const ITimeProvider& clock,
                                           PriceSource price_source,
                                           double commission_rate,
                                           std::string commission_asset)
    : clock_(clock),
      price_source_(std::move(price_source)),
      commission_rate_(commission_rate),
      commission_asset_(std::move(commission_asset)) {}

void SimulatedVenueClient::setEventSink(EventSink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
}

// -----------------------------------------------------------------------------
// placeOrder: two-step execution (ack, then full fill)
// -----------------------------------------------------------------------------
VenueResult<VenueAck> SimulatedVenueClient::placeOrder(
    const OrderSpec& spec, std::chrono::milliseconds /*ack_timeout*/) {
  if (spec.client_id.empty() || spec.symbol.empty() || !(spec.qty > 0.0)) {
    return VenueError{VenueErrorCode::InvalidRequest, "malformed order"};
  }

  std::optional<double> price = spec.limit_price;
  if (!price && price_source_) {
    price = price_source_(spec.symbol);
  }

  const std::int64_t now = clock_.now_ms();
  VenueOrderStatus status;
  std::string trade_id;
  {
    std::lock_guard lock(mutex_);
    if (orders_.count(spec.client_id) != 0) {
      return VenueError{VenueErrorCode::Rejected, "duplicate client id"};
    }
    status.client_id = spec.client_id;
    status.venue_id = "sim-" + std::to_string(next_venue_id_++);
    status.status = domain::OrderStatus::Open;
    if (price) {
      status.status = domain::OrderStatus::Filled;
      status.filled_qty = spec.qty;
      status.avg_fill_price = *price;
      trade_id = "sim-trade-" + std::to_string(next_trade_id_++);

      auto& pos = positions_[spec.symbol];
      pos.symbol = spec.symbol;
      PositionBook::applyFillTo(pos, domain::sideSign(spec.side) * spec.qty,
                                *price);
    }
    orders_[spec.client_id] = VenueOrder{spec, status, now};
    placement_order_.push_back(spec.client_id);
  }

  // --- Report 1: Acknowledged ----------------------------------------------
  deliver(AcknowledgedEvent{spec.client_id, status.venue_id, now});

  // --- Report 2: Filled, when a price is known ------------------------------
  if (price) {
    domain::Fill fill;
    fill.order_client_id = spec.client_id;
    fill.fill_id = trade_id;
    fill.qty = spec.qty;
    fill.price = *price;
    fill.commission = spec.qty * *price * commission_rate_;
    fill.commission_asset = commission_asset_;
    fill.timestamp = now;
    fill.is_final = true;
    deliver(FillEvent{fill});
  } else {
    std::cerr << "[SimulatedVenue] WARNING: no price for " << spec.symbol
              << ", order " << spec.client_id << " stays open.\n";
  }

  return VenueAck{status.venue_id};
}

VenueResult<CancelAck> SimulatedVenueClient::cancelOrder(
    const domain::ClientOrderId& client_id) {
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(client_id);
    if (it == orders_.end()) {
      return VenueError{VenueErrorCode::NotFound, "unknown order"};
    }
    if (domain::isTerminal(it->second.status.status)) {
      return VenueError{VenueErrorCode::Rejected, "order not open"};
    }
    it->second.status.status = domain::OrderStatus::Cancelled;
  }
  deliver(CancelledEvent{client_id, clock_.now_ms()});
  return CancelAck{client_id};
}

VenueResult<VenueOrderStatus> SimulatedVenueClient::getOrderStatus(
    const domain::ClientOrderId& client_id) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(client_id);
  if (it == orders_.end()) {
    return VenueError{VenueErrorCode::NotFound, "unknown order"};
  }
  return it->second.status;
}

bool SimulatedVenueClient::reconnect() {
  deliver(ConnectionUpEvent{clock_.now_ms()});
  return true;
}

void SimulatedVenueClient::heartbeat() {
  deliver(HeartbeatEvent{clock_.now_ms(), 1.0});
}

// -----------------------------------------------------------------------------
// IReconciler: the venue's own book
// -----------------------------------------------------------------------------
std::vector<domain::Position> SimulatedVenueClient::reconcilePositions() {
  std::vector<domain::Position> result;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [symbol, pos] : positions_) {
      if (pos.net_quantity != 0.0) {
        result.push_back(pos);
      }
    }
  }
  // The price source may lock elsewhere; call it without mutex_.
  for (auto& pos : result) {
    if (price_source_) {
      if (auto mark = price_source_(pos.symbol)) {
        pos.mark_price = *mark;
      }
    }
  }
  return result;
}

std::vector<domain::Order> SimulatedVenueClient::reconcileOrders() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& id : placement_order_) {
    const VenueOrder& o = orders_.at(id);
    if (domain::isTerminal(o.status.status)) {
      continue;
    }
    domain::Order order;
    order.client_id = id;
    order.venue_id = o.status.venue_id;
    order.symbol = o.spec.symbol;
    order.side = o.spec.side;
    order.type = o.spec.type;
    order.requested_qty = o.spec.qty;
    order.limit_price = o.spec.limit_price;
    order.status = o.status.status;
    order.filled_qty = o.status.filled_qty;
    order.avg_fill_price = o.status.avg_fill_price;
    order.created_at = o.created_at;
    order.updated_at = o.created_at;
    result.push_back(std::move(order));
  }
  return result;
}

void SimulatedVenueClient::deliver(Event event) {
  EventSink sink;
  {
    std::lock_guard lock(mutex_);
    sink = sink_;
  }
  if (sink) {
    sink(std::move(event));
  }
}

}  // namespace tradeguard
