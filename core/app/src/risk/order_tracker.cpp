#include "tradeguard/risk/order_tracker.hpp"
#include "tradeguard/risk/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace tradeguard {

namespace {

// Float tolerance for "filled == requested" and overflow checks, relative
// to the requested quantity.
constexpr double kQtyTolerance = 1e-9;

double tolerance(double requested_qty) {
  return kQtyTolerance * std::max(1.0, std::abs(requested_qty));
}

std::string transitionMessage(const domain::Order& order,
                              domain::OrderStatus next) {
  return "illegal transition for client_id=" + order.client_id + " from " +
         domain::toString(order.status) + " to " + domain::toString(next);
}

}  // namespace

OrderTracker::OrderTracker(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// canTransition: the lifecycle graph
// -----------------------------------------------------------------------------
bool OrderTracker::canTransition(domain::OrderStatus current,
                                 domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Submitted:
      return next == S::Open ||
             next == S::Rejected;

    case S::Open:
    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Expired;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
    case S::Expired:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// submit
// -----------------------------------------------------------------------------
void OrderTracker::submit(const domain::Order& order) {
  if (order.client_id.empty()) {
    throw std::invalid_argument("order client_id must not be empty");
  }
  if (order.symbol.empty()) {
    throw std::invalid_argument("order symbol must not be empty");
  }
  if (!(order.requested_qty > 0.0) || !std::isfinite(order.requested_qty)) {
    throw std::invalid_argument("order requested_qty must be positive");
  }
  if (order.type == domain::OrderType::Limit &&
      (!order.limit_price || !(*order.limit_price > 0.0))) {
    throw std::invalid_argument("limit order requires a positive limit_price");
  }
  if (orders_.count(order.client_id) != 0) {
    throw DuplicateClientId(order.client_id);
  }

  const std::int64_t now = clock_.now_ms();

  domain::Order tracked = order;
  tracked.venue_id.reset();
  tracked.status = domain::OrderStatus::Submitted;
  tracked.filled_qty = 0.0;
  tracked.avg_fill_price.reset();
  tracked.commission_total = 0.0;
  tracked.reject_reason.clear();
  if (tracked.created_at == 0) {
    tracked.created_at = now;
  }
  tracked.updated_at = now;

  // Reserve the slot first: if push_back throws, the map is untouched.
  insertion_order_.push_back(tracked.client_id);
  orders_.emplace(tracked.client_id, std::move(tracked));
}

// -----------------------------------------------------------------------------
// acknowledge
// -----------------------------------------------------------------------------
void OrderTracker::acknowledge(const domain::ClientOrderId& client_id,
                               const domain::VenueOrderId& venue_id) {
  domain::Order& order = find(client_id);

  if (order.venue_id) {
    if (*order.venue_id != venue_id) {
      throw InvalidTransition("client_id=" + client_id +
                              " already bound to venue_id=" + *order.venue_id +
                              ", refusing " + venue_id);
    }
    if (!domain::isTerminal(order.status)) {
      return;  // Duplicate acknowledgement.
    }
  }

  requireTransition(order, domain::OrderStatus::Open);

  order.venue_id = venue_id;
  order.status = domain::OrderStatus::Open;
  order.updated_at = clock_.now_ms();
}

// -----------------------------------------------------------------------------
// applyFill
// -----------------------------------------------------------------------------
domain::Order OrderTracker::applyFill(const domain::ClientOrderId& client_id,
                                      const domain::Fill& fill) {
  domain::Order& order = find(client_id);

  if (fill.fill_id &&
      seen_fill_ids_.count(fillKey(client_id, *fill.fill_id)) != 0) {
    std::cerr << "[OrderTracker] WARNING: replayed fill_id=" << *fill.fill_id
              << " for client_id=" << client_id << " ignored.\n";
    return order;
  }

  if (!(fill.qty > 0.0) || !std::isfinite(fill.qty)) {
    throw std::invalid_argument("fill qty must be positive for client_id=" +
                                client_id);
  }
  if (!(fill.price > 0.0) || !std::isfinite(fill.price)) {
    throw std::invalid_argument("fill price must be positive for client_id=" +
                                client_id);
  }

  const double new_filled = order.filled_qty + fill.qty;
  const double tol = tolerance(order.requested_qty);
  const bool completes =
      fill.is_final || new_filled >= order.requested_qty - tol;
  const domain::OrderStatus next = completes
                                       ? domain::OrderStatus::Filled
                                       : domain::OrderStatus::PartiallyFilled;

  requireTransition(order, next);

  if (new_filled > order.requested_qty + tol) {
    throw FillOverflow("fill of " + std::to_string(fill.qty) +
                       " overflows client_id=" + client_id + " (filled " +
                       std::to_string(order.filled_qty) + " of " +
                       std::to_string(order.requested_qty) + ")");
  }

  // --- All checks passed: mutate --------------------------------------------
  if (fill.fill_id) {
    seen_fill_ids_.insert(fillKey(client_id, *fill.fill_id));
  }

  const double old_avg = order.avg_fill_price.value_or(0.0);
  order.avg_fill_price =
      (old_avg * order.filled_qty + fill.price * fill.qty) / new_filled;
  order.filled_qty = std::min(new_filled, order.requested_qty);
  order.commission_total += fill.commission;
  order.status = next;
  order.updated_at = fill.timestamp != 0 ? fill.timestamp : clock_.now_ms();

  return order;
}

// -----------------------------------------------------------------------------
// cancel / reject / expire
// -----------------------------------------------------------------------------
void OrderTracker::cancel(const domain::ClientOrderId& client_id) {
  domain::Order& order = find(client_id);
  requireTransition(order, domain::OrderStatus::Cancelled);
  order.status = domain::OrderStatus::Cancelled;
  order.updated_at = clock_.now_ms();
}

void OrderTracker::reject(const domain::ClientOrderId& client_id,
                          const std::string& reason) {
  domain::Order& order = find(client_id);
  requireTransition(order, domain::OrderStatus::Rejected);
  order.status = domain::OrderStatus::Rejected;
  order.reject_reason = reason;
  order.updated_at = clock_.now_ms();
}

void OrderTracker::expire(const domain::ClientOrderId& client_id) {
  domain::Order& order = find(client_id);
  requireTransition(order, domain::OrderStatus::Expired);
  order.status = domain::OrderStatus::Expired;
  order.updated_at = clock_.now_ms();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderTracker::get(
    const domain::ClientOrderId& client_id) const {
  auto it = orders_.find(client_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool OrderTracker::contains(const domain::ClientOrderId& client_id) const {
  return orders_.count(client_id) != 0;
}

std::vector<domain::Order> OrderTracker::openOrders() const {
  std::vector<domain::Order> result;
  for (const auto& id : insertion_order_) {
    const domain::Order& order = orders_.at(id);
    if (!domain::isTerminal(order.status)) {
      result.push_back(order);
    }
  }
  return result;
}

std::vector<domain::Order> OrderTracker::allOrders() const {
  std::vector<domain::Order> result;
  result.reserve(insertion_order_.size());
  for (const auto& id : insertion_order_) {
    result.push_back(orders_.at(id));
  }
  return result;
}

// -----------------------------------------------------------------------------
// Reconciliation
// -----------------------------------------------------------------------------
void OrderTracker::hydrateOrder(const domain::Order& order) {
  auto it = orders_.find(order.client_id);
  if (it == orders_.end()) {
    insertion_order_.push_back(order.client_id);
    orders_.emplace(order.client_id, order);
    return;
  }
  it->second = order;
}

void OrderTracker::rebuildOpenOrders(
    const std::vector<domain::Order>& venue_open_orders) {
  std::size_t dropped = 0;
  for (auto it = orders_.begin(); it != orders_.end();) {
    if (!domain::isTerminal(it->second.status)) {
      it = orders_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  insertion_order_.erase(
      std::remove_if(insertion_order_.begin(), insertion_order_.end(),
                     [this](const domain::ClientOrderId& id) {
                       return orders_.count(id) == 0;
                     }),
      insertion_order_.end());

  for (const auto& order : venue_open_orders) {
    hydrateOrder(order);
  }

  std::cout << "[OrderTracker] rebuilt open orders: dropped " << dropped
            << ", hydrated " << venue_open_orders.size() << ".\n";
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
domain::Order& OrderTracker::find(const domain::ClientOrderId& client_id) {
  auto it = orders_.find(client_id);
  if (it == orders_.end()) {
    throw UnknownOrder(client_id);
  }
  return it->second;
}

const domain::Order& OrderTracker::find(
    const domain::ClientOrderId& client_id) const {
  auto it = orders_.find(client_id);
  if (it == orders_.end()) {
    throw UnknownOrder(client_id);
  }
  return it->second;
}

void OrderTracker::requireTransition(const domain::Order& order,
                                     domain::OrderStatus next) {
  if (!canTransition(order.status, next)) {
    throw InvalidTransition(transitionMessage(order, next));
  }
}

std::string OrderTracker::fillKey(const domain::ClientOrderId& client_id,
                                  const std::string& fill_id) {
  return client_id + '\x1f' + fill_id;
}

}  // namespace tradeguard
