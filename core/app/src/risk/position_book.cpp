#include "tradeguard/risk/position_book.hpp"

#include <cmath>
#include <mutex>

namespace tradeguard {

PositionBook::PositionBook(double initial_equity)
    : initial_equity_(initial_equity) {}

// -----------------------------------------------------------------------------
// applyFill: book one execution
// -----------------------------------------------------------------------------
double PositionBook::applyFill(const std::string& symbol, domain::Side side,
                               double qty, double price, double commission) {
  std::unique_lock lock(mutex_);

  domain::Position& pos = positions_[symbol];
  pos.symbol = symbol;
  if (pos.mark_price == 0.0) {
    pos.mark_price = price;
  }
  total_commission_ += commission;

  return applyFillTo(pos, domain::sideSign(side) * qty, price);
}

// -----------------------------------------------------------------------------
// updateMark
// -----------------------------------------------------------------------------
void PositionBook::updateMark(const std::string& symbol, double price) {
  std::unique_lock lock(mutex_);
  domain::Position& pos = positions_[symbol];
  pos.symbol = symbol;
  pos.mark_price = price;
}

// -----------------------------------------------------------------------------
// Reconciliation
// -----------------------------------------------------------------------------
void PositionBook::hydratePosition(const domain::Position& pos) {
  std::unique_lock lock(mutex_);
  domain::Position& slot = positions_[pos.symbol];
  const double known_mark = slot.mark_price;
  slot = pos;
  if (slot.mark_price == 0.0) {
    slot.mark_price = known_mark;
  }
}

void PositionBook::replaceAll(const std::vector<domain::Position>& positions) {
  std::unique_lock lock(mutex_);

  // Marks are market data, not account state: carry them over.
  std::unordered_map<std::string, domain::Position> next;
  for (const auto& [symbol, old] : positions_) {
    domain::Position flat;
    flat.symbol = symbol;
    flat.mark_price = old.mark_price;
    next.emplace(symbol, flat);
  }
  for (const auto& pos : positions) {
    domain::Position& slot = next[pos.symbol];
    const double known_mark = slot.mark_price;
    slot = pos;
    if (slot.mark_price == 0.0) {
      slot.mark_price = known_mark;
    }
  }
  positions_ = std::move(next);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionBook::position(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> PositionBook::getSnapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

double PositionBook::totalCommission() const {
  std::shared_lock lock(mutex_);
  return total_commission_;
}

double PositionBook::totalRealizedPnl() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.realized_pnl;
  }
  return total;
}

double PositionBook::currentEquity() const {
  std::shared_lock lock(mutex_);
  double equity = initial_equity_ - total_commission_;
  for (const auto& [symbol, pos] : positions_) {
    equity += pos.realized_pnl + pos.unrealizedPnl();
  }
  return equity;
}

std::vector<domain::Position> PositionBook::openPositions() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [symbol, pos] : positions_) {
    if (pos.net_quantity != 0.0) {
      result.push_back(pos);
    }
  }
  return result;
}

std::optional<double> PositionBook::markPrice(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end() || it->second.mark_price <= 0.0) {
    return std::nullopt;
  }
  return it->second.mark_price;
}

// -----------------------------------------------------------------------------
// applyFillTo: core PnL math (static, no side effects beyond pos mutation)
// -----------------------------------------------------------------------------
double PositionBook::applyFillTo(domain::Position& pos, double signed_fill_qty,
                                 double fill_price) {
  const double current_qty = pos.net_quantity;

  // --- Flat: first fill opens the position ---------------------------------
  if (current_qty == 0.0) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
    return 0.0;
  }

  const bool same_direction =
      (current_qty > 0.0 && signed_fill_qty > 0.0) ||
      (current_qty < 0.0 && signed_fill_qty < 0.0);

  if (same_direction) {
    // ----- Case 1: increasing ------------------------------------------------
    const double new_total = current_qty + signed_fill_qty;
    pos.average_price =
        (current_qty * pos.average_price + signed_fill_qty * fill_price) /
        new_total;
    pos.net_quantity = new_total;
    return 0.0;
  }

  const double abs_current = std::abs(current_qty);
  const double abs_fill = std::abs(signed_fill_qty);

  // +1 closing a long, -1 closing a short.
  const double direction_sign = (current_qty > 0.0) ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    // ----- Case 2: decreasing, no reversal -----------------------------------
    const double realized =
        abs_fill * (fill_price - pos.average_price) * direction_sign;
    pos.realized_pnl += realized;
    pos.net_quantity = current_qty + signed_fill_qty;
    if (pos.net_quantity == 0.0) {
      pos.average_price = 0.0;
    }
    return realized;
  }

  // ----- Case 3: crossing zero -----------------------------------------------
  const double realized =
      abs_current * (fill_price - pos.average_price) * direction_sign;
  pos.realized_pnl += realized;

  const double open_qty = abs_fill - abs_current;
  const double new_direction_sign = (signed_fill_qty > 0.0) ? 1.0 : -1.0;
  pos.net_quantity = new_direction_sign * open_qty;
  pos.average_price = fill_price;
  return realized;
}

}  // namespace tradeguard
