#pragma once

#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/risk/i_account_state_provider.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// PositionBook: local per-symbol position ledger
// -----------------------------------------------------------------------------
//
// @brief  Tracks net quantity, average entry, realized PnL and mark price per
//         symbol, and derives account equity from them.
//
// @details
// Every fill applied to OrderTracker is also applied here, so the
// dispatcher can hand RiskManager the realized PnL of each fill
// (FillOutcome).
//
// Equity:
//   initial_equity + Σ realized_pnl − Σ commission + Σ unrealized_pnl
//
// That makes the book a complete IAccountStateProvider for PAPER mode and
// tests. LIVE deployments may plug in a venue-backed provider instead and
// keep the book only for PnL attribution.
//
// Thread model:
//   std::shared_mutex: fills and mark updates take a unique lock; queries
//   take a shared lock. Safe from any thread. Accessors return copies.
// -----------------------------------------------------------------------------
class PositionBook : public IAccountStateProvider {
 public:
  explicit PositionBook(double initial_equity);

  PositionBook(const PositionBook&) = delete;
  PositionBook& operator=(const PositionBook&) = delete;
  PositionBook(PositionBook&&) = delete;
  PositionBook& operator=(PositionBook&&) = delete;

  // -------------------------------------------------------------------------
  // applyFill(symbol, side, qty, price, commission)
  // -------------------------------------------------------------------------
  // @brief  Books one execution and returns the PnL it realized.
  //
  // @details
  // Also records price as the symbol's mark when no mark is known yet.
  // Commission is accumulated separately from realized PnL.
  // -------------------------------------------------------------------------
  double applyFill(const std::string& symbol, domain::Side side, double qty,
                   double price, double commission);

  void updateMark(const std::string& symbol, double price);

  // Reconciliation: overwrite one symbol / replace the whole book.
  void hydratePosition(const domain::Position& pos);
  void replaceAll(const std::vector<domain::Position>& positions);

  std::optional<domain::Position> position(const std::string& symbol) const;
  std::vector<domain::Position> getSnapshots() const;

  double totalCommission() const;
  double totalRealizedPnl() const;

  // --- IAccountStateProvider ------------------------------------------------
  double currentEquity() const override;
  std::vector<domain::Position> openPositions() const override;
  std::optional<double> markPrice(const std::string& symbol) const override;

  // -------------------------------------------------------------------------
  // applyFillTo(pos, signed_fill_qty, fill_price)
  // -------------------------------------------------------------------------
  // @brief  The position math. Mutates pos, returns realized PnL.
  //
  // @details
  //   Case 1 (same direction or flat): weighted average entry.
  //   Case 2 (opposite, |fill| <= |pos|): realize closed part, avg unchanged.
  //   Case 3 (opposite, |fill| >  |pos|): realize the whole position, open
  //          the remainder at fill_price.
  // -------------------------------------------------------------------------
  static double applyFillTo(domain::Position& pos, double signed_fill_qty,
                            double fill_price);

 private:
  const double initial_equity_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
  double total_commission_{0.0};
};

}  // namespace tradeguard
