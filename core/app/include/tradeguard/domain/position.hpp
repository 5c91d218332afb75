#pragma once

#include <cmath>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Position: per-symbol trading state
// -----------------------------------------------------------------------------
//
// @brief  Net position, average entry price, realized PnL and the last
//         known mark price for one instrument.
//
// @details
// Sign convention for net_quantity:
//   positive → long, negative → short, zero → flat.
//
// average_price is the weighted entry cost of the current position. It
// moves when the position grows, stays put when it shrinks, and resets to
// the fill price when a fill crosses zero.
//
// mark_price is the last price the account provider saw for the symbol.
// Zero means "unknown".
//
// Value type: the authoritative copy lives in PositionBook; everything else
// holds snapshots.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double net_quantity{0.0};   // Signed: +long, -short, 0=flat
  double average_price{0.0};  // Weighted avg entry price of current position
  double realized_pnl{0.0};   // Cumulative realized profit/loss
  double mark_price{0.0};     // Last known mark, 0 if unknown

  double notional() const { return std::abs(net_quantity) * mark_price; }

  double unrealizedPnl() const {
    if (net_quantity == 0.0 || mark_price == 0.0) {
      return 0.0;
    }
    return net_quantity * (mark_price - average_price);
  }
};

}  // namespace domain
}  // namespace tradeguard
