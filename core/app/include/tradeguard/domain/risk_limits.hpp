#pragma once

#include <cstdint>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: account-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Parameters for pre-trade policies and for the automatic
//         kill-switch triggers.
//
// @details
// All percentages are fractions (0.05 == 5%). Loaded from the "risk"
// section of the engine config (see engine_config.hpp); the defaults are
// the values the bot shipped with.
//
// Copied by value into RiskManager at construction. Immutable afterwards.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Max notional of a single order as a fraction of equity.
  double max_position_pct{0.05};

  /// Max (open exposure + proposed notional) / equity.
  double max_leverage{3.0};

  /// At or above this daily drawdown, only risk-reducing decisions pass.
  double drawdown_soft_limit{0.15};

  /// At or above this daily drawdown the kill switch fires (max_dd_exceeded).
  double drawdown_hard_limit{0.20};

  /// Free-margin floor for leveraged instruments. Checked only when
  /// instrument_leverage > 1.
  double min_margin_ratio{0.05};

  /// Venue leverage applied to new positions. 1.0 means cash trading.
  double instrument_leverage{1.0};

  /// Orders open on the venue (including in-flight placements).
  int max_open_orders{10};

  /// Orders accepted by risk per UTC day.
  int max_daily_trades{100};

  /// How long the stream may stay stale before the kill switch fires.
  /// 0 fires on the first stale health tick.
  std::int64_t stale_kill_grace_ms{0};

  /// Venue errors tolerated inside the monitor's error window. One more
  /// fires the kill switch (excessive_errors).
  int max_errors_in_window{3};

  /// Reconnects per reconnect window above which a warning is logged.
  int reconnect_warn_threshold{6};

  /// p95 latency above which a warning is logged.
  double latency_warn_ms{2000.0};
};

}  // namespace domain
}  // namespace tradeguard
