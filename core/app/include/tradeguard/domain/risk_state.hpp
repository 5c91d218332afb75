#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// KillSwitchReason
// -----------------------------------------------------------------------------
// Why the kill switch fired. Wire names (toString) are the codes reported
// in Rejection reasons, logs and telemetry.
// -----------------------------------------------------------------------------
enum class KillSwitchReason {
  MaxDrawdownExceeded,  // "max_dd_exceeded"
  StreamStale,          // "ws_stale"
  ExcessiveErrors,      // "excessive_errors"
  ManualHalt,           // "manual_halt"
};

inline const char* toString(KillSwitchReason r) {
  switch (r) {
    case KillSwitchReason::MaxDrawdownExceeded: return "max_dd_exceeded";
    case KillSwitchReason::StreamStale:         return "ws_stale";
    case KillSwitchReason::ExcessiveErrors:     return "excessive_errors";
    case KillSwitchReason::ManualHalt:          return "manual_halt";
  }
  return "unknown";
}

// Inverse of toString(). std::nullopt for an unknown code.
inline std::optional<KillSwitchReason> killSwitchReasonFromString(
    const std::string& code) {
  if (code == "max_dd_exceeded") return KillSwitchReason::MaxDrawdownExceeded;
  if (code == "ws_stale") return KillSwitchReason::StreamStale;
  if (code == "excessive_errors") return KillSwitchReason::ExcessiveErrors;
  if (code == "manual_halt") return KillSwitchReason::ManualHalt;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// RiskState: mutable per-account risk accounting
// -----------------------------------------------------------------------------
//
// @brief  Everything RiskManager knows about the account's risk posture
//         for the current UTC day.
//
// @details
// Invariants (maintained by RiskManager, the only writer):
//   - current_drawdown_pct ==
//       max(0, (daily_peak_equity - current_equity) / daily_peak_equity)
//   - daily_peak_equity is the running max of current_equity since
//     day_start_timestamp.
//   - kill_switch_active only goes false through
//     RiskManager::clearKillSwitch().
//
// The circuit breaker is separate from the kill switch: it can be released
// automatically (e.g. once reconciliation finishes) and can be scoped to
// individual symbols.
//
// Readers get copies via RiskManager::state(); there is no shared live
// reference.
// -----------------------------------------------------------------------------
struct RiskState {
  double daily_realized_pnl{0.0};
  double daily_peak_equity{0.0};
  double current_equity{0.0};
  double current_drawdown_pct{0.0};
  double open_notional_exposure{0.0};

  bool kill_switch_active{false};
  std::optional<KillSwitchReason> kill_switch_reason;
  std::string kill_switch_detail;
  std::int64_t kill_switch_at{0};  // Epoch ms of activation

  std::int64_t day_start_timestamp{0};  // UTC midnight, epoch ms
  int daily_trade_count{0};

  bool circuit_breaker_engaged{false};
  std::string circuit_breaker_reason;
  std::set<std::string> circuit_breaker_symbols;
};

}  // namespace domain
}  // namespace tradeguard
