#pragma once

#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// AccountSnapshot
// -----------------------------------------------------------------------------
// The account as seen at validation time. Assembled by ExecutionDispatcher
// under the account lock from IAccountStateProvider plus the tracker's open
// orders (including placements still awaiting venue acknowledgement).
//
//   marks                mark price per symbol; must contain the decision's
//                        symbol for it to be sized
//   open_order_notional  remaining qty * (limit or mark) over working orders
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  double equity{0.0};
  std::vector<domain::Position> positions;
  std::unordered_map<std::string, double> marks;
  int open_order_count{0};
  double open_order_notional{0.0};

  // Σ |net_qty| * mark over positions + open_order_notional.
  double exposure() const;

  const domain::Position* position(const std::string& symbol) const;
  std::optional<double> mark(const std::string& symbol) const;
};

// -----------------------------------------------------------------------------
// OrderIntent
// -----------------------------------------------------------------------------
// A decision turned into concrete order terms. risk_reducing is true when
// the order only shrinks an existing position (never crosses zero).
// -----------------------------------------------------------------------------
struct OrderIntent {
  domain::Side side{domain::Side::Buy};
  double qty{0.0};
  double mark_price{0.0};
  double notional{0.0};
  bool risk_reducing{false};
};

// -----------------------------------------------------------------------------
// ValidationResult = Approval | Rejection
// -----------------------------------------------------------------------------
// Rejections are data, not exceptions. Rejection::reasons holds one code
// per violated policy, in policy order.
// -----------------------------------------------------------------------------
struct Approval {
  OrderIntent intent;
};

struct Rejection {
  std::vector<std::string> reasons;
};

using ValidationResult = std::variant<Approval, Rejection>;

inline bool isApproved(const ValidationResult& r) {
  return std::holds_alternative<Approval>(r);
}

// -----------------------------------------------------------------------------
// FillOutcome
// -----------------------------------------------------------------------------
// Input to RiskManager::updateAfterFill(). equity_after, when known, is the
// account provider's equity after the fill; otherwise RiskManager adjusts
// its last equity by realized_pnl - commission.
// -----------------------------------------------------------------------------
struct FillOutcome {
  std::string symbol;
  double realized_pnl{0.0};
  double commission{0.0};
  std::optional<double> equity_after;
};

// -----------------------------------------------------------------------------
// RiskStatus: reporting view for dashboards and alerting
// -----------------------------------------------------------------------------
struct RiskStatus {
  bool kill_switch_active{false};
  std::optional<domain::KillSwitchReason> reason;
  double drawdown_pct{0.0};
  double daily_pnl{0.0};
  double current_equity{0.0};
  double daily_peak_equity{0.0};
  int daily_trade_count{0};
  bool circuit_breaker_engaged{false};
  std::string circuit_breaker_reason;
  std::vector<std::string> circuit_breaker_symbols;
};

// One entry per kill-switch activation or manual clear.
struct KillSwitchAuditEntry {
  std::int64_t at{0};
  bool activated{true};
  std::string reason;
  std::string operator_name;  // Empty for automatic activation
  std::string note;
};

}  // namespace tradeguard
