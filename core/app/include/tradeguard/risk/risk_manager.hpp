#pragma once

#include "tradeguard/domain/connection_health.hpp"
#include "tradeguard/domain/decision.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/domain/risk_state.hpp"
#include "tradeguard/events/core_events.hpp"
#include "tradeguard/risk/risk_policy.hpp"
#include "tradeguard/risk/risk_types.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskManager: pre-trade policies, drawdown lock, circuit breaker and
//               kill-switch state machine
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a Decision may become an order, and owns the
//         account's RiskState.
//
// @details
// Pre-trade:
//   validate() turns a Decision into an OrderIntent (side, qty, notional,
//   risk-reducing or not) and runs every policy in order. All policies run;
//   the Rejection lists every violated code. If the kill switch is already
//   active the answer is Rejection{"kill_switch_active"} and nothing else
//   is evaluated.
//
// Post-trade:
//   updateAfterFill() folds realized PnL and commission into the daily
//   figures, moves the peak, recomputes drawdown and fires the kill switch
//   (max_dd_exceeded) at the hard limit.
//
// Connection health:
//   evaluateConnectionHealth() runs on every health tick, with or without
//   pending decisions. Stale stream beyond the grace period fires ws_stale;
//   too many errors in the window fires excessive_errors. Reconnect rate
//   and latency only warn.
//
// Kill switch:
//   Sticky. Nothing in this class clears it except clearKillSwitch(), which
//   requires an operator name and is written to the audit trail.
//   resetDaily() and day rollover leave it alone.
//
// Day boundary:
//   Every entry point first calls rollDayIfNeeded(): when the clock has
//   passed the next UTC midnight, resetDaily() runs once.
//
// Thread model:
//   Internally synchronised with one std::mutex; every public method is
//   safe from any thread. The kill-switch listener is invoked after the
//   mutex is released, on the thread that caused the activation.
//
// Ownership:
//   Owned by TradingCore. Owns its RiskState and policy list. Borrows the
//   time provider.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  using KillSwitchListener = std::function<void(const KillSwitchEvent&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  limits          Copied.
  // @param  clock           Must outlive this object.
  // @param  initial_equity  Seeds current_equity and daily_peak_equity.
  //
  // The default policy list (makeDefaultPolicies()) is installed.
  // -------------------------------------------------------------------------
  RiskManager(const domain::RiskLimits& limits, const ITimeProvider& clock,
              double initial_equity);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // -------------------------------------------------------------------------
  // validate(decision, account)
  // -------------------------------------------------------------------------
  // @brief  Stateful pre-trade check against the owned RiskState.
  //
  // @details
  //   1. Roll the day if needed.
  //   2. Kill switch active → Rejection{"kill_switch_active"}.
  //   3. Refresh equity, peak, drawdown and exposure from `account`.
  //   4. evaluate() against the refreshed state.
  //   5. Drawdown at the hard limit → activate kill switch.
  //
  // @throws std::invalid_argument for a malformed decision.
  // -------------------------------------------------------------------------
  ValidationResult validate(const domain::Decision& decision,
                            const AccountSnapshot& account);

  // -------------------------------------------------------------------------
  // evaluate(decision, state, account)
  // -------------------------------------------------------------------------
  // @brief  Pure policy evaluation against a caller-supplied RiskState.
  //
  // @details
  // No side effects: does not refresh, count or fire anything. validate()
  // is built on it; tests and what-if tooling may call it directly.
  //
  // @throws std::invalid_argument for a malformed decision.
  // -------------------------------------------------------------------------
  ValidationResult evaluate(const domain::Decision& decision,
                            const domain::RiskState& state,
                            const AccountSnapshot& account) const;

  // -------------------------------------------------------------------------
  // sizeDecision(decision, account)
  // -------------------------------------------------------------------------
  // @brief  Decision → OrderIntent, or the reason it cannot be sized.
  //
  //   Long/Short: notional = size_hint * equity, qty = notional / mark.
  //   Exit:       opposite side, qty = |position|, always risk-reducing.
  //
  // A Long/Short against an opposite position is risk-reducing when its
  // qty does not exceed the position.
  // -------------------------------------------------------------------------
  static std::variant<OrderIntent, std::string> sizeDecision(
      const domain::Decision& decision, const AccountSnapshot& account);

  // Throws std::invalid_argument when the decision is malformed.
  static void checkDecision(const domain::Decision& decision);

  // Appends a policy. Evaluated after the existing ones.
  void addPolicy(std::unique_ptr<IRiskPolicy> policy);

  // Counts one order actually sent (PAPER or LIVE) toward max_daily_trades.
  void recordTrade();

  // -------------------------------------------------------------------------
  // updateAfterFill(outcome)
  // -------------------------------------------------------------------------
  //   daily_realized_pnl += realized_pnl - commission
  //   current_equity      = equity_after, or += realized_pnl - commission
  //   daily_peak_equity   = max(peak, current_equity)
  //   current_drawdown_pct recomputed; hard limit fires the kill switch.
  // -------------------------------------------------------------------------
  void updateAfterFill(const FillOutcome& outcome);

  // Mark-to-market equity refresh between fills (no PnL booked).
  void updateEquity(double equity);

  void evaluateConnectionHealth(const domain::ConnectionHealth& health);

  // -------------------------------------------------------------------------
  // resetDaily()
  // -------------------------------------------------------------------------
  // Zeroes daily_realized_pnl and daily_trade_count, sets
  // daily_peak_equity = current_equity, anchors day_start_timestamp to the
  // current UTC midnight. Never touches the kill switch.
  // -------------------------------------------------------------------------
  void resetDaily();

  // Runs resetDaily() if the clock is past the current day. Returns true if
  // it did.
  bool rollDayIfNeeded();

  // -------------------------------------------------------------------------
  // Kill switch
  // -------------------------------------------------------------------------
  // activateKillSwitch() is idempotent: the first reason sticks and later
  // calls return false. clearKillSwitch() requires a non-empty operator
  // name (std::invalid_argument otherwise) and returns false when the
  // switch was not active.
  // -------------------------------------------------------------------------
  bool activateKillSwitch(domain::KillSwitchReason reason,
                          const std::string& detail);
  bool clearKillSwitch(const std::string& operator_name,
                       const std::string& note);
  bool isKillSwitchActive() const;

  // -------------------------------------------------------------------------
  // Circuit breaker
  // -------------------------------------------------------------------------
  // With a symbol the breaker gates only that symbol; without one it gates
  // everything. release with no symbol clears only the global breaker.
  // -------------------------------------------------------------------------
  void engageCircuitBreaker(const std::string& reason,
                            const std::optional<std::string>& symbol =
                                std::nullopt);
  void releaseCircuitBreaker(const std::optional<std::string>& symbol =
                                 std::nullopt);

  // qty for risk_pct of equity at price, capped at max_position_pct.
  double suggestPositionSize(double price, double risk_pct) const;

  RiskStatus getStatus() const;
  domain::RiskState state() const;
  std::vector<KillSwitchAuditEntry> auditLog() const;
  const domain::RiskLimits& limits() const { return limits_; }

  // Replaces the state wholesale (restart). A kill switch active before the
  // call stays active, with its reason, even if the snapshot has it off.
  void restore(const domain::RiskState& state);

  // Must be set before concurrent use.
  void setKillSwitchListener(KillSwitchListener listener);

 private:
  // --- helpers; caller holds mutex_ -----------------------------------------
  ValidationResult evaluateLocked(const domain::Decision& decision,
                                  const domain::RiskState& state,
                                  const AccountSnapshot& account) const;
  void refreshEquityLocked(double equity);
  void resetDailyLocked(std::int64_t now);
  bool rollDayLocked(std::int64_t now);

  // Returns the event to publish once mutex_ is released.
  std::optional<KillSwitchEvent> activateLocked(domain::KillSwitchReason reason,
                                                const std::string& detail,
                                                std::int64_t now);
  std::optional<KillSwitchEvent> checkHardLimitLocked(std::int64_t now);

  void notify(const std::optional<KillSwitchEvent>& event);

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  domain::RiskState state_;
  std::vector<std::unique_ptr<IRiskPolicy>> policies_;
  std::vector<KillSwitchAuditEntry> audit_;

  // Health-tick bookkeeping.
  std::optional<std::int64_t> stale_since_;
  int last_warned_reconnects_{0};
  bool latency_warned_{false};

  KillSwitchListener listener_;
};

}  // namespace tradeguard
