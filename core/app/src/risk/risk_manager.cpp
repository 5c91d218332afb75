#include "tradeguard/risk/risk_manager.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace tradeguard {

namespace {

// Tolerance for "qty does not exceed the opposite position".
constexpr double kQtyEpsilon = 1e-9;

std::string joinReasons(const std::vector<std::string>& reasons) {
  std::string out;
  for (const auto& r : reasons) {
    if (!out.empty()) {
      out += ", ";
    }
    out += r;
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskManager::RiskManager(const domain::RiskLimits& limits,
                         const ITimeProvider& clock, double initial_equity)
    : limits_(limits), clock_(clock), policies_(makeDefaultPolicies()) {
  state_.current_equity = initial_equity;
  state_.daily_peak_equity = initial_equity;
  state_.day_start_timestamp = utc_day_start_ms(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// checkDecision: programmer-error validation
// -----------------------------------------------------------------------------
void RiskManager::checkDecision(const domain::Decision& decision) {
  if (decision.symbol.empty()) {
    throw std::invalid_argument("decision symbol must not be empty");
  }
  if (!std::isfinite(decision.confidence) || decision.confidence < 0.0 ||
      decision.confidence > 1.0) {
    throw std::invalid_argument("decision confidence must be in [0, 1]");
  }
  if (decision.direction == domain::Direction::Exit) {
    return;
  }
  if (!std::isfinite(decision.size_hint) || decision.size_hint <= 0.0 ||
      decision.size_hint > 1.0) {
    throw std::invalid_argument("decision size_hint must be in (0, 1]");
  }
}

// -----------------------------------------------------------------------------
// sizeDecision: Decision -> OrderIntent
// -----------------------------------------------------------------------------
std::variant<OrderIntent, std::string> RiskManager::sizeDecision(
    const domain::Decision& decision, const AccountSnapshot& account) {
  checkDecision(decision);

  const domain::Position* pos = account.position(decision.symbol);

  if (decision.direction == domain::Direction::Exit) {
    if (pos == nullptr) {
      return std::string("no_position_to_exit");
    }
    double px = account.mark(decision.symbol).value_or(pos->mark_price);
    if (px <= 0.0) {
      px = pos->average_price;
    }
    OrderIntent intent;
    intent.side = pos->net_quantity > 0.0 ? domain::Side::Sell
                                          : domain::Side::Buy;
    intent.qty = std::abs(pos->net_quantity);
    intent.mark_price = px;
    intent.notional = intent.qty * px;
    intent.risk_reducing = true;
    return intent;
  }

  auto mark = account.mark(decision.symbol);
  if (!mark) {
    return std::string("no_mark_price");
  }
  if (account.equity <= 0.0) {
    return std::string("no_equity");
  }

  OrderIntent intent;
  intent.side = decision.direction == domain::Direction::Long
                    ? domain::Side::Buy
                    : domain::Side::Sell;
  intent.mark_price = *mark;
  intent.notional = decision.size_hint * account.equity;
  intent.qty = intent.notional / *mark;

  if (pos != nullptr) {
    const bool opposite =
        domain::sideSign(intent.side) * pos->net_quantity < 0.0;
    intent.risk_reducing =
        opposite && intent.qty <= std::abs(pos->net_quantity) + kQtyEpsilon;
  }
  return intent;
}

// -----------------------------------------------------------------------------
// evaluate: pure policy run
// -----------------------------------------------------------------------------
ValidationResult RiskManager::evaluate(const domain::Decision& decision,
                                       const domain::RiskState& state,
                                       const AccountSnapshot& account) const {
  checkDecision(decision);
  std::lock_guard lock(mutex_);
  return evaluateLocked(decision, state, account);
}

ValidationResult RiskManager::evaluateLocked(
    const domain::Decision& decision, const domain::RiskState& state,
    const AccountSnapshot& account) const {
  if (state.kill_switch_active) {
    return Rejection{{"kill_switch_active"}};
  }

  std::vector<std::string> reasons;
  RiskContext ctx{decision, state, account, limits_, std::nullopt};

  auto sized = sizeDecision(decision, account);
  if (auto* intent = std::get_if<OrderIntent>(&sized)) {
    ctx.intent = *intent;
  } else {
    reasons.push_back(std::get<std::string>(sized));
  }

  for (const auto& policy : policies_) {
    if (auto code = policy->evaluate(ctx)) {
      reasons.push_back(std::move(*code));
    }
  }

  if (!reasons.empty()) {
    return Rejection{std::move(reasons)};
  }
  return Approval{*ctx.intent};
}

// -----------------------------------------------------------------------------
// validate: stateful entry point
// -----------------------------------------------------------------------------
ValidationResult RiskManager::validate(const domain::Decision& decision,
                                       const AccountSnapshot& account) {
  checkDecision(decision);

  std::optional<KillSwitchEvent> fired;
  ValidationResult result;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    rollDayLocked(now);

    if (state_.kill_switch_active) {
      result = Rejection{{"kill_switch_active"}};
    } else {
      refreshEquityLocked(account.equity);
      state_.open_notional_exposure = account.exposure();
      result = evaluateLocked(decision, state_, account);
      fired = checkHardLimitLocked(now);
    }
  }
  notify(fired);

  if (const auto* rejection = std::get_if<Rejection>(&result)) {
    std::cout << "[RiskManager] rejected " << decision.symbol << " "
              << domain::toString(decision.direction) << ": "
              << joinReasons(rejection->reasons) << "\n";
  }
  return result;
}

void RiskManager::addPolicy(std::unique_ptr<IRiskPolicy> policy) {
  if (!policy) {
    throw std::invalid_argument("addPolicy: null policy");
  }
  std::lock_guard lock(mutex_);
  policies_.push_back(std::move(policy));
}

void RiskManager::recordTrade() {
  std::lock_guard lock(mutex_);
  rollDayLocked(clock_.now_ms());
  ++state_.daily_trade_count;
}

// -----------------------------------------------------------------------------
// updateAfterFill / updateEquity
// -----------------------------------------------------------------------------
void RiskManager::updateAfterFill(const FillOutcome& outcome) {
  std::optional<KillSwitchEvent> fired;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    rollDayLocked(now);

    const double net = outcome.realized_pnl - outcome.commission;
    state_.daily_realized_pnl += net;
    refreshEquityLocked(outcome.equity_after.value_or(
        state_.current_equity + net));
    fired = checkHardLimitLocked(now);
  }
  notify(fired);
}

void RiskManager::updateEquity(double equity) {
  std::optional<KillSwitchEvent> fired;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    rollDayLocked(now);
    refreshEquityLocked(equity);
    fired = checkHardLimitLocked(now);
  }
  notify(fired);
}

// -----------------------------------------------------------------------------
// evaluateConnectionHealth: runs on every health tick
// -----------------------------------------------------------------------------
void RiskManager::evaluateConnectionHealth(
    const domain::ConnectionHealth& health) {
  std::optional<KillSwitchEvent> fired;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    rollDayLocked(now);

    if (health.is_stale) {
      if (!stale_since_) {
        stale_since_ = now;
      }
      if (now - *stale_since_ >= limits_.stale_kill_grace_ms) {
        fired = activateLocked(
            domain::KillSwitchReason::StreamStale,
            "no venue update for " + std::to_string(health.stale_for_ms) +
                "ms",
            now);
      }
    } else {
      stale_since_.reset();
    }

    if (health.consecutive_errors_in_window > limits_.max_errors_in_window) {
      auto errors_fired = activateLocked(
          domain::KillSwitchReason::ExcessiveErrors,
          std::to_string(health.consecutive_errors_in_window) +
              " venue errors in window (max " +
              std::to_string(limits_.max_errors_in_window) + ")",
          now);
      if (!fired) {
        fired = std::move(errors_fired);
      }
    }

    if (health.reconnect_count_in_window > limits_.reconnect_warn_threshold) {
      if (health.reconnect_count_in_window != last_warned_reconnects_) {
        std::cerr << "[RiskManager] WARNING: "
                  << health.reconnect_count_in_window
                  << " reconnects in window (threshold "
                  << limits_.reconnect_warn_threshold << ").\n";
        last_warned_reconnects_ = health.reconnect_count_in_window;
      }
    } else {
      last_warned_reconnects_ = 0;
    }

    if (health.latency_p95_ms > limits_.latency_warn_ms) {
      if (!latency_warned_) {
        std::cerr << "[RiskManager] WARNING: p95 latency "
                  << health.latency_p95_ms << "ms above "
                  << limits_.latency_warn_ms << "ms.\n";
        latency_warned_ = true;
      }
    } else {
      latency_warned_ = false;
    }
  }
  notify(fired);
}

// -----------------------------------------------------------------------------
// Daily reset
// -----------------------------------------------------------------------------
void RiskManager::resetDaily() {
  std::lock_guard lock(mutex_);
  resetDailyLocked(clock_.now_ms());
}

bool RiskManager::rollDayIfNeeded() {
  std::lock_guard lock(mutex_);
  return rollDayLocked(clock_.now_ms());
}

void RiskManager::resetDailyLocked(std::int64_t now) {
  state_.daily_realized_pnl = 0.0;
  state_.daily_trade_count = 0;
  state_.daily_peak_equity = state_.current_equity;
  state_.current_drawdown_pct = 0.0;
  state_.day_start_timestamp = utc_day_start_ms(now);

  std::cout << "[RiskManager] daily reset: peak_equity="
            << state_.daily_peak_equity
            << (state_.kill_switch_active ? " (kill switch remains active)"
                                          : "")
            << "\n";
}

bool RiskManager::rollDayLocked(std::int64_t now) {
  if (utc_day_start_ms(now) <= state_.day_start_timestamp) {
    return false;
  }
  resetDailyLocked(now);
  return true;
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
bool RiskManager::activateKillSwitch(domain::KillSwitchReason reason,
                                     const std::string& detail) {
  std::optional<KillSwitchEvent> fired;
  {
    std::lock_guard lock(mutex_);
    fired = activateLocked(reason, detail, clock_.now_ms());
  }
  notify(fired);
  return fired.has_value();
}

bool RiskManager::clearKillSwitch(const std::string& operator_name,
                                  const std::string& note) {
  if (operator_name.empty()) {
    throw std::invalid_argument("clearKillSwitch requires an operator name");
  }

  KillSwitchEvent event;
  {
    std::lock_guard lock(mutex_);
    if (!state_.kill_switch_active) {
      std::cout << "[RiskManager] clear requested by " << operator_name
                << " but kill switch is not active.\n";
      return false;
    }

    const std::int64_t now = clock_.now_ms();
    const std::string previous =
        state_.kill_switch_reason ? domain::toString(*state_.kill_switch_reason)
                                  : "unknown";

    state_.kill_switch_active = false;
    state_.kill_switch_reason.reset();
    state_.kill_switch_detail.clear();
    state_.kill_switch_at = 0;
    stale_since_.reset();

    audit_.push_back({now, false, previous, operator_name, note});

    std::cerr << "[RiskManager] CRITICAL: kill switch (" << previous
              << ") cleared by " << operator_name << ": " << note << "\n";

    event.active = false;
    event.reason = "manual_clear";
    event.detail = operator_name + ": " + note;
    event.timestamp = now;
  }
  notify(event);
  return true;
}

bool RiskManager::isKillSwitchActive() const {
  std::lock_guard lock(mutex_);
  return state_.kill_switch_active;
}

std::optional<KillSwitchEvent> RiskManager::activateLocked(
    domain::KillSwitchReason reason, const std::string& detail,
    std::int64_t now) {
  if (state_.kill_switch_active) {
    return std::nullopt;
  }

  state_.kill_switch_active = true;
  state_.kill_switch_reason = reason;
  state_.kill_switch_detail = detail;
  state_.kill_switch_at = now;

  audit_.push_back({now, true, domain::toString(reason), "", detail});

  std::cerr << "[RiskManager] CRITICAL: kill switch activated reason="
            << domain::toString(reason) << " (" << detail << ")\n";

  KillSwitchEvent event;
  event.active = true;
  event.reason = domain::toString(reason);
  event.detail = detail;
  event.timestamp = now;
  return event;
}

std::optional<KillSwitchEvent> RiskManager::checkHardLimitLocked(
    std::int64_t now) {
  if (state_.current_drawdown_pct < limits_.drawdown_hard_limit) {
    return std::nullopt;
  }
  return activateLocked(
      domain::KillSwitchReason::MaxDrawdownExceeded,
      "daily drawdown " + std::to_string(state_.current_drawdown_pct * 100.0) +
          "% >= " + std::to_string(limits_.drawdown_hard_limit * 100.0) + "%",
      now);
}

void RiskManager::notify(const std::optional<KillSwitchEvent>& event) {
  if (event && listener_) {
    listener_(*event);
  }
}

// -----------------------------------------------------------------------------
// Circuit breaker
// -----------------------------------------------------------------------------
void RiskManager::engageCircuitBreaker(
    const std::string& reason, const std::optional<std::string>& symbol) {
  std::lock_guard lock(mutex_);
  if (symbol) {
    state_.circuit_breaker_symbols.insert(*symbol);
    std::cerr << "[RiskManager] WARNING: circuit breaker engaged for "
              << *symbol << ": " << reason << "\n";
    return;
  }
  state_.circuit_breaker_engaged = true;
  state_.circuit_breaker_reason = reason;
  std::cerr << "[RiskManager] WARNING: circuit breaker engaged: " << reason
            << "\n";
}

void RiskManager::releaseCircuitBreaker(
    const std::optional<std::string>& symbol) {
  std::lock_guard lock(mutex_);
  if (symbol) {
    state_.circuit_breaker_symbols.erase(*symbol);
    std::cout << "[RiskManager] circuit breaker released for " << *symbol
              << "\n";
    return;
  }
  state_.circuit_breaker_engaged = false;
  state_.circuit_breaker_reason.clear();
  std::cout << "[RiskManager] circuit breaker released.\n";
}

// -----------------------------------------------------------------------------
// Sizing helper
// -----------------------------------------------------------------------------
double RiskManager::suggestPositionSize(double price, double risk_pct) const {
  if (!(price > 0.0)) {
    throw std::invalid_argument("suggestPositionSize: price must be positive");
  }
  const double pct = std::min(std::max(risk_pct, 0.0), limits_.max_position_pct);
  std::lock_guard lock(mutex_);
  return std::max(0.0, pct * state_.current_equity / price);
}

// -----------------------------------------------------------------------------
// Reporting
// -----------------------------------------------------------------------------
RiskStatus RiskManager::getStatus() const {
  std::lock_guard lock(mutex_);
  RiskStatus status;
  status.kill_switch_active = state_.kill_switch_active;
  status.reason = state_.kill_switch_reason;
  status.drawdown_pct = state_.current_drawdown_pct;
  status.daily_pnl = state_.daily_realized_pnl;
  status.current_equity = state_.current_equity;
  status.daily_peak_equity = state_.daily_peak_equity;
  status.daily_trade_count = state_.daily_trade_count;
  status.circuit_breaker_engaged = state_.circuit_breaker_engaged;
  status.circuit_breaker_reason = state_.circuit_breaker_reason;
  status.circuit_breaker_symbols.assign(state_.circuit_breaker_symbols.begin(),
                                        state_.circuit_breaker_symbols.end());
  return status;
}

domain::RiskState RiskManager::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::vector<KillSwitchAuditEntry> RiskManager::auditLog() const {
  std::lock_guard lock(mutex_);
  return audit_;
}

void RiskManager::restore(const domain::RiskState& state) {
  std::lock_guard lock(mutex_);
  const domain::RiskState previous = state_;
  state_ = state;
  stale_since_.reset();

  // Only clearKillSwitch() turns the switch off.
  if (previous.kill_switch_active && !state.kill_switch_active) {
    state_.kill_switch_active = true;
    state_.kill_switch_reason = previous.kill_switch_reason;
    state_.kill_switch_detail = previous.kill_switch_detail;
    state_.kill_switch_at = previous.kill_switch_at;
    std::cerr << "[RiskManager] WARNING: restored snapshot has the kill "
                 "switch off; it stays active until an operator clears it.\n";
  }
  std::cout << "[RiskManager] state restored: equity=" << state_.current_equity
            << " kill_switch="
            << (state_.kill_switch_active ? "ACTIVE" : "off") << "\n";
}

void RiskManager::setKillSwitchListener(KillSwitchListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// refreshEquityLocked: equity → peak → drawdown
// -----------------------------------------------------------------------------
void RiskManager::refreshEquityLocked(double equity) {
  state_.current_equity = equity;
  state_.daily_peak_equity = std::max(state_.daily_peak_equity, equity);
  if (state_.daily_peak_equity > 0.0) {
    state_.current_drawdown_pct = std::max(
        0.0, (state_.daily_peak_equity - equity) / state_.daily_peak_equity);
  } else {
    state_.current_drawdown_pct = 0.0;
  }
}

}  // namespace tradeguard
