#include "tradeguard/risk/risk_policy.hpp"

#include <cmath>

namespace tradeguard {

namespace {

// Slack for "<= limit" comparisons, so an order sized exactly at a limit
// is not rejected by rounding.
constexpr double kLimitEpsilon = 1e-9;

}  // namespace

// --- AccountSnapshot ---------------------------------------------------------

double AccountSnapshot::exposure() const {
  double total = open_order_notional;
  for (const auto& pos : positions) {
    double px = pos.mark_price;
    if (auto m = mark(pos.symbol)) {
      px = *m;
    }
    if (px <= 0.0) {
      px = pos.average_price;
    }
    total += std::abs(pos.net_quantity) * px;
  }
  return total;
}

const domain::Position* AccountSnapshot::position(
    const std::string& symbol) const {
  for (const auto& pos : positions) {
    if (pos.symbol == symbol && pos.net_quantity != 0.0) {
      return &pos;
    }
  }
  return nullptr;
}

std::optional<double> AccountSnapshot::mark(const std::string& symbol) const {
  auto it = marks.find(symbol);
  if (it == marks.end() || !(it->second > 0.0)) {
    return std::nullopt;
  }
  return it->second;
}

// --- Policies ----------------------------------------------------------------

std::optional<std::string> CircuitBreakerPolicy::evaluate(
    const RiskContext& ctx) const {
  if (ctx.state.circuit_breaker_engaged ||
      ctx.state.circuit_breaker_symbols.count(ctx.decision.symbol) != 0) {
    return std::string("circuit_breaker_engaged");
  }
  return std::nullopt;
}

std::optional<std::string> DrawdownHardLimitPolicy::evaluate(
    const RiskContext& ctx) const {
  if (ctx.state.current_drawdown_pct >= ctx.limits.drawdown_hard_limit) {
    return std::string("max_dd_exceeded");
  }
  return std::nullopt;
}

std::optional<std::string> DrawdownSoftLimitPolicy::evaluate(
    const RiskContext& ctx) const {
  if (ctx.riskReducing()) {
    return std::nullopt;
  }
  if (ctx.state.current_drawdown_pct >= ctx.limits.drawdown_soft_limit) {
    return std::string("drawdown_soft_limit");
  }
  return std::nullopt;
}

std::optional<std::string> MaxPositionSizePolicy::evaluate(
    const RiskContext& ctx) const {
  if (!ctx.intent || ctx.riskReducing()) {
    return std::nullopt;
  }
  const double cap = ctx.limits.max_position_pct * ctx.account.equity;
  if (ctx.intent->notional > cap * (1.0 + kLimitEpsilon)) {
    return std::string("max_position_size");
  }
  return std::nullopt;
}

std::optional<std::string> MaxLeveragePolicy::evaluate(
    const RiskContext& ctx) const {
  if (!ctx.intent || ctx.riskReducing() || ctx.account.equity <= 0.0) {
    return std::nullopt;
  }
  const double projected =
      ctx.state.open_notional_exposure + ctx.intent->notional;
  if (projected / ctx.account.equity >
      ctx.limits.max_leverage + kLimitEpsilon) {
    return std::string("max_leverage");
  }
  return std::nullopt;
}

std::optional<std::string> MarginPolicy::evaluate(
    const RiskContext& ctx) const {
  const double leverage = ctx.limits.instrument_leverage;
  if (leverage <= 1.0 || !ctx.intent || ctx.riskReducing() ||
      ctx.account.equity <= 0.0) {
    return std::nullopt;
  }
  const double required_margin =
      (ctx.state.open_notional_exposure + ctx.intent->notional) / leverage;
  const double free_ratio =
      (ctx.account.equity - required_margin) / ctx.account.equity;
  if (free_ratio + kLimitEpsilon < ctx.limits.min_margin_ratio) {
    return std::string("margin_floor");
  }
  return std::nullopt;
}

std::optional<std::string> MaxOpenOrdersPolicy::evaluate(
    const RiskContext& ctx) const {
  if (ctx.riskReducing()) {
    return std::nullopt;
  }
  if (ctx.account.open_order_count >= ctx.limits.max_open_orders) {
    return std::string("max_open_orders");
  }
  return std::nullopt;
}

std::optional<std::string> MaxDailyTradesPolicy::evaluate(
    const RiskContext& ctx) const {
  if (ctx.riskReducing()) {
    return std::nullopt;
  }
  if (ctx.state.daily_trade_count >= ctx.limits.max_daily_trades) {
    return std::string("max_daily_trades");
  }
  return std::nullopt;
}

std::vector<std::unique_ptr<IRiskPolicy>> makeDefaultPolicies() {
  std::vector<std::unique_ptr<IRiskPolicy>> policies;
  policies.push_back(std::make_unique<CircuitBreakerPolicy>());
  policies.push_back(std::make_unique<DrawdownHardLimitPolicy>());
  policies.push_back(std::make_unique<DrawdownSoftLimitPolicy>());
  policies.push_back(std::make_unique<MaxPositionSizePolicy>());
  policies.push_back(std::make_unique<MaxLeveragePolicy>());
  policies.push_back(std::make_unique<MarginPolicy>());
  policies.push_back(std::make_unique<MaxOpenOrdersPolicy>());
  policies.push_back(std::make_unique<MaxDailyTradesPolicy>());
  return policies;
}

}  // namespace tradeguard
