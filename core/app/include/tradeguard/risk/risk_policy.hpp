#pragma once

#include "tradeguard/domain/decision.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/domain/risk_state.hpp"
#include "tradeguard/risk/risk_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskContext: everything a policy may look at
// -----------------------------------------------------------------------------
// intent is empty when the decision could not be sized (no mark price, no
// position to exit, no equity). Sizing-dependent policies pass in that
// case; the sizing failure is already a rejection reason of its own.
// -----------------------------------------------------------------------------
struct RiskContext {
  const domain::Decision& decision;
  const domain::RiskState& state;
  const AccountSnapshot& account;
  const domain::RiskLimits& limits;
  std::optional<OrderIntent> intent;

  bool riskReducing() const { return intent && intent->risk_reducing; }
};

// -----------------------------------------------------------------------------
// IRiskPolicy: one pre-trade rule
// -----------------------------------------------------------------------------
//
// @brief  Extension point for RiskManager's policy list.
//
// @details
// evaluate() returns the rejection code when the rule is violated and
// std::nullopt when it passes. It must not throw for a violation and must
// not mutate anything: RiskManager runs every policy on every decision and
// collects all codes.
// -----------------------------------------------------------------------------
class IRiskPolicy {
 public:
  virtual ~IRiskPolicy() = default;

  virtual const char* name() const = 0;

  virtual std::optional<std::string> evaluate(const RiskContext& ctx) const = 0;
};

// --- Built-in policies, in default evaluation order --------------------------

// Global or per-symbol breaker → "circuit_breaker_engaged".
class CircuitBreakerPolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "circuit_breaker"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// drawdown >= hard limit → "max_dd_exceeded" (every decision).
class DrawdownHardLimitPolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "drawdown_hard_limit"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// drawdown >= soft limit → "drawdown_soft_limit" (risk-increasing only).
class DrawdownSoftLimitPolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "drawdown_soft_limit"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// notional > max_position_pct * equity → "max_position_size".
class MaxPositionSizePolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "max_position_size"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// (exposure + notional) / equity > max_leverage → "max_leverage".
class MaxLeveragePolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "max_leverage"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// Leveraged instruments only: free margin ratio after the order must stay
// at or above min_margin_ratio → "margin_floor".
class MarginPolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "margin"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// open orders >= max_open_orders → "max_open_orders".
class MaxOpenOrdersPolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "max_open_orders"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// trades today >= max_daily_trades → "max_daily_trades".
class MaxDailyTradesPolicy final : public IRiskPolicy {
 public:
  const char* name() const override { return "max_daily_trades"; }
  std::optional<std::string> evaluate(const RiskContext& ctx) const override;
};

// The built-in list above, in that order.
std::vector<std::unique_ptr<IRiskPolicy>> makeDefaultPolicies();

}  // namespace tradeguard
