#include "tradeguard/risk/risk_state_json.hpp"

#include <stdexcept>
#include <string>

namespace tradeguard {
namespace domain {

void to_json(nlohmann::json& j, const RiskState& state) {
  j = nlohmann::json{
      {"daily_realized_pnl", state.daily_realized_pnl},
      {"daily_peak_equity", state.daily_peak_equity},
      {"current_equity", state.current_equity},
      {"current_drawdown_pct", state.current_drawdown_pct},
      {"open_notional_exposure", state.open_notional_exposure},
      {"kill_switch_active", state.kill_switch_active},
      {"kill_switch_detail", state.kill_switch_detail},
      {"kill_switch_at", state.kill_switch_at},
      {"day_start_timestamp", state.day_start_timestamp},
      {"daily_trade_count", state.daily_trade_count},
      {"circuit_breaker_engaged", state.circuit_breaker_engaged},
      {"circuit_breaker_reason", state.circuit_breaker_reason},
      {"circuit_breaker_symbols", state.circuit_breaker_symbols},
  };
  if (state.kill_switch_reason) {
    j["kill_switch_reason"] = toString(*state.kill_switch_reason);
  } else {
    j["kill_switch_reason"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, RiskState& state) {
  j.at("daily_realized_pnl").get_to(state.daily_realized_pnl);
  j.at("daily_peak_equity").get_to(state.daily_peak_equity);
  j.at("current_equity").get_to(state.current_equity);
  j.at("current_drawdown_pct").get_to(state.current_drawdown_pct);
  j.at("open_notional_exposure").get_to(state.open_notional_exposure);
  j.at("kill_switch_active").get_to(state.kill_switch_active);
  j.at("kill_switch_detail").get_to(state.kill_switch_detail);
  j.at("kill_switch_at").get_to(state.kill_switch_at);
  j.at("day_start_timestamp").get_to(state.day_start_timestamp);
  j.at("daily_trade_count").get_to(state.daily_trade_count);
  j.at("circuit_breaker_engaged").get_to(state.circuit_breaker_engaged);
  j.at("circuit_breaker_reason").get_to(state.circuit_breaker_reason);
  j.at("circuit_breaker_symbols").get_to(state.circuit_breaker_symbols);

  const auto& reason = j.at("kill_switch_reason");
  if (reason.is_null()) {
    state.kill_switch_reason.reset();
  } else {
    const auto code = reason.get<std::string>();
    state.kill_switch_reason = killSwitchReasonFromString(code);
    if (!state.kill_switch_reason) {
      throw std::runtime_error("unknown kill_switch_reason: " + code);
    }
  }
}

}  // namespace domain

nlohmann::json riskStatusToJson(const RiskStatus& status) {
  nlohmann::json j;
  j["kill_switch_active"] = status.kill_switch_active;
  j["reason"] = status.reason ? nlohmann::json(domain::toString(*status.reason))
                              : nlohmann::json(nullptr);
  j["drawdown_pct"] = status.drawdown_pct;
  j["daily_pnl"] = status.daily_pnl;
  j["current_equity"] = status.current_equity;
  j["daily_peak_equity"] = status.daily_peak_equity;
  j["daily_trade_count"] = status.daily_trade_count;
  j["circuit_breaker_engaged"] = status.circuit_breaker_engaged;
  j["circuit_breaker_reason"] = status.circuit_breaker_reason;
  j["circuit_breaker_symbols"] = status.circuit_breaker_symbols;
  return j;
}

}  // namespace tradeguard
