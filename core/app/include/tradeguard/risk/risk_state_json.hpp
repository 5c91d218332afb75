#pragma once

#include "tradeguard/domain/risk_state.hpp"
#include "tradeguard/risk/risk_types.hpp"

#include <nlohmann/json.hpp>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState <-> JSON
// -----------------------------------------------------------------------------
// Found by nlohmann::json through ADL, so `nlohmann::json j = state;` and
// `j.get<domain::RiskState>()` work directly. The document is what an
// external persistence collaborator stores across restarts; feed it back
// through RiskManager::restore().
//
// kill_switch_reason is written as its code ("max_dd_exceeded", ...) or
// null. from_json throws nlohmann::json::exception for missing keys or
// wrong types and std::runtime_error for an unknown reason code.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RiskState& state);
void from_json(const nlohmann::json& j, RiskState& state);

}  // namespace domain

// Reporting view, used by the STATUS command.
nlohmann::json riskStatusToJson(const RiskStatus& status);

}  // namespace tradeguard
