#pragma once

#include "tradeguard/domain/execution_mode.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/execution/execution_dispatcher.hpp"
#include "tradeguard/execution/retry_policy.hpp"
#include "tradeguard/monitor/connection_monitor.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// EngineSettings: the "engine" section
// -----------------------------------------------------------------------------
//   initial_mode           mode for new orders at startup
//   initial_equity         seeds RiskManager and the PositionBook
//   health_tick            period of the connection-health worker
//   reconnect_cooldown     minimum gap between venue.reconnect() calls
//   ipc_cmd_endpoint /
//   ipc_pub_endpoint       ZeroMQ endpoints; empty disables IPC
//   event_queue_capacity   bound of the venue event queue
//   marks                  initial mark prices per symbol
// -----------------------------------------------------------------------------
struct EngineSettings {
  domain::ExecutionMode initial_mode{domain::ExecutionMode::Paper};
  double initial_equity{10'000.0};
  std::chrono::milliseconds health_tick{1000};
  std::chrono::milliseconds reconnect_cooldown{5000};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::size_t event_queue_capacity{4096};
  std::map<std::string, double> marks;
};

struct EngineConfig {
  domain::RiskLimits risk;
  MonitorConfig monitor;
  RetryPolicy retry;
  DispatcherConfig dispatcher;
  EngineSettings engine;
};

// -----------------------------------------------------------------------------
// engineConfigFromJson(j) / loadEngineConfig(path)
// -----------------------------------------------------------------------------
// Every key is optional; a missing key keeps its default. A present key
// with the wrong type or an out-of-range value throws std::runtime_error
// naming the key ("risk.max_leverage: ..."). loadEngineConfig() also
// throws std::runtime_error when the file cannot be opened or parsed.
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j);
EngineConfig loadEngineConfig(const std::string& path);

// Inverse of engineConfigFromJson; every key is written.
nlohmann::json engineConfigToJson(const EngineConfig& config);

}  // namespace tradeguard
