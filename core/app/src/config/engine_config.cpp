#include "tradeguard/config/engine_config.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tradeguard {

namespace {

// Reads section[key] into out when present. Type errors become
// std::runtime_error naming "section.key".
template <typename T>
void read(const nlohmann::json& section, const std::string& section_name,
          const char* key, T& out) {
  auto it = section.find(key);
  if (it == section.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(section_name + "." + key + ": " + e.what());
  }
}

void readMs(const nlohmann::json& section, const std::string& section_name,
            const char* key, std::chrono::milliseconds& out) {
  auto count = static_cast<std::int64_t>(out.count());
  read(section, section_name, key, count);
  out = std::chrono::milliseconds(count);
}

void require(bool ok, const std::string& key, const char* what) {
  if (!ok) {
    throw std::runtime_error(key + ": " + what);
  }
}

// Returns the named sub-object, or an empty object when absent.
nlohmann::json section(const nlohmann::json& root, const char* name) {
  auto it = root.find(name);
  if (it == root.end()) {
    return nlohmann::json::object();
  }
  if (!it->is_object()) {
    throw std::runtime_error(std::string(name) + ": must be an object");
  }
  return *it;
}

// --- risk ---------------------------------------------------------------------

void parseRisk(const nlohmann::json& s, domain::RiskLimits& r) {
  const std::string n = "risk";
  read(s, n, "max_position_pct", r.max_position_pct);
  read(s, n, "max_leverage", r.max_leverage);
  read(s, n, "drawdown_soft_limit", r.drawdown_soft_limit);
  read(s, n, "drawdown_hard_limit", r.drawdown_hard_limit);
  read(s, n, "min_margin_ratio", r.min_margin_ratio);
  read(s, n, "instrument_leverage", r.instrument_leverage);
  read(s, n, "max_open_orders", r.max_open_orders);
  read(s, n, "max_daily_trades", r.max_daily_trades);
  read(s, n, "stale_kill_grace_ms", r.stale_kill_grace_ms);
  read(s, n, "max_errors_in_window", r.max_errors_in_window);
  read(s, n, "reconnect_warn_threshold", r.reconnect_warn_threshold);
  read(s, n, "latency_warn_ms", r.latency_warn_ms);

  require(r.max_position_pct > 0.0 && r.max_position_pct <= 1.0,
          "risk.max_position_pct", "must be in (0, 1]");
  require(r.max_leverage > 0.0, "risk.max_leverage", "must be positive");
  require(r.drawdown_soft_limit > 0.0 && r.drawdown_soft_limit < 1.0,
          "risk.drawdown_soft_limit", "must be in (0, 1)");
  require(r.drawdown_hard_limit > 0.0 && r.drawdown_hard_limit < 1.0,
          "risk.drawdown_hard_limit", "must be in (0, 1)");
  require(r.drawdown_soft_limit <= r.drawdown_hard_limit,
          "risk.drawdown_soft_limit", "must not exceed drawdown_hard_limit");
  require(r.min_margin_ratio >= 0.0 && r.min_margin_ratio < 1.0,
          "risk.min_margin_ratio", "must be in [0, 1)");
  require(r.instrument_leverage >= 1.0, "risk.instrument_leverage",
          "must be >= 1");
  require(r.max_open_orders > 0, "risk.max_open_orders", "must be positive");
  require(r.max_daily_trades > 0, "risk.max_daily_trades",
          "must be positive");
  require(r.stale_kill_grace_ms >= 0, "risk.stale_kill_grace_ms",
          "must not be negative");
  require(r.max_errors_in_window >= 0, "risk.max_errors_in_window",
          "must not be negative");
  require(r.reconnect_warn_threshold >= 0, "risk.reconnect_warn_threshold",
          "must not be negative");
  require(r.latency_warn_ms > 0.0, "risk.latency_warn_ms",
          "must be positive");
}

// --- monitor ------------------------------------------------------------------

void parseMonitor(const nlohmann::json& s, MonitorConfig& m) {
  const std::string n = "monitor";
  read(s, n, "stale_threshold_ms", m.stale_threshold_ms);
  read(s, n, "error_window_ms", m.error_window_ms);
  read(s, n, "reconnect_window_ms", m.reconnect_window_ms);
  read(s, n, "latency_sample_capacity", m.latency_sample_capacity);

  require(m.stale_threshold_ms > 0, "monitor.stale_threshold_ms",
          "must be positive");
  require(m.error_window_ms > 0, "monitor.error_window_ms",
          "must be positive");
  require(m.reconnect_window_ms > 0, "monitor.reconnect_window_ms",
          "must be positive");
  require(m.latency_sample_capacity > 0, "monitor.latency_sample_capacity",
          "must be positive");
}

// --- retry --------------------------------------------------------------------

void parseRetry(const nlohmann::json& s, RetryPolicy& r) {
  const std::string n = "retry";
  read(s, n, "max_attempts", r.max_attempts);
  readMs(s, n, "base_delay_ms", r.base_delay);
  read(s, n, "multiplier", r.multiplier);
  readMs(s, n, "max_delay_ms", r.max_delay);
  read(s, n, "jitter", r.jitter);

  try {
    validateRetryPolicy(r);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("retry: ") + e.what());
  }
}

// --- dispatcher ---------------------------------------------------------------

void parseDispatcher(const nlohmann::json& s, DispatcherConfig& d) {
  const std::string n = "dispatcher";
  readMs(s, n, "ack_timeout_ms", d.ack_timeout);
  read(s, n, "slippage_bps", d.slippage_bps);
  read(s, n, "paper_fill_ratio", d.paper_fill_ratio);
  read(s, n, "commission_rate", d.commission_rate);
  read(s, n, "commission_asset", d.commission_asset);

  require(d.ack_timeout.count() > 0, "dispatcher.ack_timeout_ms",
          "must be positive");
  require(d.slippage_bps >= 0.0, "dispatcher.slippage_bps",
          "must not be negative");
  require(d.paper_fill_ratio > 0.0 && d.paper_fill_ratio <= 1.0,
          "dispatcher.paper_fill_ratio", "must be in (0, 1]");
  require(d.commission_rate >= 0.0, "dispatcher.commission_rate",
          "must not be negative");
}

// --- engine -------------------------------------------------------------------

void parseEngine(const nlohmann::json& s, EngineSettings& e) {
  const std::string n = "engine";

  std::string mode = domain::toString(e.initial_mode);
  read(s, n, "initial_mode", mode);
  auto parsed = domain::executionModeFromString(mode);
  require(parsed.has_value(), "engine.initial_mode",
          "must be DRY_RUN, PAPER or LIVE");
  e.initial_mode = *parsed;

  read(s, n, "initial_equity", e.initial_equity);
  readMs(s, n, "health_tick_ms", e.health_tick);
  readMs(s, n, "reconnect_cooldown_ms", e.reconnect_cooldown);
  read(s, n, "ipc_cmd_endpoint", e.ipc_cmd_endpoint);
  read(s, n, "ipc_pub_endpoint", e.ipc_pub_endpoint);
  read(s, n, "event_queue_capacity", e.event_queue_capacity);
  read(s, n, "marks", e.marks);

  require(e.initial_equity > 0.0, "engine.initial_equity",
          "must be positive");
  require(e.health_tick.count() > 0, "engine.health_tick_ms",
          "must be positive");
  require(e.reconnect_cooldown.count() >= 0, "engine.reconnect_cooldown_ms",
          "must not be negative");
  require(e.event_queue_capacity > 0, "engine.event_queue_capacity",
          "must be positive");
  for (const auto& [symbol, price] : e.marks) {
    require(price > 0.0, "engine.marks." + symbol, "must be positive");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// engineConfigFromJson()
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("config: top level must be an object");
  }
  EngineConfig config;
  parseRisk(section(j, "risk"), config.risk);
  parseMonitor(section(j, "monitor"), config.monitor);
  parseRetry(section(j, "retry"), config.retry);
  parseDispatcher(section(j, "dispatcher"), config.dispatcher);
  parseEngine(section(j, "engine"), config.engine);
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open " + path);
  }

  nlohmann::json j;
  try {
    // parse() throws nlohmann::json::parse_error on malformed input.
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("config: " + path + ": " + e.what());
  }

  EngineConfig config = engineConfigFromJson(j);
  std::cout << "[main] config loaded from " << path << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// engineConfigToJson()
// -----------------------------------------------------------------------------
nlohmann::json engineConfigToJson(const EngineConfig& c) {
  nlohmann::json j;
  j["risk"] = {
      {"max_position_pct", c.risk.max_position_pct},
      {"max_leverage", c.risk.max_leverage},
      {"drawdown_soft_limit", c.risk.drawdown_soft_limit},
      {"drawdown_hard_limit", c.risk.drawdown_hard_limit},
      {"min_margin_ratio", c.risk.min_margin_ratio},
      {"instrument_leverage", c.risk.instrument_leverage},
      {"max_open_orders", c.risk.max_open_orders},
      {"max_daily_trades", c.risk.max_daily_trades},
      {"stale_kill_grace_ms", c.risk.stale_kill_grace_ms},
      {"max_errors_in_window", c.risk.max_errors_in_window},
      {"reconnect_warn_threshold", c.risk.reconnect_warn_threshold},
      {"latency_warn_ms", c.risk.latency_warn_ms},
  };
  j["monitor"] = {
      {"stale_threshold_ms", c.monitor.stale_threshold_ms},
      {"error_window_ms", c.monitor.error_window_ms},
      {"reconnect_window_ms", c.monitor.reconnect_window_ms},
      {"latency_sample_capacity", c.monitor.latency_sample_capacity},
  };
  j["retry"] = {
      {"max_attempts", c.retry.max_attempts},
      {"base_delay_ms", c.retry.base_delay.count()},
      {"multiplier", c.retry.multiplier},
      {"max_delay_ms", c.retry.max_delay.count()},
      {"jitter", c.retry.jitter},
  };
  j["dispatcher"] = {
      {"ack_timeout_ms", c.dispatcher.ack_timeout.count()},
      {"slippage_bps", c.dispatcher.slippage_bps},
      {"paper_fill_ratio", c.dispatcher.paper_fill_ratio},
      {"commission_rate", c.dispatcher.commission_rate},
      {"commission_asset", c.dispatcher.commission_asset},
  };
  j["engine"] = {
      {"initial_mode", domain::toString(c.engine.initial_mode)},
      {"initial_equity", c.engine.initial_equity},
      {"health_tick_ms", c.engine.health_tick.count()},
      {"reconnect_cooldown_ms", c.engine.reconnect_cooldown.count()},
      {"ipc_cmd_endpoint", c.engine.ipc_cmd_endpoint},
      {"ipc_pub_endpoint", c.engine.ipc_pub_endpoint},
      {"event_queue_capacity", c.engine.event_queue_capacity},
      {"marks", c.engine.marks},
  };
  return j;
}

}  // namespace tradeguard
