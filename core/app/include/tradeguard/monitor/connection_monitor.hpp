#pragma once

#include "tradeguard/domain/connection_health.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// MonitorConfig
// -----------------------------------------------------------------------------
//   stale_threshold_ms       silence longer than this marks the stream stale
//   error_window_ms          trailing window for the error count
//   reconnect_window_ms      trailing window for the reconnect count
//   latency_sample_capacity  most recent latency samples kept for p95
// -----------------------------------------------------------------------------
struct MonitorConfig {
  std::int64_t stale_threshold_ms{60'000};
  std::int64_t error_window_ms{60'000};
  std::int64_t reconnect_window_ms{3'600'000};
  std::size_t latency_sample_capacity{256};
};

// -----------------------------------------------------------------------------
// ConnectionMonitor: venue stream health telemetry
// -----------------------------------------------------------------------------
//
// @brief  Turns raw connection observations into ConnectionHealth snapshots.
//
// @details
// The venue adapter (through TradingCore's event sink) calls the record*
// methods as events arrive; snapshot() derives health from them on demand
// against the injected clock.
//
// Staleness depends only on the time since the last recordUpdate(). Errors
// do not make a stream stale and updates do not clear the error count: a
// silent connection and an erroring one are detected independently.
//
// Error and reconnect counts are trailing windows of event timestamps,
// pruned lazily on each call.
//
// Thread model:
//   Internally synchronised with one std::mutex. Safe from any thread.
//
// Ownership:
//   Owned by TradingCore. Borrows the time provider.
// -----------------------------------------------------------------------------
class ConnectionMonitor {
 public:
  // last_update_at starts at construction time, so a stream that never
  // delivers anything goes stale after stale_threshold_ms.
  ConnectionMonitor(const ITimeProvider& clock, MonitorConfig config = {});

  ConnectionMonitor(const ConnectionMonitor&) = delete;
  ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;
  ConnectionMonitor(ConnectionMonitor&&) = delete;
  ConnectionMonitor& operator=(ConnectionMonitor&&) = delete;

  // Any frame from the venue (fill, ack, heartbeat, market data).
  void recordUpdate();

  void recordError();

  void recordReconnect();

  // Round-trip or venue-to-adapter delay. Negative or non-finite samples
  // are ignored.
  void recordLatency(double latency_ms);

  // ConnectionUp / ConnectionDown. Informational: reported in the snapshot
  // but staleness is still driven by recordUpdate() alone.
  void setConnected(bool connected);

  domain::ConnectionHealth snapshot() const;

  const MonitorConfig& config() const { return config_; }

 private:
  // Drops window entries older than now - window. Caller holds mutex_.
  static void prune(std::deque<std::int64_t>& stamps, std::int64_t now,
                    std::int64_t window);

  double p95Locked() const;

  const ITimeProvider& clock_;
  const MonitorConfig config_;

  mutable std::mutex mutex_;
  std::int64_t last_update_at_;
  mutable std::deque<std::int64_t> error_stamps_;
  mutable std::deque<std::int64_t> reconnect_stamps_;
  std::deque<double> latency_samples_;
  bool connected_{true};
};

}  // namespace tradeguard
