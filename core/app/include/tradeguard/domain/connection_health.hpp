#pragma once

#include <cstdint>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// ConnectionHealth: venue stream telemetry snapshot
// -----------------------------------------------------------------------------
// Produced on demand by ConnectionMonitor::snapshot(). No persistence.
//
//   is_stale       now - last_update_at > stale threshold
//   stale_for_ms   now - last_update_at (0 when fresh)
//   taken_at       the "now" the snapshot was computed for
// -----------------------------------------------------------------------------
struct ConnectionHealth {
  std::int64_t last_update_at{0};
  int consecutive_errors_in_window{0};
  int reconnect_count_in_window{0};
  double latency_p95_ms{0.0};
  bool is_stale{false};
  std::int64_t stale_for_ms{0};
  bool connected{true};
  std::int64_t taken_at{0};
};

}  // namespace domain
}  // namespace tradeguard
