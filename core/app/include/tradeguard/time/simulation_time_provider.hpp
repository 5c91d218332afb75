#pragma once

#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly.
//
// @details
// Used by the test suites to step through staleness thresholds, error and
// reconnect windows, ack timeouts and UTC midnight without sleeping.
//
// Storage is a single std::atomic<int64_t>: writers (the test thread) and
// readers (core loop, health tick) never block each other.
//
// Monotonicity is not enforced; tests may set arbitrary times.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace tradeguard
