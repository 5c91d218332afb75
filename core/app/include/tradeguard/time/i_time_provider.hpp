#pragma once

#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" away from std::chrono::system_clock.
//
// @details
// Staleness, rolling windows, order timestamps and the UTC day boundary all
// depend on the current time. Components take `const ITimeProvider&` and
// call now_ms(); production injects LiveTimeProvider, tests inject
// SimulationTimeProvider and move time by hand, so a 61-second silence or a
// midnight rollover takes no wall-clock time to test.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch (UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradeguard
