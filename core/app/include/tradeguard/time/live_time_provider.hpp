#pragma once

#include "tradeguard/time/i_time_provider.hpp"

namespace tradeguard {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Reads std::chrono::system_clock. Stateless; safe from any thread.
// Owned by TradingCore's caller (main) and borrowed by every component.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeguard
