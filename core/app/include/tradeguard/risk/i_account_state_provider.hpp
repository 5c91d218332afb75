#pragma once

#include "tradeguard/domain/position.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IAccountStateProvider: account equity and positions
// -----------------------------------------------------------------------------
//
// @brief  Where RiskManager's account snapshot comes from.
//
// @details
// In LIVE deployments this is backed by the venue's account endpoint (an
// excluded collaborator). In PAPER mode and in tests the core's own
// PositionBook implements it.
//
// markPrice() is what sizing and the paper fill simulator price against.
// std::nullopt means no price is known; decisions on such a symbol are
// rejected with "no_mark_price".
//
// Thread model: implementations must tolerate calls from the caller of
// execute() and from the core loop concurrently.
// -----------------------------------------------------------------------------
class IAccountStateProvider {
 public:
  virtual ~IAccountStateProvider() = default;

  virtual double currentEquity() const = 0;

  // Non-flat positions only.
  virtual std::vector<domain::Position> openPositions() const = 0;

  virtual std::optional<double> markPrice(const std::string& symbol) const = 0;
};

}  // namespace tradeguard
