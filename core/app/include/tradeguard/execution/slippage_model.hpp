#pragma once

#include "tradeguard/domain/order.hpp"

namespace tradeguard {

// -----------------------------------------------------------------------------
// ISlippageModel: paper fill pricing
// -----------------------------------------------------------------------------
// Returns the simulated execution price for a market order of `qty` on
// `side` when the last known mark is `mark`. Buys fill at or above the mark,
// sells at or below.
// -----------------------------------------------------------------------------
class ISlippageModel {
 public:
  virtual ~ISlippageModel() = default;

  virtual double fillPrice(domain::Side side, double mark,
                           double qty) const = 0;
};

// Constant adverse move of `bps` basis points, independent of size.
class FixedBpsSlippage final : public ISlippageModel {
 public:
  explicit FixedBpsSlippage(double bps) : bps_(bps) {}

  double fillPrice(domain::Side side, double mark,
                   double /*qty*/) const override {
    return mark * (1.0 + domain::sideSign(side) * bps_ / 10'000.0);
  }

  double bps() const { return bps_; }

 private:
  double bps_;
};

}  // namespace tradeguard
