#pragma once

#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/position.hpp"

#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IReconciler: venue state reconciliation interface
// -----------------------------------------------------------------------------
//
// @brief  Fetches the venue's authoritative view of open orders and
//         positions so local state can be rebuilt from it.
//
// @details
// Called in two situations:
//   1. The warm-up gate in TradingCore::start(), before any venue event is
//      processed: picks up positions and orders left over from a previous
//      session or a crash.
//   2. After a desync (fill for an unknown client id, invariant violation
//      while applying a venue event): from the health tick, while the
//      reconciliation circuit breaker is engaged.
//
// The core does not validate what comes back. The venue is the source of
// truth; returned orders are hydrated into OrderTracker as-is.
//
// Ownership:
//   TradingCore does NOT own the reconciler. It receives a non-owning
//   pointer in start(); the caller keeps it alive until stop().
//
// Thread model:
//   Called from one thread at a time (main during warm-up, the health
//   worker afterwards). Implementations may block on I/O.
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  // Non-flat positions per symbol. Empty means flat everywhere.
  virtual std::vector<domain::Position> reconcilePositions() = 0;

  // Every order the venue still works (Open or PartiallyFilled), with
  // client_id, venue_id and fill progress filled in.
  virtual std::vector<domain::Order> reconcileOrders() = 0;
};

}  // namespace tradeguard
