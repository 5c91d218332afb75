#pragma once

#include "tradeguard/concurrent/client_id_generator.hpp"
#include "tradeguard/domain/decision.hpp"
#include "tradeguard/domain/execution_mode.hpp"
#include "tradeguard/events/event.hpp"
#include "tradeguard/execution/execution_result.hpp"
#include "tradeguard/execution/i_venue_client.hpp"
#include "tradeguard/execution/retry_policy.hpp"
#include "tradeguard/execution/slippage_model.hpp"
#include "tradeguard/monitor/connection_monitor.hpp"
#include "tradeguard/risk/i_account_state_provider.hpp"
#include "tradeguard/risk/i_reconciler.hpp"
#include "tradeguard/risk/order_tracker.hpp"
#include "tradeguard/risk/position_book.hpp"
#include "tradeguard/risk/risk_manager.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// DispatcherConfig
// -----------------------------------------------------------------------------
//   ack_timeout        LIVE placement waits at most this long for the ack
//   slippage_bps       PAPER fills at mark +/- this many basis points
//   paper_fill_ratio   fraction of the order PAPER fills immediately (0, 1]
//   commission_rate    PAPER commission as a fraction of fill notional
//   commission_asset   reported on PAPER fills
// -----------------------------------------------------------------------------
struct DispatcherConfig {
  std::chrono::milliseconds ack_timeout{5000};
  double slippage_bps{5.0};
  double paper_fill_ratio{1.0};
  double commission_rate{0.001};
  std::string commission_asset{"USDT"};
};

enum class CancelOutcome {
  Requested,         // LIVE: venue accepted the request; await CancelledEvent
  CancelledLocally,  // PAPER: cancelled in the tracker
  NotFound,
  AlreadyTerminal,
  Failed,            // LIVE: venue refused or retries exhausted
};

inline const char* toString(CancelOutcome o) {
  switch (o) {
    case CancelOutcome::Requested:        return "requested";
    case CancelOutcome::CancelledLocally: return "cancelled_locally";
    case CancelOutcome::NotFound:         return "not_found";
    case CancelOutcome::AlreadyTerminal:  return "already_terminal";
    case CancelOutcome::Failed:           return "failed";
  }
  return "unknown";
}

struct CancelResult {
  CancelOutcome outcome{CancelOutcome::Failed};
  std::string detail;
};

// -----------------------------------------------------------------------------
// ExecutionDispatcher: Decision → order, in the requested mode
// -----------------------------------------------------------------------------
//
// @brief  Validates a Decision through RiskManager and routes the approved
//         order to the venue (LIVE), a local fill simulator (PAPER) or
//         nowhere (DRY_RUN). Applies the venue's event stream to
//         OrderTracker.
//
// @details
// Account lock:
//   One std::mutex (account_mutex_) guards OrderTracker, the per-order mode
//   table and the in-flight table. The account snapshot, risk validation
//   and the in-flight reservation happen under it in one step, so two
//   concurrent decisions cannot both pass against the same aggregate. The
//   venue call itself runs outside the lock.
//
// In flight:
//   Between reservation and acknowledgement a LIVE order counts toward open
//   orders and exposure but is not in the tracker. Venue events for it are
//   buffered and replayed, in order, right after registration.
//
// LIVE placement (never blindly retried):
//   ack                  → submit + acknowledge, result Submitted
//   venue refusal        → Rejected{"venue_error"}
//   transient / timeout  → getOrderStatus(client_id) with retry:
//       found Rejected             → Rejected{"venue_error"}, not tracked
//       found otherwise            → register, then catch up fills and a
//                                    Cancelled/Expired status from the answer
//       not found after a timeout  → Indeterminate
//       not found otherwise        → Rejected{"venue_error"}
//       query failed               → Indeterminate
//   Indeterminate ids stay reserved. An AcknowledgedEvent for one adopts
//   it; resolveIndeterminate() re-queries them.
//
// Desync:
//   A fill for an unknown client id, or a TrackerError while applying an
//   event, sets reconciliationRequired(), engages the circuit breaker with
//   reason "reconciliation_required" unless it is already engaged, and logs
//   CRITICAL. Each desync engages again, so releasing the breaker by hand
//   does not disarm later ones. reconcile() clears the flag.
//
// Thread model:
//   execute()/cancel() from any thread. onVenueEvent() from the core loop
//   thread. The order-update listener runs after the account lock is
//   released, on whichever thread caused the transition.
//
// Ownership:
//   Owned by TradingCore. Borrows every collaborator; all must outlive it.
// -----------------------------------------------------------------------------
class ExecutionDispatcher {
 public:
  using OrderUpdateListener = std::function<void(const OrderUpdateEvent&)>;

  ExecutionDispatcher(OrderTracker& tracker, RiskManager& risk,
                      PositionBook& book, IAccountStateProvider& account,
                      IVenueClient& venue, ClientIdGenerator& ids,
                      const ITimeProvider& clock, DispatcherConfig config,
                      RetryExecutor retry,
                      ConnectionMonitor* monitor = nullptr);

  ExecutionDispatcher(const ExecutionDispatcher&) = delete;
  ExecutionDispatcher& operator=(const ExecutionDispatcher&) = delete;
  ExecutionDispatcher(ExecutionDispatcher&&) = delete;
  ExecutionDispatcher& operator=(ExecutionDispatcher&&) = delete;

  // -------------------------------------------------------------------------
  // execute(decision, mode)
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument for a malformed decision. Every other
  //         outcome, including venue failures, is in the result.
  // -------------------------------------------------------------------------
  ExecutionResult execute(const domain::Decision& decision,
                          domain::ExecutionMode mode);

  // Best-effort cancel, routed by the mode the order was created in.
  CancelResult cancel(const domain::ClientOrderId& client_id);

  // Applies one venue stream event (Acknowledged, Fill, Cancelled,
  // Rejected, Expired). Other event types are ignored.
  void onVenueEvent(const Event& event);

  // Re-queries every Indeterminate client id. Returns how many were
  // resolved (adopted or confirmed absent).
  std::size_t resolveIndeterminate();

  // -------------------------------------------------------------------------
  // reconcile(reconciler)
  // -------------------------------------------------------------------------
  // Rebuilds open orders and positions from the venue, clears the
  // reconciliation flag and releases the reconciliation breaker. Returns
  // false if the reconciler threw; the flag then stays set.
  // -------------------------------------------------------------------------
  bool reconcile(IReconciler& reconciler);

  bool reconciliationRequired() const;

  // Raises the desync flag from outside the event path (e.g. the core
  // loop's error handler).
  void requireReconciliation(const std::string& detail);

  std::vector<domain::Order> openOrders() const;
  std::optional<domain::Order> order(const domain::ClientOrderId& id) const;
  std::optional<domain::ExecutionMode> modeOf(
      const domain::ClientOrderId& id) const;
  std::vector<domain::ClientOrderId> indeterminateIds() const;

  // Must be set before concurrent use.
  void setOrderUpdateListener(OrderUpdateListener listener);

 private:
  // Reservation for a LIVE order between placeOrder() and registration.
  struct InFlight {
    OrderSpec spec;
    double notional{0.0};
    bool indeterminate{false};
    std::vector<Event> buffered;
  };

  using Updates = std::vector<OrderUpdateEvent>;

  ExecutionResult executeDryRun(const domain::Decision& decision);
  ExecutionResult executePaper(const domain::Decision& decision);
  ExecutionResult executeLive(const domain::Decision& decision);

  // --- caller holds account_mutex_ ------------------------------------------
  AccountSnapshot snapshotLocked(const std::string& symbol) const;
  domain::Order makeOrder(const OrderSpec& spec) const;

  // submit + acknowledge + replay of buffered events.
  domain::Order registerLiveLocked(const domain::ClientOrderId& client_id,
                                   const domain::VenueOrderId& venue_id,
                                   Updates& updates);

  // Registration driven by a getOrderStatus() answer. nullopt when the
  // venue rejected the order.
  std::optional<domain::Order> adoptFoundLocked(
      const domain::ClientOrderId& client_id, const VenueOrderStatus& found,
      Updates& updates);

  void applyEventLocked(const Event& event, Updates& updates);
  void applyFillLocked(const domain::Fill& fill, Updates& updates);
  void flagReconciliationLocked(const std::string& detail);

  void pushUpdate(domain::OrderStatus previous,
                  const domain::ClientOrderId& client_id, Updates& updates);
  void emit(const Updates& updates);

  OrderTracker& tracker_;
  RiskManager& risk_;
  PositionBook& book_;
  IAccountStateProvider& account_;
  IVenueClient& venue_;
  ClientIdGenerator& ids_;
  const ITimeProvider& clock_;
  const DispatcherConfig config_;
  const RetryExecutor retry_;
  ConnectionMonitor* monitor_;
  std::unique_ptr<ISlippageModel> slippage_;

  mutable std::mutex account_mutex_;
  std::unordered_map<domain::ClientOrderId, domain::ExecutionMode> modes_;
  std::unordered_map<domain::ClientOrderId, InFlight> in_flight_;
  bool reconciliation_required_{false};
  std::uint64_t paper_seq_{0};

  OrderUpdateListener listener_;
};

}  // namespace tradeguard
