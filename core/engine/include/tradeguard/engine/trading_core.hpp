#pragma once

#include "tradeguard/concurrent/client_id_generator.hpp"
#include "tradeguard/concurrent/event_loop_thread.hpp"
#include "tradeguard/concurrent/periodic_worker.hpp"
#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/execution/execution_dispatcher.hpp"
#include "tradeguard/execution/i_venue_client.hpp"
#include "tradeguard/monitor/connection_monitor.hpp"
#include "tradeguard/network/ipc_server.hpp"
#include "tradeguard/risk/i_reconciler.hpp"
#include "tradeguard/risk/order_tracker.hpp"
#include "tradeguard/risk/position_book.hpp"
#include "tradeguard/risk/risk_manager.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// TradingCore
// -----------------------------------------------------------------------------
//
// @brief  Owns and wires the execution-and-risk core: tracker, risk
//         manager, dispatcher, connection monitor, event loop, health
//         worker and IPC surface.
//
// @details
// Thread layout:
//
//   caller threads    → execute() / cancel() / executeCommand()
//   venue adapter     → onVenueEvent(): records telemetry in the monitor,
//                       then pushes into the bounded event queue
//   core_loop thread  → applies venue events to OrderTracker (single
//                       writer), forwards telemetry to IPC
//   health thread     → runHealthCheck() every health_tick
//   ipc thread        → ZeroMQ command/telemetry loop
//
// Health tick:
//   1. Roll the UTC day if needed, mark equity to market.
//   2. ConnectionMonitor::snapshot() → RiskManager::evaluateConnectionHealth
//      (runs whether or not any decision is pending).
//   3. Stale or disconnected → venue.reconnect(), at most once per
//      reconnect_cooldown.
//   4. Reconciliation pending and a reconciler is attached → reconcile.
//   5. Indeterminate placements → re-query their status.
//
// Thread model:
//   Construct, start() and stop() from one owning thread. Everything else
//   is safe from any thread.
//
// Ownership:
//   TradingCore
//    ├── ids_, tracker_, book_, risk_, monitor_   (value members)
//    ├── dispatcher_      (unique_ptr, borrows the above and the venue)
//    ├── loop_            (EventLoopThread)
//    ├── health_worker_   (unique_ptr<PeriodicWorker>)
//    ├── ipc_server_      (unique_ptr<IpcServer>, only when configured)
//    ├── venue_           (IVenueClient&, non-owning)
//    ├── account_         (IAccountStateProvider&, book_ unless injected)
//    └── reconciler_      (IReconciler*, optional, non-owning)
// -----------------------------------------------------------------------------
class TradingCore {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config   Copied. engine.marks seed the PositionBook.
  // @param  venue    Must outlive this object.
  // @param  clock    Must outlive this object.
  // @param  account  Optional venue-backed account provider. When null the
  //                  internal PositionBook is the account.
  //
  // No threads are spawned and no sockets are opened until start().
  // -------------------------------------------------------------------------
  TradingCore(EngineConfig config, IVenueClient& venue,
              const ITimeProvider& clock,
              IAccountStateProvider* account = nullptr);

  ~TradingCore();

  TradingCore(const TradingCore&) = delete;
  TradingCore& operator=(const TradingCore&) = delete;
  TradingCore(TradingCore&&) = delete;
  TradingCore& operator=(TradingCore&&) = delete;

  // -------------------------------------------------------------------------
  // start(reconciler)
  // -------------------------------------------------------------------------
  // Startup sequence:
  //   1. Warm-up gate: if a reconciler is given, open orders and positions
  //      are rebuilt from it before any venue event is applied. Throws
  //      std::runtime_error if that fails.
  //   2. Wire event-bus subscriptions, start the core loop.
  //   3. Start IPC (if both endpoints are set) and the health worker.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // Stops the health worker, drains the core loop, then closes IPC.
  // Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Venue adapter entry point. Blocks while the event queue is full.
  void onVenueEvent(Event event);

  // A sink bound to onVenueEvent(), for the venue adapter.
  IVenueClient::EventSink venueEventSink();

  // execute() in the active mode / an explicit mode.
  ExecutionResult execute(const domain::Decision& decision);
  ExecutionResult execute(const domain::Decision& decision,
                          domain::ExecutionMode mode);

  CancelResult cancel(const domain::ClientOrderId& client_id);

  // Affects orders created after the call only.
  void setMode(domain::ExecutionMode mode);
  domain::ExecutionMode mode() const { return mode_.load(); }

  // One health tick. Called by the health worker; public for tests.
  void runHealthCheck();

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // request is a JSON object {"cmd": "...", ...} or a bare command word.
  //   PING, STATUS, HEALTH, HALT [note], CLEAR_KILL_SWITCH operator note,
  //   BREAKER_ON [reason] [symbol], BREAKER_OFF [symbol], SET_MODE mode,
  //   EXECUTE symbol direction size_hint [confidence] [reason],
  //   CANCEL client_id, MARK symbol price
  // Always returns a JSON object with "status": "ok" | "error".
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // --- Component access (tests, main) ---------------------------------------
  const OrderTracker& tracker() const { return tracker_; }
  RiskManager& riskManager() { return risk_; }
  ConnectionMonitor& connectionMonitor() { return monitor_; }
  ExecutionDispatcher& dispatcher() { return *dispatcher_; }
  PositionBook& positionBook() { return book_; }
  EventBus& eventBus() { return loop_.eventBus(); }
  const EngineConfig& config() const { return config_; }

 private:
  nlohmann::json handleCommand(const nlohmann::json& request);
  nlohmann::json statusJson() const;
  nlohmann::json healthJson() const;

  // Non-blocking publish of a core event onto the loop.
  void publishCoreEvent(Event event);

  const EngineConfig config_;
  IVenueClient& venue_;
  const ITimeProvider& clock_;

  ClientIdGenerator ids_;
  OrderTracker tracker_;
  PositionBook book_;
  IAccountStateProvider& account_;
  RiskManager risk_;
  ConnectionMonitor monitor_;
  std::unique_ptr<ExecutionDispatcher> dispatcher_;

  EventLoopThread loop_;
  std::unique_ptr<PeriodicWorker> health_worker_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
  IReconciler* reconciler_{nullptr};

  std::atomic<domain::ExecutionMode> mode_;
  std::atomic<bool> running_{false};

  std::mutex health_mutex_;
  std::int64_t last_reconnect_at_{0};
  bool reconnect_attempted_{false};
};

}  // namespace tradeguard
