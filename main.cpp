// -----------------------------------------------------------------------------
// tradeguard: single executable entry point.
//
//   tradeguard [config.json]
//
//   1) Load EngineConfig (defaults when no path is given).
//   2) Create the venue: an in-process SimulatedVenueClient that prices
//      market orders at the PositionBook's mark. Its events go through
//      TradingCore::onVenueEvent exactly as a real adapter's would.
//   3) Start TradingCore with the venue as its reconciler: warm-up
//      reconcile, core loop, health worker, IPC (REP + PUB). A desync is
//      repaired from the venue's book on the next health tick.
//   4) A heartbeat worker keeps the simulated stream fresh so the
//      staleness kill switch only fires when heartbeats stop.
//   5) Block until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread       → waits for SIGINT
//   core_loop thread  → venue events → OrderTracker, telemetry
//   health thread     → connection health, reconnect, reconciliation
//   heartbeat thread  → SimulatedVenueClient::heartbeat()
//   ipc thread        → operator commands and telemetry (ZeroMQ)
//
// Operators drive the core over IPC, e.g.
//   MARK BTCUSDT 50000
//   EXECUTE BTCUSDT Long 0.1
//   STATUS
// -----------------------------------------------------------------------------

#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/concurrent/periodic_worker.hpp"
#include "tradeguard/engine/trading_core.hpp"
#include "tradeguard/execution/simulated_venue_client.hpp"
#include "tradeguard/time/live_time_provider.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag, set by the SIGINT handler and polled by main(). The only
// global in the program.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  tradeguard::EngineConfig config;
  try {
    if (argc > 1) {
      config = tradeguard::loadEngineConfig(argv[1]);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 1;
  }

  tradeguard::LiveTimeProvider clock;

  // -------------------------------------------------------------------------
  // 2) Venue. The price source reads marks from the core's PositionBook,
  // which exists only once the core is constructed below.
  // -------------------------------------------------------------------------
  tradeguard::TradingCore* core_ptr = nullptr;
  tradeguard::SimulatedVenueClient venue(
      clock,
      [&core_ptr](const std::string& symbol) -> std::optional<double> {
        if (core_ptr == nullptr) {
          return std::nullopt;
        }
        return core_ptr->positionBook().markPrice(symbol);
      },
      config.dispatcher.commission_rate, config.dispatcher.commission_asset);

  // -------------------------------------------------------------------------
  // 3) Core.
  // -------------------------------------------------------------------------
  tradeguard::TradingCore core(config, venue, clock);
  core_ptr = &core;
  venue.setEventSink(core.venueEventSink());

  try {
    core.start(&venue);
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: failed to start: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Heartbeats at a quarter of the stale threshold.
  // -------------------------------------------------------------------------
  const auto heartbeat_period = std::chrono::milliseconds(
      std::max<std::int64_t>(config.monitor.stale_threshold_ms / 4, 100));
  tradeguard::PeriodicWorker heartbeat("heartbeat", heartbeat_period,
                                       [&venue] { venue.heartbeat(); });
  heartbeat.start();

  // -------------------------------------------------------------------------
  // 5) Wait for Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] tradeguard running in "
            << tradeguard::domain::toString(core.mode()) << " mode.\n"
            << "[main] Commands on " << config.engine.ipc_cmd_endpoint
            << ", telemetry on " << config.engine.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 6) Clean shutdown: heartbeats first, then the core (joins its threads).
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  heartbeat.stop();
  core.stop();

  return 0;
}
