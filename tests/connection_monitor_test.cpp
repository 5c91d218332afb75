// =============================================================================
// connection_monitor_test.cpp
// =============================================================================
// Unit tests for tradeguard::ConnectionMonitor.
//
// Validates:
//   - Staleness is strictly "silence > threshold" and counts from
//     construction when nothing ever arrives
//   - Errors and staleness are independent
//   - Error and reconnect counts are trailing windows
//   - p95 latency over the bounded sample buffer
//   - Connected flag is reported but does not affect staleness
//   - A stale snapshot handed to RiskManager fires ws_stale
// =============================================================================

#include "tradeguard/monitor/connection_monitor.hpp"
#include "tradeguard/risk/risk_manager.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

class ConnectionMonitorTest : public ::testing::Test {
 protected:
  static tradeguard::MonitorConfig config() {
    tradeguard::MonitorConfig c;
    c.stale_threshold_ms = 60'000;
    c.error_window_ms = 10'000;
    c.reconnect_window_ms = 100'000;
    c.latency_sample_capacity = 20;
    return c;
  }

  tradeguard::SimulationTimeProvider clock{1'000'000};
  tradeguard::ConnectionMonitor monitor{clock, config()};
};

// -----------------------------------------------------------------------------
// 1. Invalid thresholds are rejected at construction.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, InvalidConfigThrows) {
  auto c = config();
  c.stale_threshold_ms = 0;
  EXPECT_THROW(tradeguard::ConnectionMonitor(clock, c), std::invalid_argument);

  c = config();
  c.latency_sample_capacity = 0;
  EXPECT_THROW(tradeguard::ConnectionMonitor(clock, c), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Exactly at the threshold is still fresh; one millisecond later is stale.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, StaleBoundaryIsStrict) {
  monitor.recordUpdate();

  clock.advance_by(60'000);
  EXPECT_FALSE(monitor.snapshot().is_stale);
  EXPECT_EQ(monitor.snapshot().stale_for_ms, 0);

  clock.advance_by(1);
  auto health = monitor.snapshot();
  EXPECT_TRUE(health.is_stale);
  EXPECT_EQ(health.stale_for_ms, 60'001);
  EXPECT_EQ(health.last_update_at, 1'000'000);
  EXPECT_EQ(health.taken_at, 1'060'001);

  monitor.recordUpdate();
  EXPECT_FALSE(monitor.snapshot().is_stale);
}

// -----------------------------------------------------------------------------
// 3. A stream that never delivers goes stale relative to construction.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, NeverUpdatedGoesStale) {
  clock.advance_by(61'000);
  EXPECT_TRUE(monitor.snapshot().is_stale);
}

// -----------------------------------------------------------------------------
// 4. Errors do not make the stream stale, and updates do not clear errors.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, ErrorsAndStalenessAreIndependent) {
  monitor.recordError();
  monitor.recordError();
  monitor.recordUpdate();

  auto health = monitor.snapshot();
  EXPECT_FALSE(health.is_stale);
  EXPECT_EQ(health.consecutive_errors_in_window, 2);
}

// -----------------------------------------------------------------------------
// 5. Errors older than the window drop out of the count.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, ErrorWindowTrails) {
  monitor.recordError();
  clock.advance_by(6'000);
  monitor.recordError();
  EXPECT_EQ(monitor.snapshot().consecutive_errors_in_window, 2);

  clock.advance_by(5'000);  // first error is now 11s old
  EXPECT_EQ(monitor.snapshot().consecutive_errors_in_window, 1);

  clock.advance_by(10'000);
  EXPECT_EQ(monitor.snapshot().consecutive_errors_in_window, 0);
}

// -----------------------------------------------------------------------------
// 6. Reconnects are counted over their own, longer window.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, ReconnectWindowTrails) {
  monitor.recordReconnect();
  clock.advance_by(50'000);
  monitor.recordReconnect();
  EXPECT_EQ(monitor.snapshot().reconnect_count_in_window, 2);

  clock.advance_by(60'000);
  EXPECT_EQ(monitor.snapshot().reconnect_count_in_window, 1);
}

// -----------------------------------------------------------------------------
// 7. p95 is nearest-rank over the most recent samples; junk is ignored.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, LatencyP95) {
  EXPECT_DOUBLE_EQ(monitor.snapshot().latency_p95_ms, 0.0);

  for (int i = 1; i <= 20; ++i) {
    monitor.recordLatency(static_cast<double>(i));
  }
  // rank ceil(0.95 * 20) = 19
  EXPECT_DOUBLE_EQ(monitor.snapshot().latency_p95_ms, 19.0);

  monitor.recordLatency(-5.0);
  monitor.recordLatency(std::numeric_limits<double>::quiet_NaN());
  EXPECT_DOUBLE_EQ(monitor.snapshot().latency_p95_ms, 19.0);

  // Capacity 20: pushing twenty 1000s evicts every earlier sample.
  for (int i = 0; i < 20; ++i) {
    monitor.recordLatency(1000.0);
  }
  EXPECT_DOUBLE_EQ(monitor.snapshot().latency_p95_ms, 1000.0);
}

// -----------------------------------------------------------------------------
// 8. Connection down is reported but staleness still follows updates.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, ConnectedFlagIsInformational) {
  monitor.setConnected(false);
  auto health = monitor.snapshot();
  EXPECT_FALSE(health.connected);
  EXPECT_FALSE(health.is_stale);

  monitor.setConnected(true);
  EXPECT_TRUE(monitor.snapshot().connected);
}

// -----------------------------------------------------------------------------
// 9. 61s of silence with a 60s threshold: the snapshot is stale and
//    RiskManager fires the kill switch with ws_stale.
// -----------------------------------------------------------------------------
TEST_F(ConnectionMonitorTest, StaleSnapshotFiresKillSwitch) {
  tradeguard::domain::RiskLimits limits;
  limits.stale_kill_grace_ms = 0;
  tradeguard::RiskManager risk(limits, clock, 10'000.0);

  monitor.recordUpdate();
  clock.advance_by(61'000);

  auto health = monitor.snapshot();
  ASSERT_TRUE(health.is_stale);
  EXPECT_EQ(health.stale_for_ms, 61'000);

  risk.evaluateConnectionHealth(health);
  auto state = risk.state();
  EXPECT_TRUE(state.kill_switch_active);
  ASSERT_TRUE(state.kill_switch_reason.has_value());
  EXPECT_EQ(*state.kill_switch_reason,
            tradeguard::domain::KillSwitchReason::StreamStale);
  EXPECT_STREQ(tradeguard::domain::toString(*state.kill_switch_reason),
               "ws_stale");
}
