// =============================================================================
// execution_dispatcher_test.cpp
// =============================================================================
// Unit tests for tradeguard::ExecutionDispatcher.
//
// Validates:
//   - DRY_RUN never touches the venue or the tracker
//   - PAPER fills locally with slippage and commission, cancels locally
//   - LIVE registers only after the ack and is never blindly retried
//   - Timeout + status query: found, not found (indeterminate), refused
//   - A found order takes the venue's status: rejected is not tracked,
//     missed fills are caught up, cancelled/expired is applied
//   - Indeterminate ids stay reserved and are adopted or released later
//   - Stream events that race the ack are buffered and replayed
//   - Unknown-client fills raise the desync flag and the breaker, again
//     after the breaker was released by hand
//   - Replayed fills change nothing
//   - Concurrent decisions cannot both pass against the same aggregate
//
// Threading model:
//   All tests drive the dispatcher from the test thread except the
//   concurrency test, which joins its threads before asserting.
// =============================================================================

#include "tradeguard/execution/execution_dispatcher.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tradeguard::CancelOutcome;
using tradeguard::ExecutionStatus;
using tradeguard::VenueError;
using tradeguard::VenueErrorCode;
using tradeguard::domain::Direction;
using tradeguard::domain::ExecutionMode;
using tradeguard::domain::OrderStatus;

namespace {

tradeguard::domain::Decision decide(const std::string& symbol, Direction dir,
                                    double size_hint = 0.05) {
  tradeguard::domain::Decision d;
  d.symbol = symbol;
  d.direction = dir;
  d.size_hint = size_hint;
  d.confidence = 0.7;
  d.reason = "unit";
  return d;
}

tradeguard::FillEvent fillEvent(const std::string& client_id, double qty,
                                double price, const std::string& fill_id,
                                bool is_final = false) {
  tradeguard::domain::Fill fill;
  fill.order_client_id = client_id;
  fill.fill_id = fill_id;
  fill.qty = qty;
  fill.price = price;
  fill.commission = 0.5;
  fill.commission_asset = "USDT";
  fill.is_final = is_final;
  return tradeguard::FillEvent{fill};
}

}  // namespace

class ExecutionDispatcherTest : public ::testing::Test {
 protected:
  ExecutionDispatcherTest() {
    book.updateMark("BTCUSDT", 100.0);
    book.updateMark("ETHUSDT", 10.0);
    rebuild({});
  }

  static tradeguard::domain::RiskLimits limits() {
    tradeguard::domain::RiskLimits l;
    l.max_position_pct = 0.05;
    l.max_open_orders = 3;
    l.max_daily_trades = 50;
    return l;
  }

  // Recreates risk and dispatcher with the given overrides.
  void rebuild(tradeguard::DispatcherConfig cfg,
               tradeguard::domain::RiskLimits l = limits()) {
    dispatcher.reset();
    risk = std::make_unique<tradeguard::RiskManager>(l, clock, 10'000.0);
    dispatcher = std::make_unique<tradeguard::ExecutionDispatcher>(
        tracker, *risk, book, book, venue, ids, clock, cfg,
        tradeguard::test::instantRetry(), &monitor);
    dispatcher->setOrderUpdateListener(
        [this](const tradeguard::OrderUpdateEvent& e) {
          std::lock_guard lock(updates_mutex);
          updates.push_back(e);
        });
  }

  std::vector<tradeguard::OrderUpdateEvent> takeUpdates() {
    std::lock_guard lock(updates_mutex);
    auto out = updates;
    updates.clear();
    return out;
  }

  tradeguard::SimulationTimeProvider clock{1'700'000'000'000};
  tradeguard::OrderTracker tracker{clock};
  tradeguard::PositionBook book{10'000.0};
  tradeguard::test::FakeVenueClient venue;
  tradeguard::ClientIdGenerator ids{1};
  tradeguard::ConnectionMonitor monitor{clock};
  std::unique_ptr<tradeguard::RiskManager> risk;
  std::unique_ptr<tradeguard::ExecutionDispatcher> dispatcher;

  std::mutex updates_mutex;
  std::vector<tradeguard::OrderUpdateEvent> updates;
};

// -----------------------------------------------------------------------------
// 1. DRY_RUN: approved, sized, and nothing is sent or tracked.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, DryRunMakesNoVenueCalls) {
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::DryRun);

  EXPECT_EQ(r.status, ExecutionStatus::DryRun);
  EXPECT_EQ(r.mode, ExecutionMode::DryRun);
  EXPECT_FALSE(r.client_id.has_value());
  EXPECT_FALSE(r.order.has_value());
  ASSERT_TRUE(r.intent.has_value());
  EXPECT_DOUBLE_EQ(r.intent->qty, 5.0);

  EXPECT_EQ(venue.place_calls, 0);
  EXPECT_EQ(venue.cancel_calls, 0);
  EXPECT_EQ(venue.status_calls, 0);
  EXPECT_EQ(tracker.size(), 0u);
  EXPECT_EQ(risk->state().daily_trade_count, 0);
  EXPECT_TRUE(takeUpdates().empty());
}

// -----------------------------------------------------------------------------
// 2. A risk rejection is reported as data in every mode.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, RiskRejectionInEveryMode) {
  for (auto mode :
       {ExecutionMode::DryRun, ExecutionMode::Paper, ExecutionMode::Live}) {
    auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long, 0.5), mode);
    EXPECT_EQ(r.status, ExecutionStatus::Rejected);
    EXPECT_EQ(r.rejection_reasons,
              (std::vector<std::string>{"max_position_size"}));
  }
  EXPECT_EQ(venue.place_calls, 0);
  EXPECT_EQ(tracker.size(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Malformed decisions are programmer errors.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, MalformedDecisionThrows) {
  EXPECT_THROW(dispatcher->execute(decide("BTCUSDT", Direction::Long, 2.0),
                                   ExecutionMode::Paper),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. PAPER: full fill at mark + 5 bps, commission booked, position opened,
//    three lifecycle updates published.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, PaperFillsLocally) {
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Paper);

  ASSERT_EQ(r.status, ExecutionStatus::Filled);
  ASSERT_TRUE(r.order.has_value());
  EXPECT_EQ(r.order->status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(r.order->filled_qty, 5.0);
  EXPECT_NEAR(*r.order->avg_fill_price, 100.05, 1e-9);
  EXPECT_NEAR(r.order->commission_total, 5.0 * 100.05 * 0.001, 1e-9);
  EXPECT_EQ(dispatcher->modeOf(*r.client_id), ExecutionMode::Paper);

  EXPECT_EQ(venue.place_calls, 0);
  auto pos = book.position("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->net_quantity, 5.0);
  EXPECT_EQ(risk->state().daily_trade_count, 1);
  EXPECT_NEAR(risk->state().daily_realized_pnl, -5.0 * 100.05 * 0.001, 1e-9);

  auto seen = takeUpdates();
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0].order.status, OrderStatus::Submitted);
  EXPECT_EQ(seen[1].order.status, OrderStatus::Open);
  EXPECT_EQ(seen[2].order.status, OrderStatus::Filled);
  EXPECT_EQ(seen[2].previous_status, OrderStatus::Open);
}

// -----------------------------------------------------------------------------
// 5. PAPER partial fill leaves the order working; cancel is local.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, PaperPartialFillAndLocalCancel) {
  tradeguard::DispatcherConfig cfg;
  cfg.paper_fill_ratio = 0.4;
  rebuild(cfg);

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Short),
                               ExecutionMode::Paper);
  ASSERT_EQ(r.status, ExecutionStatus::PartiallyFilled);
  EXPECT_DOUBLE_EQ(r.order->filled_qty, 2.0);
  EXPECT_NEAR(*r.order->avg_fill_price, 99.95, 1e-9);

  auto c = dispatcher->cancel(*r.client_id);
  EXPECT_EQ(c.outcome, CancelOutcome::CancelledLocally);
  EXPECT_EQ(venue.cancel_calls, 0);
  EXPECT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Cancelled);

  EXPECT_EQ(dispatcher->cancel(*r.client_id).outcome,
            CancelOutcome::AlreadyTerminal);
  EXPECT_EQ(dispatcher->cancel("nope").outcome, CancelOutcome::NotFound);
}

// -----------------------------------------------------------------------------
// 6. Invalid dispatcher settings are refused.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, InvalidConfigThrows) {
  tradeguard::DispatcherConfig cfg;
  cfg.paper_fill_ratio = 0.0;
  EXPECT_THROW(rebuild(cfg), std::invalid_argument);

  cfg = {};
  cfg.ack_timeout = std::chrono::milliseconds(0);
  EXPECT_THROW(rebuild(cfg), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 7. LIVE ack: registered, acknowledged, counted; a later fill from the
//    stream completes it and reaches the book and RiskManager.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveAckThenStreamFill) {
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);

  ASSERT_EQ(r.status, ExecutionStatus::Submitted);
  ASSERT_TRUE(r.client_id.has_value());
  EXPECT_EQ(r.order->status, OrderStatus::Open);
  EXPECT_EQ(r.order->venue_id, "v-1");
  ASSERT_EQ(venue.placed.size(), 1u);
  EXPECT_EQ(venue.placed[0].client_id, *r.client_id);
  EXPECT_DOUBLE_EQ(venue.placed[0].qty, 5.0);
  EXPECT_EQ(venue.placed[0].side, tradeguard::domain::Side::Buy);
  EXPECT_EQ(risk->state().daily_trade_count, 1);

  dispatcher->onVenueEvent(fillEvent(*r.client_id, 5.0, 100.0, "t1", true));

  auto order = dispatcher->order(*r.client_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 5.0);
  EXPECT_DOUBLE_EQ(risk->state().daily_realized_pnl, -0.5);
  EXPECT_DOUBLE_EQ(risk->state().current_equity, 9'999.5);
}

// -----------------------------------------------------------------------------
// 8. LIVE venue refusal: Rejected{"venue_error"}, nothing tracked, no
//    status query, reservation released.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveVenueRefusal) {
  venue.place_results.push_back(
      VenueError{VenueErrorCode::Rejected, "insufficient balance"});

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  EXPECT_EQ(r.status, ExecutionStatus::Rejected);
  EXPECT_EQ(r.rejection_reasons, (std::vector<std::string>{"venue_error"}));
  ASSERT_TRUE(r.client_id.has_value());
  EXPECT_FALSE(tracker.contains(*r.client_id));
  EXPECT_EQ(venue.status_calls, 0);
  EXPECT_TRUE(dispatcher->indeterminateIds().empty());
  EXPECT_EQ(risk->state().daily_trade_count, 0);
}

// -----------------------------------------------------------------------------
// 9. Timeout, then the status query finds the order: adopted with the
//    venue's id. placeOrder is called exactly once.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveTimeoutFoundByStatusQuery) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});
  venue.on_place = [this](const tradeguard::OrderSpec& spec) {
    tradeguard::VenueOrderStatus found;
    found.client_id = spec.client_id;
    found.venue_id = "venue-77";
    venue.status_results.push_back(found);
  };

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  EXPECT_EQ(r.status, ExecutionStatus::Submitted);
  EXPECT_EQ(r.order->venue_id, "venue-77");
  EXPECT_EQ(venue.place_calls, 1);
  EXPECT_EQ(venue.status_calls, 1);
}

// -----------------------------------------------------------------------------
// 10. Timeout, then NotFound: the order might still appear, so the result
//     is Indeterminate and the id stays reserved against the limits.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveTimeoutNotFoundIsIndeterminate) {
  auto l = limits();
  l.max_open_orders = 1;
  rebuild({}, l);
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  ASSERT_EQ(r.status, ExecutionStatus::Indeterminate);
  ASSERT_TRUE(r.client_id.has_value());
  EXPECT_FALSE(r.order.has_value());
  EXPECT_EQ(dispatcher->indeterminateIds(),
            (std::vector<std::string>{*r.client_id}));
  EXPECT_EQ(venue.place_calls, 1);

  auto blocked = dispatcher->execute(decide("ETHUSDT", Direction::Long),
                                     ExecutionMode::Live);
  EXPECT_EQ(blocked.rejection_reasons,
            (std::vector<std::string>{"max_open_orders"}));

  // A late ack from the stream adopts it.
  dispatcher->onVenueEvent(
      tradeguard::AcknowledgedEvent{*r.client_id, "late-1", 0});
  EXPECT_TRUE(dispatcher->indeterminateIds().empty());
  ASSERT_TRUE(tracker.contains(*r.client_id));
  EXPECT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Open);
  EXPECT_EQ(tracker.get(*r.client_id)->venue_id, "late-1");
}

// -----------------------------------------------------------------------------
// 11. A non-timeout transient error followed by NotFound is a confirmed
//     absence: Rejected{"venue_error"}.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveNetworkErrorNotFoundIsRejected) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Network, "reset"});

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  EXPECT_EQ(r.status, ExecutionStatus::Rejected);
  EXPECT_EQ(r.rejection_reasons, (std::vector<std::string>{"venue_error"}));
  EXPECT_TRUE(dispatcher->indeterminateIds().empty());
}

// -----------------------------------------------------------------------------
// 12. When the status query itself keeps failing, the result is
//     Indeterminate after the retry budget is spent.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveStatusQueryFailureIsIndeterminate) {
  venue.place_results.push_back(
      VenueError{VenueErrorCode::ServerError, "502"});
  for (int i = 0; i < 3; ++i) {
    venue.status_results.push_back(
        VenueError{VenueErrorCode::Network, "down"});
  }

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  EXPECT_EQ(r.status, ExecutionStatus::Indeterminate);
  EXPECT_EQ(venue.status_calls, 3);
  EXPECT_EQ(venue.place_calls, 1);
}

// -----------------------------------------------------------------------------
// 13. resolveIndeterminate(): found → adopted, NotFound → released.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, ResolveIndeterminate) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "a"});
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "b"});
  auto first = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                                   ExecutionMode::Live);
  auto second = dispatcher->execute(decide("ETHUSDT", Direction::Long),
                                    ExecutionMode::Live);
  ASSERT_EQ(first.status, ExecutionStatus::Indeterminate);
  ASSERT_EQ(second.status, ExecutionStatus::Indeterminate);

  // Order of re-query is unspecified; answer by client id.
  tradeguard::VenueOrderStatus found;
  found.client_id = *first.client_id;
  found.venue_id = "found-1";
  auto ids_now = dispatcher->indeterminateIds();
  ASSERT_EQ(ids_now.size(), 2u);
  for (const auto& id : ids_now) {
    if (id == *first.client_id) {
      venue.status_results.push_back(found);
    } else {
      venue.status_results.push_back(
          VenueError{VenueErrorCode::NotFound, "gone"});
    }
  }

  EXPECT_EQ(dispatcher->resolveIndeterminate(), 2u);
  EXPECT_TRUE(dispatcher->indeterminateIds().empty());
  EXPECT_TRUE(tracker.contains(*first.client_id));
  EXPECT_FALSE(tracker.contains(*second.client_id));
}

// -----------------------------------------------------------------------------
// 14. A fill delivered before placeOrder() returns is buffered and applied
//     right after registration.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, EventsRacingTheAckAreBuffered) {
  venue.on_place = [this](const tradeguard::OrderSpec& spec) {
    dispatcher->onVenueEvent(
        tradeguard::AcknowledgedEvent{spec.client_id, "v-1", 0});
    dispatcher->onVenueEvent(fillEvent(spec.client_id, 2.0, 100.0, "t1"));
  };

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  ASSERT_TRUE(r.order.has_value());
  EXPECT_EQ(r.status, ExecutionStatus::PartiallyFilled);
  EXPECT_DOUBLE_EQ(r.order->filled_qty, 2.0);
  EXPECT_FALSE(dispatcher->reconciliationRequired());
}

// -----------------------------------------------------------------------------
// 15. A fill for a client id nobody knows: desync flag, breaker, CRITICAL.
//     Reconciliation clears both; a failing reconciler leaves them set.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, UnknownFillRequiresReconciliation) {
  dispatcher->onVenueEvent(fillEvent("ghost", 1.0, 100.0, "g1"));

  EXPECT_TRUE(dispatcher->reconciliationRequired());
  EXPECT_TRUE(risk->state().circuit_breaker_engaged);
  EXPECT_EQ(risk->state().circuit_breaker_reason, "reconciliation_required");

  auto blocked = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                                     ExecutionMode::Paper);
  EXPECT_EQ(blocked.rejection_reasons,
            (std::vector<std::string>{"circuit_breaker_engaged"}));

  tradeguard::test::FakeReconciler reconciler;
  reconciler.fail = true;
  EXPECT_FALSE(dispatcher->reconcile(reconciler));
  EXPECT_TRUE(dispatcher->reconciliationRequired());

  reconciler.fail = false;
  tradeguard::domain::Position ghost;
  ghost.symbol = "BTCUSDT";
  ghost.net_quantity = 1.0;
  ghost.average_price = 100.0;
  ghost.mark_price = 100.0;
  reconciler.positions = {ghost};
  EXPECT_TRUE(dispatcher->reconcile(reconciler));
  EXPECT_FALSE(dispatcher->reconciliationRequired());
  EXPECT_FALSE(risk->state().circuit_breaker_engaged);
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 1.0);
}

// -----------------------------------------------------------------------------
// 16. An invalid transition from the stream is a desync too; the order
//     itself is left untouched.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, InvalidTransitionRequiresReconciliation) {
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  dispatcher->onVenueEvent(tradeguard::CancelledEvent{*r.client_id, 0});
  ASSERT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Cancelled);
  EXPECT_FALSE(dispatcher->reconciliationRequired());

  dispatcher->onVenueEvent(fillEvent(*r.client_id, 1.0, 100.0, "late"));
  EXPECT_TRUE(dispatcher->reconciliationRequired());
  EXPECT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Cancelled);
  EXPECT_DOUBLE_EQ(tracker.get(*r.client_id)->filled_qty, 0.0);
}

// -----------------------------------------------------------------------------
// 17. A replayed fill_id is applied once: book and PnL unchanged, no
//     update published.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, ReplayedFillIgnored) {
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  dispatcher->onVenueEvent(fillEvent(*r.client_id, 2.0, 100.0, "t1"));
  takeUpdates();

  dispatcher->onVenueEvent(fillEvent(*r.client_id, 2.0, 100.0, "t1"));
  EXPECT_DOUBLE_EQ(tracker.get(*r.client_id)->filled_qty, 2.0);
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 2.0);
  EXPECT_DOUBLE_EQ(risk->state().daily_realized_pnl, -0.5);
  EXPECT_TRUE(takeUpdates().empty());
}

// -----------------------------------------------------------------------------
// 18. LIVE cancel asks the venue and waits for the stream confirmation.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveCancel) {
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);

  auto c = dispatcher->cancel(*r.client_id);
  EXPECT_EQ(c.outcome, CancelOutcome::Requested);
  EXPECT_EQ(venue.cancel_calls, 1);
  EXPECT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Open);

  dispatcher->onVenueEvent(tradeguard::CancelledEvent{*r.client_id, 0});
  EXPECT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Cancelled);

  auto other = dispatcher->execute(decide("ETHUSDT", Direction::Long),
                                   ExecutionMode::Live);
  venue.cancel_results.push_back(
      VenueError{VenueErrorCode::Rejected, "too late"});
  auto failed = dispatcher->cancel(*other.client_id);
  EXPECT_EQ(failed.outcome, CancelOutcome::Failed);
  EXPECT_NE(failed.detail.find("too late"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 19. Eight threads race for a single open-order slot while placement is
//     slow: exactly one gets through.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, ConcurrentDecisionsCannotOverbook) {
  auto l = limits();
  l.max_open_orders = 1;
  rebuild({}, l);
  venue.on_place = [](const tradeguard::OrderSpec&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  };

  std::atomic<int> submitted{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, &submitted, &rejected] {
      auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                                   ExecutionMode::Live);
      if (r.status == ExecutionStatus::Submitted) {
        ++submitted;
      } else if (r.status == ExecutionStatus::Rejected) {
        ++rejected;
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(submitted.load(), 1);
  EXPECT_EQ(rejected.load(), 7);
  EXPECT_EQ(venue.place_calls, 1);
}

namespace {

// Queues a status answer for whatever client id placeOrder() is called with.
void answerStatusOnPlace(tradeguard::test::FakeVenueClient& venue,
                         OrderStatus status, double filled_qty,
                         std::optional<double> avg_price) {
  venue.on_place = [&venue, status, filled_qty,
                    avg_price](const tradeguard::OrderSpec& spec) {
    tradeguard::VenueOrderStatus found;
    found.client_id = spec.client_id;
    found.venue_id = "venue-9";
    found.status = status;
    found.filled_qty = filled_qty;
    found.avg_fill_price = avg_price;
    venue.status_results.push_back(found);
  };
}

}  // namespace

// -----------------------------------------------------------------------------
// 20. The status query finds the order already rejected: Rejected{
//     "venue_error"}, nothing tracked, the reservation is released.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveFoundRejectedIsNotTracked) {
  auto l = limits();
  l.max_open_orders = 1;
  rebuild({}, l);
  venue.place_results.push_back(VenueError{VenueErrorCode::Network, "reset"});
  answerStatusOnPlace(venue, OrderStatus::Rejected, 0.0, std::nullopt);

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  EXPECT_EQ(r.status, ExecutionStatus::Rejected);
  EXPECT_EQ(r.rejection_reasons, (std::vector<std::string>{"venue_error"}));
  ASSERT_TRUE(r.client_id.has_value());
  EXPECT_FALSE(tracker.contains(*r.client_id));
  EXPECT_TRUE(dispatcher->openOrders().empty());
  EXPECT_TRUE(dispatcher->indeterminateIds().empty());
  EXPECT_FALSE(dispatcher->reconciliationRequired());
  EXPECT_EQ(venue.place_calls, 1);

  // The single open-order slot is free again.
  auto next = dispatcher->execute(decide("ETHUSDT", Direction::Long),
                                  ExecutionMode::Live);
  EXPECT_EQ(next.status, ExecutionStatus::Submitted);
}

// -----------------------------------------------------------------------------
// 21. The order filled while its events were lost: the status answer is
//     applied as a catch-up fill, so tracker and book agree with the venue.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveFoundFilledCatchesUpFills) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});
  answerStatusOnPlace(venue, OrderStatus::Filled, 5.0, 100.0);

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  EXPECT_EQ(r.status, ExecutionStatus::Filled);
  ASSERT_TRUE(r.order.has_value());
  EXPECT_EQ(r.order->status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(r.order->filled_qty, 5.0);
  EXPECT_DOUBLE_EQ(*r.order->avg_fill_price, 100.0);
  EXPECT_EQ(r.order->venue_id, "venue-9");

  auto pos = book.position("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->net_quantity, 5.0);
  EXPECT_TRUE(dispatcher->openOrders().empty());
  EXPECT_FALSE(dispatcher->reconciliationRequired());

  auto published = takeUpdates();
  ASSERT_FALSE(published.empty());
  EXPECT_EQ(published.back().order.status, OrderStatus::Filled);

  // The real fill showing up later is a desync, not a second position.
  dispatcher->onVenueEvent(fillEvent(*r.client_id, 5.0, 100.0, "late-t1"));
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 5.0);
}

// -----------------------------------------------------------------------------
// 22. Part filled, then cancelled at the venue: the fill is caught up at
//     the venue's average and the order ends Cancelled.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveFoundCancelledKeepsPartialFill) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});
  answerStatusOnPlace(venue, OrderStatus::Cancelled, 2.0, 101.0);

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  ASSERT_TRUE(r.order.has_value());
  EXPECT_EQ(r.order->status, OrderStatus::Cancelled);
  EXPECT_DOUBLE_EQ(r.order->filled_qty, 2.0);
  EXPECT_DOUBLE_EQ(*r.order->avg_fill_price, 101.0);
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 2.0);
  EXPECT_TRUE(dispatcher->openOrders().empty());
}

// -----------------------------------------------------------------------------
// 23. Expired with no fill: tracked as Expired, no longer open.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveFoundExpiredIsClosed) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});
  answerStatusOnPlace(venue, OrderStatus::Expired, 0.0, std::nullopt);

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  ASSERT_TRUE(r.order.has_value());
  EXPECT_EQ(r.order->status, OrderStatus::Expired);
  EXPECT_TRUE(dispatcher->openOrders().empty());
}

// -----------------------------------------------------------------------------
// 24. Fills on an order the venue still works may yet arrive on the stream,
//     so they are not booked from the status answer: the order is tracked
//     as found and reconciliation is required.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, LiveFoundWorkingWithFillsRequiresReconciliation) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});
  answerStatusOnPlace(venue, OrderStatus::PartiallyFilled, 1.0, 100.0);

  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  ASSERT_TRUE(r.order.has_value());
  EXPECT_EQ(r.order->status, OrderStatus::Open);
  EXPECT_TRUE(dispatcher->reconciliationRequired());
  EXPECT_EQ(risk->state().circuit_breaker_reason, "reconciliation_required");
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 0.0);
}

// -----------------------------------------------------------------------------
// 25. resolveIndeterminate() applies the found status the same way.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, ResolveIndeterminateCatchesUpFills) {
  venue.place_results.push_back(VenueError{VenueErrorCode::Timeout, "no ack"});
  auto r = dispatcher->execute(decide("BTCUSDT", Direction::Long),
                               ExecutionMode::Live);
  ASSERT_EQ(r.status, ExecutionStatus::Indeterminate);

  tradeguard::VenueOrderStatus found;
  found.client_id = *r.client_id;
  found.venue_id = "venue-late";
  found.status = OrderStatus::Filled;
  found.filled_qty = 5.0;
  found.avg_fill_price = 99.0;
  venue.status_results.push_back(found);

  EXPECT_EQ(dispatcher->resolveIndeterminate(), 1u);
  ASSERT_TRUE(tracker.contains(*r.client_id));
  EXPECT_EQ(tracker.get(*r.client_id)->status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->net_quantity, 5.0);
}

// -----------------------------------------------------------------------------
// 26. A hand-released breaker does not disarm the desync guard: the next
//     unknown fill engages it again. A breaker held for another reason is
//     left with its own reason.
// -----------------------------------------------------------------------------
TEST_F(ExecutionDispatcherTest, EveryDesyncEngagesBreaker) {
  dispatcher->onVenueEvent(fillEvent("ghost-1", 1.0, 100.0, "g1"));
  ASSERT_TRUE(risk->state().circuit_breaker_engaged);

  risk->releaseCircuitBreaker();
  ASSERT_FALSE(risk->state().circuit_breaker_engaged);

  dispatcher->onVenueEvent(fillEvent("ghost-2", 1.0, 100.0, "g2"));
  EXPECT_TRUE(dispatcher->reconciliationRequired());
  EXPECT_TRUE(risk->state().circuit_breaker_engaged);
  EXPECT_EQ(risk->state().circuit_breaker_reason, "reconciliation_required");

  risk->releaseCircuitBreaker();
  risk->engageCircuitBreaker("operator_pause");
  dispatcher->onVenueEvent(fillEvent("ghost-3", 1.0, 100.0, "g3"));
  EXPECT_EQ(risk->state().circuit_breaker_reason, "operator_pause");
}
