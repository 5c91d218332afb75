#pragma once

// -----------------------------------------------------------------------------
// Hand-written test doubles shared by the dispatcher and core test suites.
// -----------------------------------------------------------------------------

#include "tradeguard/execution/i_venue_client.hpp"
#include "tradeguard/execution/retry_policy.hpp"
#include "tradeguard/risk/i_account_state_provider.hpp"
#include "tradeguard/risk/i_reconciler.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeguard {
namespace test {

// -----------------------------------------------------------------------------
// FakeVenueClient
// -----------------------------------------------------------------------------
// Scripted venue. Each call pops the next scripted result for its
// operation; when the script is empty:
//   placeOrder     → ack with venue id "v-<n>"
//   cancelOrder    → CancelAck
//   getOrderStatus → NotFound
//   reconnect      → reconnect_result
// on_place runs inside placeOrder() before the result is returned, which
// lets a test deliver stream events that race the ack.
// -----------------------------------------------------------------------------
class FakeVenueClient final : public IVenueClient {
 public:
  VenueResult<VenueAck> placeOrder(const OrderSpec& spec,
                                   std::chrono::milliseconds) override {
    std::function<void(const OrderSpec&)> hook;
    VenueResult<VenueAck> result;
    {
      std::lock_guard lock(mutex_);
      placed.push_back(spec);
      ++place_calls;
      hook = on_place;
      if (!place_results.empty()) {
        result = place_results.front();
        place_results.pop_front();
      } else {
        result = VenueAck{"v-" + std::to_string(place_calls)};
      }
    }
    if (hook) {
      hook(spec);
    }
    return result;
  }

  VenueResult<CancelAck> cancelOrder(
      const domain::ClientOrderId& client_id) override {
    std::lock_guard lock(mutex_);
    ++cancel_calls;
    if (!cancel_results.empty()) {
      auto r = cancel_results.front();
      cancel_results.pop_front();
      return r;
    }
    return CancelAck{client_id};
  }

  VenueResult<VenueOrderStatus> getOrderStatus(
      const domain::ClientOrderId& client_id) override {
    std::lock_guard lock(mutex_);
    ++status_calls;
    if (!status_results.empty()) {
      auto r = status_results.front();
      status_results.pop_front();
      return r;
    }
    return VenueError{VenueErrorCode::NotFound, "unknown " + client_id};
  }

  bool reconnect() override {
    std::lock_guard lock(mutex_);
    ++reconnect_calls;
    return reconnect_result;
  }

  // Script (set before use).
  std::deque<VenueResult<VenueAck>> place_results;
  std::deque<VenueResult<CancelAck>> cancel_results;
  std::deque<VenueResult<VenueOrderStatus>> status_results;
  std::function<void(const OrderSpec&)> on_place;
  bool reconnect_result{true};

  // Observations.
  std::vector<OrderSpec> placed;
  int place_calls{0};
  int cancel_calls{0};
  int status_calls{0};
  int reconnect_calls{0};

 private:
  std::mutex mutex_;
};

// Venue-backed account view with directly settable figures.
class FakeAccountProvider final : public IAccountStateProvider {
 public:
  double currentEquity() const override { return equity; }
  std::vector<domain::Position> openPositions() const override {
    return positions;
  }
  std::optional<double> markPrice(const std::string& symbol) const override {
    auto it = marks.find(symbol);
    if (it == marks.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  double equity{10'000.0};
  std::vector<domain::Position> positions;
  std::unordered_map<std::string, double> marks;
};

// Returns fixed venue truth, or throws when fail is set.
class FakeReconciler final : public IReconciler {
 public:
  std::vector<domain::Position> reconcilePositions() override {
    if (fail) {
      throw std::runtime_error("venue unreachable");
    }
    return positions;
  }
  std::vector<domain::Order> reconcileOrders() override {
    ++calls;
    if (fail) {
      throw std::runtime_error("venue unreachable");
    }
    return orders;
  }

  std::vector<domain::Position> positions;
  std::vector<domain::Order> orders;
  bool fail{false};
  int calls{0};
};

// RetryExecutor that never sleeps and never jitters.
inline RetryExecutor instantRetry(int max_attempts = 3) {
  RetryPolicy policy;
  policy.max_attempts = max_attempts;
  policy.base_delay = std::chrono::milliseconds(1);
  policy.max_delay = std::chrono::milliseconds(1);
  policy.jitter = 0.0;
  return RetryExecutor(
      policy, [](std::chrono::milliseconds) {}, [] { return 0.0; });
}

}  // namespace test
}  // namespace tradeguard
