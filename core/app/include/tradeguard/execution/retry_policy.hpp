#pragma once

#include "tradeguard/execution/i_venue_client.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <variant>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RetryPolicy: exponential backoff with jitter
// -----------------------------------------------------------------------------
//   delay(n) = min(base * multiplier^(n-1), max) * (1 + jitter * u)
//   u uniform in [-1, 1], n = 1 for the delay after the first failure.
//
// max_attempts counts the first call: 4 means one call plus three retries.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{4};
  std::chrono::milliseconds base_delay{100};
  double multiplier{2.0};
  std::chrono::milliseconds max_delay{5000};
  double jitter{0.2};  // Fraction of the delay, in [0, 1]
};

// Throws std::invalid_argument for a nonsensical policy.
void validateRetryPolicy(const RetryPolicy& policy);

// -----------------------------------------------------------------------------
// computeBackoffDelay(policy, retry_number, unit_random)
// -----------------------------------------------------------------------------
// retry_number starts at 1. unit_random in [-1, 1] scales the jitter; pass
// 0 for the undithered delay. Never negative.
// -----------------------------------------------------------------------------
std::chrono::milliseconds computeBackoffDelay(const RetryPolicy& policy,
                                              int retry_number,
                                              double unit_random);

// -----------------------------------------------------------------------------
// RetryExecutor
// -----------------------------------------------------------------------------
//
// @brief  Runs an idempotent venue call until it succeeds, fails with a
//         non-transient error, or runs out of attempts.
//
// @details
// Sleeper and random source are injectable so tests run without real
// sleeps. Defaults: std::this_thread::sleep_for and a thread-local
// std::mt19937.
//
// Only idempotent operations go through here (status query, cancel).
// Order placement never does.
// -----------------------------------------------------------------------------
class RetryExecutor {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  using RandomSource = std::function<double()>;  // Uniform in [-1, 1]

  explicit RetryExecutor(RetryPolicy policy, Sleeper sleeper = {},
                         RandomSource random = {});

  template <typename T, typename Fn>
  VenueResult<T> run(const std::string& what, Fn&& call) const {
    for (int attempt = 1;; ++attempt) {
      VenueResult<T> result = call();
      const auto* error = std::get_if<VenueError>(&result);
      if (error == nullptr || !isTransient(error->code) ||
          attempt >= policy_.max_attempts) {
        if (error != nullptr && isTransient(error->code)) {
          std::cerr << "[Retry] WARNING: " << what << " gave up after "
                    << attempt << " attempt(s): " << toString(error->code)
                    << " " << error->message << "\n";
        }
        return result;
      }
      const auto delay = computeBackoffDelay(policy_, attempt, random_());
      std::cerr << "[Retry] WARNING: " << what << " attempt " << attempt
                << " failed (" << toString(error->code) << "), retrying in "
                << delay.count() << "ms\n";
      sleeper_(delay);
    }
  }

  const RetryPolicy& policy() const { return policy_; }

 private:
  RetryPolicy policy_;
  Sleeper sleeper_;
  RandomSource random_;
};

}  // namespace tradeguard
