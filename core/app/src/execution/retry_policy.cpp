#include "tradeguard/execution/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <thread>

namespace tradeguard {

void validateRetryPolicy(const RetryPolicy& policy) {
  if (policy.max_attempts < 1) {
    throw std::invalid_argument("retry max_attempts must be >= 1");
  }
  if (policy.base_delay.count() < 0 || policy.max_delay.count() < 0) {
    throw std::invalid_argument("retry delays must not be negative");
  }
  if (policy.multiplier < 1.0) {
    throw std::invalid_argument("retry multiplier must be >= 1");
  }
  if (policy.jitter < 0.0 || policy.jitter > 1.0) {
    throw std::invalid_argument("retry jitter must be in [0, 1]");
  }
}

std::chrono::milliseconds computeBackoffDelay(const RetryPolicy& policy,
                                              int retry_number,
                                              double unit_random) {
  const int exponent = std::max(retry_number, 1) - 1;
  double delay = static_cast<double>(policy.base_delay.count()) *
                 std::pow(policy.multiplier, exponent);
  delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

  const double u = std::clamp(unit_random, -1.0, 1.0);
  delay *= 1.0 + policy.jitter * u;

  return std::chrono::milliseconds(
      static_cast<std::int64_t>(std::llround(std::max(delay, 0.0))));
}

RetryExecutor::RetryExecutor(RetryPolicy policy, Sleeper sleeper,
                             RandomSource random)
    : policy_(policy), sleeper_(std::move(sleeper)), random_(std::move(random)) {
  validateRetryPolicy(policy_);
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      std::this_thread::sleep_for(d);
    };
  }
  if (!random_) {
    random_ = [] {
      thread_local std::mt19937 gen{std::random_device{}()};
      std::uniform_real_distribution<double> dist(-1.0, 1.0);
      return dist(gen);
    };
  }
}

}  // namespace tradeguard
