#include "tradeguard/monitor/connection_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace tradeguard {

ConnectionMonitor::ConnectionMonitor(const ITimeProvider& clock,
                                     MonitorConfig config)
    : clock_(clock), config_(config), last_update_at_(clock.now_ms()) {
  if (config_.stale_threshold_ms <= 0 || config_.error_window_ms <= 0 ||
      config_.reconnect_window_ms <= 0) {
    throw std::invalid_argument(
        "ConnectionMonitor: thresholds and windows must be positive");
  }
  if (config_.latency_sample_capacity == 0) {
    throw std::invalid_argument(
        "ConnectionMonitor: latency_sample_capacity must be > 0");
  }
}

// --- Recording ---------------------------------------------------------------

void ConnectionMonitor::recordUpdate() {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  last_update_at_ = std::max(last_update_at_, now);
}

void ConnectionMonitor::recordError() {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  error_stamps_.push_back(now);
  prune(error_stamps_, now, config_.error_window_ms);
}

void ConnectionMonitor::recordReconnect() {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  reconnect_stamps_.push_back(now);
  prune(reconnect_stamps_, now, config_.reconnect_window_ms);
  std::cout << "[ConnectionMonitor] reconnect #" << reconnect_stamps_.size()
            << " in window.\n";
}

void ConnectionMonitor::recordLatency(double latency_ms) {
  if (!std::isfinite(latency_ms) || latency_ms < 0.0) {
    return;
  }
  std::lock_guard lock(mutex_);
  latency_samples_.push_back(latency_ms);
  while (latency_samples_.size() > config_.latency_sample_capacity) {
    latency_samples_.pop_front();
  }
}

void ConnectionMonitor::setConnected(bool connected) {
  std::lock_guard lock(mutex_);
  if (connected_ != connected) {
    if (connected) {
      std::cout << "[ConnectionMonitor] connection up.\n";
    } else {
      std::cerr << "[ConnectionMonitor] WARNING: connection down.\n";
    }
  }
  connected_ = connected;
}

// --- snapshot() --------------------------------------------------------------

domain::ConnectionHealth ConnectionMonitor::snapshot() const {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);

  prune(error_stamps_, now, config_.error_window_ms);
  prune(reconnect_stamps_, now, config_.reconnect_window_ms);

  domain::ConnectionHealth health;
  health.taken_at = now;
  health.last_update_at = last_update_at_;
  health.consecutive_errors_in_window = static_cast<int>(error_stamps_.size());
  health.reconnect_count_in_window =
      static_cast<int>(reconnect_stamps_.size());
  health.latency_p95_ms = p95Locked();
  health.connected = connected_;

  const std::int64_t silence = now - last_update_at_;
  health.is_stale = silence > config_.stale_threshold_ms;
  health.stale_for_ms = health.is_stale ? silence : 0;
  return health;
}

// --- helpers -----------------------------------------------------------------

void ConnectionMonitor::prune(std::deque<std::int64_t>& stamps,
                              std::int64_t now, std::int64_t window) {
  while (!stamps.empty() && now - stamps.front() > window) {
    stamps.pop_front();
  }
}

// Nearest-rank percentile over the retained samples.
double ConnectionMonitor::p95Locked() const {
  if (latency_samples_.empty()) {
    return 0.0;
  }
  std::vector<double> sorted(latency_samples_.begin(), latency_samples_.end());
  std::sort(sorted.begin(), sorted.end());
  const auto rank = static_cast<std::size_t>(
      std::ceil(0.95 * static_cast<double>(sorted.size())));
  return sorted[std::max<std::size_t>(rank, 1) - 1];
}

}  // namespace tradeguard
