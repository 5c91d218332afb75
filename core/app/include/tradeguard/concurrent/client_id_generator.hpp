#pragma once

#include "tradeguard/domain/order.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tradeguard {

// -----------------------------------------------------------------------------
// ClientIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe source of unique client order ids.
//
// @details
// Ids have the form "<prefix>-<session>-<n>", where session is the epoch ms
// at which the generator was created and n starts at 1. The session part
// keeps ids from a restarted process distinct from those of the previous
// run, so a venue never sees the same client id twice.
//
// Thread model: next_id() is a single atomic fetch_add plus string
// formatting; safe from any thread.
// -----------------------------------------------------------------------------
class ClientIdGenerator {
 public:
  explicit ClientIdGenerator(std::int64_t session_start_ms,
                             std::string prefix = "tg")
      : prefix_(std::move(prefix) + "-" + std::to_string(session_start_ms) +
                "-") {}

  ClientIdGenerator(const ClientIdGenerator&) = delete;
  ClientIdGenerator& operator=(const ClientIdGenerator&) = delete;
  ClientIdGenerator(ClientIdGenerator&&) = delete;
  ClientIdGenerator& operator=(ClientIdGenerator&&) = delete;

  domain::ClientOrderId next_id() {
    return prefix_ +
           std::to_string(next_.fetch_add(1, std::memory_order_relaxed));
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace tradeguard
