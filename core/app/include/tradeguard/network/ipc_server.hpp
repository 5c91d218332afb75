#pragma once

#include "tradeguard/concurrent/bounded_queue.hpp"
#include "tradeguard/events/event.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ control surface and telemetry feed
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread serving operator commands (REP socket) and
//         broadcasting core telemetry (PUB socket), both as JSON.
//
// @details
// Two ZeroMQ sockets on the same thread:
//
//   1. PUB socket: order updates and kill-switch flips. Each message is
//      two frames, the topic ("order_update" / "kill_switch") for ZMQ
//      prefix filtering, then the JSON document. Every document carries a
//      "seq" that increases by one per published message, so a subscriber
//      can detect gaps. Events arrive through a BoundedQueue filled from
//      the core loop thread, so serialisation and socket I/O never run on
//      the loop. When the queue is full the event is dropped and counted;
//      telemetry never back-pressures order processing.
//
//   2. REP socket: each request is passed to the command handler
//      (TradingCore::executeCommand) and its answer is sent back. A handler
//      that throws still gets a {"status":"error"} reply, otherwise the REP
//      socket would be stuck waiting for a send.
//      ZMQ_RCVTIMEO keeps the thread alternating between the two sockets.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by TradingCore via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint, std::size_t telemetry_capacity = 1024);

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. Idempotent. Throws
  // zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, closes the sockets. Idempotent.
  void stop();

  // Enqueues a telemetry event without blocking. Returns false if dropped.
  bool pushTelemetry(Event event);

  std::uint64_t droppedTelemetry() const { return dropped_.load(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // JSON for OrderUpdateEvent ("order_update") and KillSwitchEvent
  // ("kill_switch"); std::nullopt for every other event type.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Combined loop: drain telemetry, then poll for one command.
  void run();
  void processTelemetry();
  void processCommands();

  static std::optional<nlohmann::json> telemetryJson(const Event& event);
  static nlohmann::json orderUpdateJson(const OrderUpdateEvent& e);
  static nlohmann::json killSwitchJson(const KillSwitchEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  BoundedQueue<Event> telemetry_queue_;
  std::uint64_t seq_{0};                // IPC thread only
  std::atomic<std::uint64_t> dropped_{0};

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeguard
