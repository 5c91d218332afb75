#include "tradeguard/network/ipc_server.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace tradeguard {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint, std::size_t telemetry_capacity)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      telemetry_queue_(telemetry_capacity) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  cmd->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);

  // A bind failure throws before any member changes, so a failed start()
  // can be retried.
  cmd->bind(cmd_endpoint_);
  pub->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd);
  pub_socket_ = std::move(pub);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. commands=" << cmd_endpoint_
            << " telemetry=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. published=" << seq_
            << " dropped=" << dropped_.load() << "\n";
}

bool IpcServer::pushTelemetry(Event event) {
  if (telemetry_queue_.try_push(std::move(event))) {
    return true;
  }
  // Warn on the first drop and then every 1000th, not on each one.
  const auto dropped = ++dropped_;
  if (dropped == 1 || dropped % 1000 == 0) {
    std::cerr << "[IpcServer] WARNING: telemetry queue full, " << dropped
              << " event(s) dropped so far.\n";
  }
  return false;
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and one command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto j = telemetryJson(*event);
    if (!j) {
      continue;
    }
    (*j)["seq"] = ++seq_;

    const std::string topic = j->at("type").get<std::string>();
    const std::string payload = j->dump();
    pub_socket_->send(zmq::buffer(topic),
                      zmq::send_flags::sndmore | zmq::send_flags::dontwait);
    pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;  // Poll timeout
  }

  std::string reply;
  try {
    reply = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command handler threw: " << e.what()
              << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = e.what();
    reply = error.dump();
  }
  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// Telemetry documents
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  auto j = telemetryJson(event);
  if (!j) {
    return std::nullopt;
  }
  return j->dump();
}

std::optional<nlohmann::json> IpcServer::telemetryJson(const Event& event) {
  if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    return orderUpdateJson(*e);
  }
  if (const auto* e = std::get_if<KillSwitchEvent>(&event)) {
    return killSwitchJson(*e);
  }
  return std::nullopt;
}

nlohmann::json IpcServer::orderUpdateJson(const OrderUpdateEvent& e) {
  const auto& o = e.order;
  return {
      {"type", "order_update"},
      {"client_id", o.client_id},
      {"venue_id",
       o.venue_id ? nlohmann::json(*o.venue_id) : nlohmann::json(nullptr)},
      {"symbol", o.symbol},
      {"side", domain::toString(o.side)},
      {"status", domain::toString(o.status)},
      {"previous_status", domain::toString(e.previous_status)},
      {"requested_qty", o.requested_qty},
      {"filled_qty", o.filled_qty},
      {"avg_fill_price",
       o.avg_fill_price ? nlohmann::json(*o.avg_fill_price)
                        : nlohmann::json(nullptr)},
      {"commission_total", o.commission_total},
      {"reject_reason", o.reject_reason},
      {"timestamp", e.timestamp},
  };
}

nlohmann::json IpcServer::killSwitchJson(const KillSwitchEvent& e) {
  return {
      {"type", "kill_switch"},
      {"active", e.active},
      {"reason", e.reason},
      {"detail", e.detail},
      {"timestamp", e.timestamp},
  };
}

}  // namespace tradeguard
