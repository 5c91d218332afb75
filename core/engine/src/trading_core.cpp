#include "tradeguard/engine/trading_core.hpp"

#include "tradeguard/risk/risk_state_json.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tradeguard {

namespace {

std::optional<domain::Direction> directionFromString(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (s == "long") return domain::Direction::Long;
  if (s == "short") return domain::Direction::Short;
  if (s == "exit") return domain::Direction::Exit;
  return std::nullopt;
}

nlohmann::json orderToJson(const domain::Order& o) {
  nlohmann::json j;
  j["client_id"] = o.client_id;
  j["venue_id"] = o.venue_id ? nlohmann::json(*o.venue_id)
                             : nlohmann::json(nullptr);
  j["symbol"] = o.symbol;
  j["side"] = domain::toString(o.side);
  j["type"] = domain::toString(o.type);
  j["status"] = domain::toString(o.status);
  j["requested_qty"] = o.requested_qty;
  j["filled_qty"] = o.filled_qty;
  j["avg_fill_price"] = o.avg_fill_price ? nlohmann::json(*o.avg_fill_price)
                                         : nlohmann::json(nullptr);
  j["commission_total"] = o.commission_total;
  return j;
}

nlohmann::json resultToJson(const ExecutionResult& r) {
  nlohmann::json j;
  j["result"] = toString(r.status);
  j["mode"] = domain::toString(r.mode);
  j["client_id"] = r.client_id ? nlohmann::json(*r.client_id)
                               : nlohmann::json(nullptr);
  j["rejection_reasons"] = r.rejection_reasons;
  j["detail"] = r.detail;
  if (r.order) {
    j["order"] = orderToJson(*r.order);
  }
  if (r.intent) {
    j["intent"] = {{"side", domain::toString(r.intent->side)},
                   {"qty", r.intent->qty},
                   {"notional", r.intent->notional},
                   {"risk_reducing", r.intent->risk_reducing}};
  }
  return j;
}

// Bare-word form: "EXECUTE BTCUSDT Long 0.1" → {"cmd": "EXECUTE", ...}.
// Positional arguments are mapped to the keys the JSON form uses.
nlohmann::json parseWords(const std::string& request) {
  std::istringstream in(request);
  std::vector<std::string> words;
  for (std::string w; in >> w;) {
    words.push_back(w);
  }

  nlohmann::json j = nlohmann::json::object();
  if (words.empty()) {
    return j;
  }
  j["cmd"] = words[0];

  auto arg = [&](std::size_t i, const char* key) {
    if (i < words.size()) {
      j[key] = words[i];
    }
  };
  auto num = [&](std::size_t i, const char* key) {
    if (i < words.size()) {
      try {
        j[key] = std::stod(words[i]);
      } catch (const std::exception&) {
        throw std::invalid_argument(std::string(key) + ": not a number: " +
                                    words[i]);
      }
    }
  };

  const std::string& cmd = words[0];
  if (cmd == "HALT") {
    arg(1, "note");
  } else if (cmd == "CLEAR_KILL_SWITCH") {
    arg(1, "operator");
    arg(2, "note");
  } else if (cmd == "BREAKER_ON") {
    arg(1, "reason");
    arg(2, "symbol");
  } else if (cmd == "BREAKER_OFF") {
    arg(1, "symbol");
  } else if (cmd == "SET_MODE") {
    arg(1, "mode");
  } else if (cmd == "EXECUTE") {
    arg(1, "symbol");
    arg(2, "direction");
    num(3, "size_hint");
    num(4, "confidence");
    arg(5, "reason");
  } else if (cmd == "CANCEL") {
    arg(1, "client_id");
  } else if (cmd == "MARK") {
    arg(1, "symbol");
    num(2, "price");
  }
  return j;
}

template <typename T>
T required(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw std::invalid_argument(std::string("missing field: ") + key);
  }
  return it->template get<T>();
}

template <typename T>
T optionalField(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradingCore::TradingCore(EngineConfig config, IVenueClient& venue,
                         const ITimeProvider& clock,
                         IAccountStateProvider* account)
    : config_(std::move(config)),
      venue_(venue),
      clock_(clock),
      ids_(clock.now_ms()),
      tracker_(clock),
      book_(config_.engine.initial_equity),
      account_(account != nullptr ? *account : book_),
      risk_(config_.risk, clock, account_.currentEquity()),
      monitor_(clock, config_.monitor),
      loop_(config_.engine.event_queue_capacity, "core_loop"),
      mode_(config_.engine.initial_mode) {
  for (const auto& [symbol, price] : config_.engine.marks) {
    book_.updateMark(symbol, price);
  }

  dispatcher_ = std::make_unique<ExecutionDispatcher>(
      tracker_, risk_, book_, account_, venue_, ids_, clock_,
      config_.dispatcher, RetryExecutor(config_.retry), &monitor_);

  // Both listeners can fire on the core loop thread itself, so they must
  // not block on the loop's own queue.
  dispatcher_->setOrderUpdateListener(
      [this](const OrderUpdateEvent& e) { publishCoreEvent(e); });
  risk_.setKillSwitchListener(
      [this](const KillSwitchEvent& e) { publishCoreEvent(e); });

  health_worker_ = std::make_unique<PeriodicWorker>(
      "health", config_.engine.health_tick, [this] { runHealthCheck(); });
}

TradingCore::~TradingCore() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingCore::start(IReconciler* reconciler) {
  if (running_.load()) {
    return;
  }

  // ---  1) Warm-up gate -------------------------------------------------------
  reconciler_ = reconciler;
  if (reconciler_ != nullptr) {
    if (!dispatcher_->reconcile(*reconciler_)) {
      throw std::runtime_error(
          "TradingCore: warm-up reconciliation failed; refusing to start");
    }
    std::cout << "[TradingCore] warm-up reconciliation complete: "
              << tracker_.openOrders().size() << " open order(s), "
              << book_.openPositions().size() << " position(s).\n";
  }

  // ---  2) Venue events → dispatcher ------------------------------------------
  // Only lifecycle events reach the tracker; the dispatcher ignores the rest.
  EventBus& bus = loop_.eventBus();
  subscriptions_.push_back(
      bus.subscribe([this](const Event& e) { dispatcher_->onVenueEvent(e); },
                    "dispatcher"));

  // ---  3) Core events → IPC telemetry ----------------------------------------
  const bool ipc_enabled = !config_.engine.ipc_cmd_endpoint.empty() &&
                           !config_.engine.ipc_pub_endpoint.empty();
  if (ipc_enabled) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.engine.ipc_cmd_endpoint, config_.engine.ipc_pub_endpoint);
    subscriptions_.push_back(bus.subscribe<OrderUpdateEvent>(
        [this](const OrderUpdateEvent& e) { ipc_server_->pushTelemetry(e); },
        "ipc.order_update"));
    subscriptions_.push_back(bus.subscribe<KillSwitchEvent>(
        [this](const KillSwitchEvent& e) { ipc_server_->pushTelemetry(e); },
        "ipc.kill_switch"));
  }

  // A subscriber that throws means the tracker may no longer match the
  // venue. Trading stops until a reconciliation succeeds.
  loop_.setErrorHandler([this](const Event&, const std::exception& e) {
    dispatcher_->requireReconciliation(std::string("core loop: ") + e.what());
  });

  // ---  4) Threads ------------------------------------------------------------
  loop_.start();
  running_.store(true);

  if (ipc_server_) {
    ipc_server_->start();
  }
  health_worker_->start();

  std::cout << "[TradingCore] started. mode=" << domain::toString(mode())
            << " threads: core_loop, health"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingCore::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // ---  1) No more health ticks (they can trigger reconnects) ---------------
  health_worker_->stop();

  // ---  2) Drain and join the core loop --------------------------------------
  loop_.stop();
  for (auto id : subscriptions_) {
    loop_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();

  // ---  3) IPC last: its telemetry subscribers are gone now ------------------
  ipc_server_.reset();

  std::cout << "[TradingCore] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// onVenueEvent(): telemetry first, then the queue
// -----------------------------------------------------------------------------
void TradingCore::onVenueEvent(Event event) {
  if (std::holds_alternative<VenueErrorEvent>(event)) {
    monitor_.recordError();
  } else if (std::holds_alternative<ConnectionDownEvent>(event)) {
    monitor_.setConnected(false);
  } else if (std::holds_alternative<ConnectionUpEvent>(event)) {
    monitor_.setConnected(true);
    monitor_.recordUpdate();
  } else if (const auto* hb = std::get_if<HeartbeatEvent>(&event)) {
    if (hb->latency_ms) {
      monitor_.recordLatency(*hb->latency_ms);
    }
    monitor_.recordUpdate();
  } else {
    monitor_.recordUpdate();
  }

  loop_.push(std::move(event));
}

IVenueClient::EventSink TradingCore::venueEventSink() {
  return [this](Event event) { onVenueEvent(std::move(event)); };
}

void TradingCore::publishCoreEvent(Event event) {
  if (!loop_.tryPush(std::move(event))) {
    std::cerr << "[TradingCore] WARNING: event queue full, core event not "
                 "published.\n";
  }
}

// -----------------------------------------------------------------------------
// Execution API
// -----------------------------------------------------------------------------
ExecutionResult TradingCore::execute(const domain::Decision& decision) {
  return dispatcher_->execute(decision, mode());
}

ExecutionResult TradingCore::execute(const domain::Decision& decision,
                                     domain::ExecutionMode mode) {
  return dispatcher_->execute(decision, mode);
}

CancelResult TradingCore::cancel(const domain::ClientOrderId& client_id) {
  return dispatcher_->cancel(client_id);
}

void TradingCore::setMode(domain::ExecutionMode mode) {
  const auto previous = mode_.exchange(mode);
  if (previous != mode) {
    std::cout << "[TradingCore] execution mode " << domain::toString(previous)
              << " -> " << domain::toString(mode) << "\n";
  }
}

// -----------------------------------------------------------------------------
// runHealthCheck()
// -----------------------------------------------------------------------------
void TradingCore::runHealthCheck() {
  // ---  1) Day boundary and mark-to-market -----------------------------------
  risk_.rollDayIfNeeded();
  risk_.updateEquity(account_.currentEquity());

  // ---  2) Connection health → kill switch -----------------------------------
  const auto health = monitor_.snapshot();
  risk_.evaluateConnectionHealth(health);

  // ---  3) Reconnect, rate limited -------------------------------------------
  if (health.is_stale || !health.connected) {
    bool attempt = false;
    {
      std::lock_guard lock(health_mutex_);
      const auto now = clock_.now_ms();
      if (!reconnect_attempted_ ||
          now - last_reconnect_at_ >=
              config_.engine.reconnect_cooldown.count()) {
        reconnect_attempted_ = true;
        last_reconnect_at_ = now;
        attempt = true;
      }
    }
    if (attempt) {
      monitor_.recordReconnect();
      if (!venue_.reconnect()) {
        std::cerr << "[TradingCore] WARNING: venue reconnect failed.\n";
      }
    }
  }

  // ---  4) Pending reconciliation --------------------------------------------
  if (reconciler_ != nullptr && dispatcher_->reconciliationRequired()) {
    if (dispatcher_->reconcile(*reconciler_)) {
      risk_.updateEquity(account_.currentEquity());
    }
  }

  // ---  5) Placements with unknown outcome -----------------------------------
  if (!dispatcher_->indeterminateIds().empty()) {
    dispatcher_->resolveIndeterminate();
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string TradingCore::executeCommand(const std::string& request) {
  nlohmann::json response;
  try {
    nlohmann::json parsed =
        nlohmann::json::parse(request, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_object()) {
      parsed = parseWords(request);
    }
    response = handleCommand(parsed);
  } catch (const std::exception& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] = e.what();
  }
  return response.dump();
}

nlohmann::json TradingCore::handleCommand(const nlohmann::json& request) {
  const auto cmd = optionalField<std::string>(request, "cmd", "");

  nlohmann::json response;
  response["status"] = "ok";

  if (cmd == "PING") {
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["data"] = statusJson();
  } else if (cmd == "HEALTH") {
    response["data"] = healthJson();
  } else if (cmd == "HALT") {
    const auto note =
        optionalField<std::string>(request, "note", "operator halt");
    response["activated"] =
        risk_.activateKillSwitch(domain::KillSwitchReason::ManualHalt, note);
    response["response"] = "Trading halted";
  } else if (cmd == "CLEAR_KILL_SWITCH") {
    const auto op = optionalField<std::string>(request, "operator", "");
    const auto note = optionalField<std::string>(request, "note", "");
    response["cleared"] = risk_.clearKillSwitch(op, note);
  } else if (cmd == "BREAKER_ON") {
    const auto reason =
        optionalField<std::string>(request, "reason", "operator");
    auto symbol = request.contains("symbol")
                      ? std::optional<std::string>(
                            request.at("symbol").get<std::string>())
                      : std::nullopt;
    risk_.engageCircuitBreaker(reason, symbol);
  } else if (cmd == "BREAKER_OFF") {
    auto symbol = request.contains("symbol")
                      ? std::optional<std::string>(
                            request.at("symbol").get<std::string>())
                      : std::nullopt;
    risk_.releaseCircuitBreaker(symbol);
  } else if (cmd == "SET_MODE") {
    const auto name = required<std::string>(request, "mode");
    auto mode = domain::executionModeFromString(name);
    if (!mode) {
      throw std::invalid_argument("unknown mode: " + name);
    }
    setMode(*mode);
    response["mode"] = domain::toString(*mode);
  } else if (cmd == "EXECUTE") {
    domain::Decision decision;
    decision.symbol = required<std::string>(request, "symbol");
    const auto dir = required<std::string>(request, "direction");
    auto direction = directionFromString(dir);
    if (!direction) {
      throw std::invalid_argument("unknown direction: " + dir);
    }
    decision.direction = *direction;
    decision.size_hint = optionalField<double>(request, "size_hint", 0.0);
    decision.confidence = optionalField<double>(request, "confidence", 1.0);
    decision.reason = optionalField<std::string>(request, "reason", "ipc");
    response["data"] = resultToJson(execute(decision));
  } else if (cmd == "CANCEL") {
    const auto id = required<std::string>(request, "client_id");
    const auto result = cancel(id);
    response["outcome"] = toString(result.outcome);
    response["detail"] = result.detail;
  } else if (cmd == "MARK") {
    const auto symbol = required<std::string>(request, "symbol");
    const auto price = required<double>(request, "price");
    if (!(price > 0.0)) {
      throw std::invalid_argument("price must be positive");
    }
    book_.updateMark(symbol, price);
    risk_.updateEquity(account_.currentEquity());
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }
  return response;
}

nlohmann::json TradingCore::statusJson() const {
  nlohmann::json j;
  j["mode"] = domain::toString(mode());
  j["risk"] = riskStatusToJson(risk_.getStatus());
  j["health"] = healthJson();
  j["reconciliation_required"] = dispatcher_->reconciliationRequired();
  j["indeterminate"] = dispatcher_->indeterminateIds();

  nlohmann::json orders = nlohmann::json::array();
  for (const auto& o : dispatcher_->openOrders()) {
    orders.push_back(orderToJson(o));
  }
  j["open_orders"] = std::move(orders);

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& pos : book_.getSnapshots()) {
    nlohmann::json p;
    p["symbol"] = pos.symbol;
    p["net_quantity"] = pos.net_quantity;
    p["average_price"] = pos.average_price;
    p["realized_pnl"] = pos.realized_pnl;
    p["mark_price"] = pos.mark_price;
    positions.push_back(std::move(p));
  }
  j["positions"] = std::move(positions);
  return j;
}

nlohmann::json TradingCore::healthJson() const {
  const auto h = monitor_.snapshot();
  nlohmann::json j;
  j["last_update_at"] = h.last_update_at;
  j["errors_in_window"] = h.consecutive_errors_in_window;
  j["reconnects_in_window"] = h.reconnect_count_in_window;
  j["latency_p95_ms"] = h.latency_p95_ms;
  j["is_stale"] = h.is_stale;
  j["stale_for_ms"] = h.stale_for_ms;
  j["connected"] = h.connected;
  return j;
}

}  // namespace tradeguard
