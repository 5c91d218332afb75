#include "tradeguard/execution/execution_dispatcher.hpp"
#include "tradeguard/risk/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradeguard {

namespace {

constexpr const char* kReconciliationReason = "reconciliation_required";
constexpr const char* kVenueError = "venue_error";

// Client id an order-level venue event refers to, if any.
std::optional<domain::ClientOrderId> clientIdOf(const Event& event) {
  if (const auto* e = std::get_if<AcknowledgedEvent>(&event)) {
    return e->client_id;
  }
  if (const auto* e = std::get_if<FillEvent>(&event)) {
    return e->fill.order_client_id;
  }
  if (const auto* e = std::get_if<CancelledEvent>(&event)) {
    return e->client_id;
  }
  if (const auto* e = std::get_if<RejectedEvent>(&event)) {
    return e->client_id;
  }
  if (const auto* e = std::get_if<ExpiredEvent>(&event)) {
    return e->client_id;
  }
  return std::nullopt;
}

ExecutionResult rejected(domain::ExecutionMode mode,
                         std::vector<std::string> reasons,
                         std::string detail = {}) {
  ExecutionResult r;
  r.status = ExecutionStatus::Rejected;
  r.mode = mode;
  r.rejection_reasons = std::move(reasons);
  r.detail = std::move(detail);
  return r;
}

ExecutionStatus statusFor(domain::OrderStatus s) {
  switch (s) {
    case domain::OrderStatus::Filled:          return ExecutionStatus::Filled;
    case domain::OrderStatus::PartiallyFilled: return ExecutionStatus::PartiallyFilled;
    case domain::OrderStatus::Rejected:        return ExecutionStatus::Rejected;
    default:                                   return ExecutionStatus::Submitted;
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionDispatcher::ExecutionDispatcher(
    OrderTracker& tracker, RiskManager& risk, PositionBook& book,
    IAccountStateProvider& account, IVenueClient& venue,
    ClientIdGenerator& ids, const ITimeProvider& clock,
    DispatcherConfig config, RetryExecutor retry, ConnectionMonitor* monitor)
    : tracker_(tracker),
      risk_(risk),
      book_(book),
      account_(account),
      venue_(venue),
      ids_(ids),
      clock_(clock),
      config_(std::move(config)),
      retry_(std::move(retry)),
      monitor_(monitor),
      slippage_(std::make_unique<FixedBpsSlippage>(config_.slippage_bps)) {
  if (!(config_.paper_fill_ratio > 0.0) || config_.paper_fill_ratio > 1.0) {
    throw std::invalid_argument("paper_fill_ratio must be in (0, 1]");
  }
  if (config_.commission_rate < 0.0 || config_.slippage_bps < 0.0) {
    throw std::invalid_argument(
        "commission_rate and slippage_bps must not be negative");
  }
  if (config_.ack_timeout.count() <= 0) {
    throw std::invalid_argument("ack_timeout must be positive");
  }
}

// -----------------------------------------------------------------------------
// execute(): mode switch
// -----------------------------------------------------------------------------
ExecutionResult ExecutionDispatcher::execute(const domain::Decision& decision,
                                             domain::ExecutionMode mode) {
  RiskManager::checkDecision(decision);

  switch (mode) {
    case domain::ExecutionMode::DryRun: return executeDryRun(decision);
    case domain::ExecutionMode::Paper:  return executePaper(decision);
    case domain::ExecutionMode::Live:   return executeLive(decision);
  }
  throw std::invalid_argument("unknown execution mode");
}

// --- DRY_RUN -----------------------------------------------------------------

ExecutionResult ExecutionDispatcher::executeDryRun(
    const domain::Decision& decision) {
  ValidationResult verdict;
  {
    std::lock_guard lock(account_mutex_);
    verdict = risk_.validate(decision, snapshotLocked(decision.symbol));
  }

  // RiskManager already logged a rejection; that is the one log line.
  if (auto* rejection = std::get_if<Rejection>(&verdict)) {
    return rejected(domain::ExecutionMode::DryRun,
                    std::move(rejection->reasons));
  }

  const OrderIntent& intent = std::get<Approval>(verdict).intent;
  std::cout << "[ExecutionDispatcher] DRY_RUN " << decision.symbol << " "
            << domain::toString(decision.direction) << ": would "
            << domain::toString(intent.side) << " " << intent.qty << " @ "
            << intent.mark_price << " (notional " << intent.notional
            << ", reason: " << decision.reason << ")\n";

  ExecutionResult r;
  r.status = ExecutionStatus::DryRun;
  r.mode = domain::ExecutionMode::DryRun;
  r.intent = intent;
  return r;
}

// --- PAPER -------------------------------------------------------------------

ExecutionResult ExecutionDispatcher::executePaper(
    const domain::Decision& decision) {
  ExecutionResult r;
  r.mode = domain::ExecutionMode::Paper;
  Updates updates;
  {
    std::lock_guard lock(account_mutex_);
    auto verdict = risk_.validate(decision, snapshotLocked(decision.symbol));
    if (auto* rejection = std::get_if<Rejection>(&verdict)) {
      return rejected(r.mode, std::move(rejection->reasons));
    }
    const OrderIntent intent = std::get<Approval>(verdict).intent;

    OrderSpec spec;
    spec.client_id = ids_.next_id();
    spec.symbol = decision.symbol;
    spec.side = intent.side;
    spec.qty = intent.qty;

    tracker_.submit(makeOrder(spec));
    modes_[spec.client_id] = domain::ExecutionMode::Paper;
    risk_.recordTrade();
    pushUpdate(domain::OrderStatus::Submitted, spec.client_id, updates);

    tracker_.acknowledge(spec.client_id, "paper-" + spec.client_id);
    pushUpdate(domain::OrderStatus::Submitted, spec.client_id, updates);

    domain::Fill fill;
    fill.order_client_id = spec.client_id;
    fill.fill_id = "paper-fill-" + std::to_string(++paper_seq_);
    fill.qty = intent.qty * config_.paper_fill_ratio;
    fill.price = slippage_->fillPrice(intent.side, intent.mark_price, fill.qty);
    fill.commission = fill.qty * fill.price * config_.commission_rate;
    fill.commission_asset = config_.commission_asset;
    fill.timestamp = clock_.now_ms();
    fill.is_final = config_.paper_fill_ratio >= 1.0;
    applyFillLocked(fill, updates);

    r.client_id = spec.client_id;
    r.intent = intent;
    r.order = tracker_.get(spec.client_id);
    r.status = statusFor(r.order->status);
  }
  emit(updates);

  std::cout << "[ExecutionDispatcher] PAPER " << *r.client_id << " "
            << r.order->symbol << " " << domain::toString(r.order->side)
            << " " << r.order->filled_qty << "/" << r.order->requested_qty
            << " @ " << r.order->avg_fill_price.value_or(0.0) << "\n";
  return r;
}

// --- LIVE --------------------------------------------------------------------

ExecutionResult ExecutionDispatcher::executeLive(
    const domain::Decision& decision) {
  ExecutionResult r;
  r.mode = domain::ExecutionMode::Live;

  OrderSpec spec;
  {
    std::lock_guard lock(account_mutex_);
    auto verdict = risk_.validate(decision, snapshotLocked(decision.symbol));
    if (auto* rejection = std::get_if<Rejection>(&verdict)) {
      return rejected(r.mode, std::move(rejection->reasons));
    }
    const OrderIntent& intent = std::get<Approval>(verdict).intent;
    r.intent = intent;

    spec.client_id = ids_.next_id();
    spec.symbol = decision.symbol;
    spec.side = intent.side;
    spec.qty = intent.qty;

    InFlight reservation;
    reservation.spec = spec;
    reservation.notional = intent.notional;
    in_flight_.emplace(spec.client_id, std::move(reservation));
  }
  r.client_id = spec.client_id;

  const std::int64_t sent_at = clock_.now_ms();
  auto placed = venue_.placeOrder(spec, config_.ack_timeout);

  std::optional<domain::VenueOrderId> venue_id;
  std::optional<VenueOrderStatus> found_status;
  VenueErrorCode failure = VenueErrorCode::Network;
  std::string failure_detail;

  if (const auto* ack = std::get_if<VenueAck>(&placed)) {
    venue_id = ack->venue_id;
    if (monitor_ != nullptr) {
      monitor_->recordLatency(static_cast<double>(clock_.now_ms() - sent_at));
    }
  } else {
    const auto& error = std::get<VenueError>(placed);
    failure = error.code;
    failure_detail = error.message;

    if (isTransient(error.code)) {
      // Never resend: ask the venue whether it has the order.
      std::cerr << "[ExecutionDispatcher] WARNING: placement of "
                << spec.client_id << " failed (" << toString(error.code)
                << "), querying status before any further action.\n";
      auto status = retry_.run<VenueOrderStatus>(
          "getOrderStatus " + spec.client_id,
          [&] { return venue_.getOrderStatus(spec.client_id); });

      if (const auto* found = std::get_if<VenueOrderStatus>(&status)) {
        venue_id = found->venue_id;
        found_status = *found;
      } else {
        const auto& query_error = std::get<VenueError>(status);
        const bool confirmed_absent =
            query_error.code == VenueErrorCode::NotFound &&
            error.code != VenueErrorCode::Timeout;
        if (!confirmed_absent) {
          std::lock_guard lock(account_mutex_);
          auto it = in_flight_.find(spec.client_id);
          if (it != in_flight_.end()) {
            it->second.indeterminate = true;
          }
          std::cerr << "[ExecutionDispatcher] CRITICAL: placement of "
                    << spec.client_id
                    << " is indeterminate; reconcile by client id before "
                       "acting on it.\n";
          r.status = ExecutionStatus::Indeterminate;
          r.detail = std::string(toString(error.code)) + ": " + error.message;
          return r;
        }
      }
    }
  }

  if (!venue_id) {
    {
      std::lock_guard lock(account_mutex_);
      in_flight_.erase(spec.client_id);
    }
    std::cout << "[ExecutionDispatcher] LIVE " << spec.client_id
              << " rejected by venue (" << toString(failure) << "): "
              << failure_detail << "\n";
    auto result = rejected(r.mode, {kVenueError},
                           std::string(toString(failure)) + ": " +
                               failure_detail);
    result.client_id = spec.client_id;
    result.intent = r.intent;
    return result;
  }

  Updates updates;
  {
    std::lock_guard lock(account_mutex_);
    if (found_status) {
      r.order = adoptFoundLocked(spec.client_id, *found_status, updates);
    } else {
      r.order = registerLiveLocked(spec.client_id, *venue_id, updates);
    }
  }
  emit(updates);

  if (!r.order) {
    auto result = rejected(r.mode, {kVenueError},
                           "rejected at venue after " +
                               std::string(toString(failure)) + ": " +
                               failure_detail);
    result.client_id = spec.client_id;
    result.intent = r.intent;
    return result;
  }

  r.status = statusFor(r.order->status);
  std::cout << "[ExecutionDispatcher] LIVE " << spec.client_id << " "
            << spec.symbol << " " << domain::toString(spec.side) << " "
            << spec.qty << " acknowledged as " << *venue_id << "\n";
  return r;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
CancelResult ExecutionDispatcher::cancel(
    const domain::ClientOrderId& client_id) {
  Updates updates;
  {
    std::lock_guard lock(account_mutex_);
    auto current = tracker_.get(client_id);
    if (!current) {
      return {CancelOutcome::NotFound, "unknown client_id " + client_id};
    }
    if (domain::isTerminal(current->status)) {
      return {CancelOutcome::AlreadyTerminal,
              domain::toString(current->status)};
    }

    auto mode_it = modes_.find(client_id);
    const bool paper = mode_it != modes_.end() &&
                       mode_it->second == domain::ExecutionMode::Paper;
    if (paper) {
      tracker_.cancel(client_id);
      pushUpdate(current->status, client_id, updates);
    }
  }
  if (!updates.empty()) {
    emit(updates);
    std::cout << "[ExecutionDispatcher] PAPER " << client_id
              << " cancelled locally.\n";
    return {CancelOutcome::CancelledLocally, {}};
  }

  auto result = retry_.run<CancelAck>(
      "cancelOrder " + client_id, [&] { return venue_.cancelOrder(client_id); });
  if (const auto* error = std::get_if<VenueError>(&result)) {
    std::cerr << "[ExecutionDispatcher] WARNING: cancel " << client_id
              << " failed: " << toString(error->code) << " " << error->message
              << "\n";
    return {CancelOutcome::Failed,
            std::string(toString(error->code)) + ": " + error->message};
  }
  std::cout << "[ExecutionDispatcher] cancel requested for " << client_id
            << "\n";
  return {CancelOutcome::Requested, {}};
}

// -----------------------------------------------------------------------------
// onVenueEvent(): single-writer event path
// -----------------------------------------------------------------------------
void ExecutionDispatcher::onVenueEvent(const Event& event) {
  auto client_id = clientIdOf(event);
  if (!client_id) {
    return;
  }

  Updates updates;
  {
    std::lock_guard lock(account_mutex_);

    auto it = in_flight_.find(*client_id);
    if (it != in_flight_.end()) {
      const auto* ack = std::get_if<AcknowledgedEvent>(&event);
      if (it->second.indeterminate && ack != nullptr) {
        std::cout << "[ExecutionDispatcher] indeterminate " << *client_id
                  << " acknowledged by venue, adopting.\n";
        registerLiveLocked(*client_id, ack->venue_id, updates);
      } else if (it->second.indeterminate &&
                 std::holds_alternative<RejectedEvent>(event)) {
        std::cout << "[ExecutionDispatcher] indeterminate " << *client_id
                  << " rejected by venue, releasing reservation.\n";
        in_flight_.erase(it);
      } else {
        it->second.buffered.push_back(event);
      }
    } else {
      applyEventLocked(event, updates);
    }
  }
  emit(updates);
}

void ExecutionDispatcher::applyEventLocked(const Event& event,
                                           Updates& updates) {
  const auto client_id = *clientIdOf(event);

  if (!tracker_.contains(client_id)) {
    if (std::holds_alternative<FillEvent>(event)) {
      flagReconciliationLocked("fill for unknown client_id " + client_id);
    } else {
      std::cerr << "[ExecutionDispatcher] WARNING: event for unknown "
                   "client_id "
                << client_id << " ignored.\n";
    }
    return;
  }

  const domain::OrderStatus previous = tracker_.get(client_id)->status;
  try {
    if (const auto* e = std::get_if<AcknowledgedEvent>(&event)) {
      tracker_.acknowledge(client_id, e->venue_id);
      if (previous == domain::OrderStatus::Submitted) {
        pushUpdate(previous, client_id, updates);
      }
    } else if (const auto* e = std::get_if<FillEvent>(&event)) {
      applyFillLocked(e->fill, updates);
    } else if (std::holds_alternative<CancelledEvent>(event)) {
      tracker_.cancel(client_id);
      pushUpdate(previous, client_id, updates);
    } else if (const auto* e = std::get_if<RejectedEvent>(&event)) {
      tracker_.reject(client_id, e->reason);
      pushUpdate(previous, client_id, updates);
    } else if (std::holds_alternative<ExpiredEvent>(event)) {
      tracker_.expire(client_id);
      pushUpdate(previous, client_id, updates);
    }
  } catch (const TrackerError& e) {
    flagReconciliationLocked(e.what());
  }
}

void ExecutionDispatcher::applyFillLocked(const domain::Fill& fill,
                                          Updates& updates) {
  const auto& id = fill.order_client_id;
  const domain::Order before = *tracker_.get(id);
  const domain::Order after = tracker_.applyFill(id, fill);

  // Replayed fill: the tracker returned the order untouched.
  if (after.filled_qty == before.filled_qty &&
      after.status == before.status) {
    return;
  }
  pushUpdate(before.status, id, updates);

  const double realized = book_.applyFill(after.symbol, after.side, fill.qty,
                                          fill.price, fill.commission);
  FillOutcome outcome;
  outcome.symbol = after.symbol;
  outcome.realized_pnl = realized;
  outcome.commission = fill.commission;
  outcome.equity_after = account_.currentEquity();
  risk_.updateAfterFill(outcome);
}

// -----------------------------------------------------------------------------
// registerLiveLocked(): the order enters the tracker only once acknowledged
// -----------------------------------------------------------------------------
domain::Order ExecutionDispatcher::registerLiveLocked(
    const domain::ClientOrderId& client_id,
    const domain::VenueOrderId& venue_id, Updates& updates) {
  auto it = in_flight_.find(client_id);
  if (it == in_flight_.end()) {
    throw std::logic_error("registerLive without reservation: " + client_id);
  }
  InFlight reservation = std::move(it->second);
  in_flight_.erase(it);

  try {
    tracker_.submit(makeOrder(reservation.spec));
    modes_[client_id] = domain::ExecutionMode::Live;
    risk_.recordTrade();
    pushUpdate(domain::OrderStatus::Submitted, client_id, updates);

    tracker_.acknowledge(client_id, venue_id);
    pushUpdate(domain::OrderStatus::Submitted, client_id, updates);
  } catch (const TrackerError& e) {
    flagReconciliationLocked(e.what());
  }

  for (const auto& buffered : reservation.buffered) {
    applyEventLocked(buffered, updates);
  }

  auto order = tracker_.get(client_id);
  return order ? *order : makeOrder(reservation.spec);
}

// -----------------------------------------------------------------------------
// adoptFoundLocked(): registration from a getOrderStatus() answer
// -----------------------------------------------------------------------------
// The answer is authoritative. For a finished order, a fill total ahead of
// the tracker's is applied as one catch-up fill priced so the order's
// average matches the venue's, then Cancelled/Expired is applied. The order
// is then terminal, so the delayed stream fill cannot book twice. Missing
// fills on a still-working order flag reconciliation instead. A rejected
// order is never tracked.
// -----------------------------------------------------------------------------
std::optional<domain::Order> ExecutionDispatcher::adoptFoundLocked(
    const domain::ClientOrderId& client_id, const VenueOrderStatus& found,
    Updates& updates) {
  if (found.status == domain::OrderStatus::Rejected) {
    in_flight_.erase(client_id);
    std::cout << "[ExecutionDispatcher] " << client_id
              << " rejected at venue, releasing reservation.\n";
    if (found.filled_qty > 0.0) {
      flagReconciliationLocked("venue reports fills on rejected " +
                               client_id);
    }
    return std::nullopt;
  }

  domain::Order local = registerLiveLocked(client_id, found.venue_id, updates);
  if (!tracker_.contains(client_id)) {
    return local;
  }

  const double tol = 1e-9 * std::max(1.0, local.requested_qty);
  const double missing = found.filled_qty - local.filled_qty;
  if (missing > tol) {
    const double venue_notional =
        found.avg_fill_price.value_or(0.0) * found.filled_qty;
    const double local_notional =
        local.avg_fill_price.value_or(0.0) * local.filled_qty;
    const double price = (venue_notional - local_notional) / missing;

    if (!domain::isTerminal(found.status) || !found.avg_fill_price ||
        !(price > 0.0) || !std::isfinite(price) ||
        domain::isTerminal(local.status)) {
      flagReconciliationLocked("venue reports " +
                               std::to_string(found.filled_qty) +
                               " filled for " + client_id +
                               ", tracker has " +
                               std::to_string(local.filled_qty));
    } else {
      domain::Fill fill;
      fill.order_client_id = client_id;
      fill.fill_id = "status-" + client_id + "-" +
                     std::to_string(found.filled_qty);
      fill.qty = missing;
      fill.price = price;
      fill.timestamp = clock_.now_ms();
      fill.is_final = found.status == domain::OrderStatus::Filled;
      std::cerr << "[ExecutionDispatcher] WARNING: " << client_id
                << " missed fills; applying " << missing << " @ " << price
                << " from venue status (commission unknown).\n";
      try {
        applyFillLocked(fill, updates);
      } catch (const TrackerError& e) {
        flagReconciliationLocked(e.what());
      }
    }
  }

  const domain::OrderStatus previous = tracker_.get(client_id)->status;
  if (!domain::isTerminal(previous)) {
    try {
      if (found.status == domain::OrderStatus::Cancelled) {
        tracker_.cancel(client_id);
        pushUpdate(previous, client_id, updates);
      } else if (found.status == domain::OrderStatus::Expired) {
        tracker_.expire(client_id);
        pushUpdate(previous, client_id, updates);
      }
    } catch (const TrackerError& e) {
      flagReconciliationLocked(e.what());
    }
  }
  return tracker_.get(client_id);
}

// -----------------------------------------------------------------------------
// resolveIndeterminate()
// -----------------------------------------------------------------------------
std::size_t ExecutionDispatcher::resolveIndeterminate() {
  const auto ids = indeterminateIds();
  std::size_t resolved = 0;

  for (const auto& id : ids) {
    auto status = retry_.run<VenueOrderStatus>(
        "getOrderStatus " + id, [&] { return venue_.getOrderStatus(id); });

    Updates updates;
    {
      std::lock_guard lock(account_mutex_);
      auto it = in_flight_.find(id);
      if (it == in_flight_.end()) {
        continue;  // Adopted by an event meanwhile
      }
      if (const auto* found = std::get_if<VenueOrderStatus>(&status)) {
        std::cout << "[ExecutionDispatcher] indeterminate " << id
                  << " found at venue as " << found->venue_id << " ("
                  << domain::toString(found->status) << ")\n";
        adoptFoundLocked(id, *found, updates);
        ++resolved;
      } else if (std::get<VenueError>(status).code ==
                 VenueErrorCode::NotFound) {
        std::cout << "[ExecutionDispatcher] indeterminate " << id
                  << " not at venue, releasing reservation.\n";
        in_flight_.erase(it);
        ++resolved;
      }
    }
    emit(updates);
  }
  return resolved;
}

// -----------------------------------------------------------------------------
// reconcile()
// -----------------------------------------------------------------------------
bool ExecutionDispatcher::reconcile(IReconciler& reconciler) {
  std::vector<domain::Order> orders;
  std::vector<domain::Position> positions;
  try {
    orders = reconciler.reconcileOrders();
    positions = reconciler.reconcilePositions();
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionDispatcher] WARNING: reconciliation failed: "
              << e.what() << "\n";
    return false;
  }

  bool release = false;
  {
    std::lock_guard lock(account_mutex_);
    tracker_.rebuildOpenOrders(orders);
    for (const auto& o : orders) {
      modes_[o.client_id] = domain::ExecutionMode::Live;
    }
    book_.replaceAll(positions);
    release = reconciliation_required_;
    reconciliation_required_ = false;
  }

  if (release && risk_.state().circuit_breaker_reason == kReconciliationReason) {
    risk_.releaseCircuitBreaker();
  }
  risk_.updateEquity(account_.currentEquity());

  std::cout << "[ExecutionDispatcher] reconciliation complete: "
            << positions.size() << " position(s), " << orders.size()
            << " open order(s).\n";
  return true;
}

void ExecutionDispatcher::flagReconciliationLocked(const std::string& detail) {
  std::cerr << "[ExecutionDispatcher] CRITICAL: local state out of sync ("
            << detail << "); reconciliation required.\n";
  reconciliation_required_ = true;
  // Every desync re-engages: an operator may have released the breaker
  // since the last one. A breaker already held for another reason is left
  // alone so reconcile() cannot release it.
  if (!risk_.state().circuit_breaker_engaged) {
    risk_.engageCircuitBreaker(kReconciliationReason);
  }
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
void ExecutionDispatcher::requireReconciliation(const std::string& detail) {
  std::lock_guard lock(account_mutex_);
  flagReconciliationLocked(detail);
}

bool ExecutionDispatcher::reconciliationRequired() const {
  std::lock_guard lock(account_mutex_);
  return reconciliation_required_;
}

std::vector<domain::Order> ExecutionDispatcher::openOrders() const {
  std::lock_guard lock(account_mutex_);
  return tracker_.openOrders();
}

std::optional<domain::Order> ExecutionDispatcher::order(
    const domain::ClientOrderId& id) const {
  std::lock_guard lock(account_mutex_);
  return tracker_.get(id);
}

std::optional<domain::ExecutionMode> ExecutionDispatcher::modeOf(
    const domain::ClientOrderId& id) const {
  std::lock_guard lock(account_mutex_);
  auto it = modes_.find(id);
  if (it == modes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::ClientOrderId> ExecutionDispatcher::indeterminateIds()
    const {
  std::lock_guard lock(account_mutex_);
  std::vector<domain::ClientOrderId> ids;
  for (const auto& [id, reservation] : in_flight_) {
    if (reservation.indeterminate) {
      ids.push_back(id);
    }
  }
  return ids;
}

void ExecutionDispatcher::setOrderUpdateListener(OrderUpdateListener listener) {
  std::lock_guard lock(account_mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// snapshotLocked(): the aggregate a decision is validated against
// -----------------------------------------------------------------------------
AccountSnapshot ExecutionDispatcher::snapshotLocked(
    const std::string& symbol) const {
  AccountSnapshot snap;
  snap.equity = account_.currentEquity();
  snap.positions = account_.openPositions();

  auto addMark = [&](const std::string& s) {
    if (snap.marks.count(s) != 0) {
      return;
    }
    if (auto m = account_.markPrice(s)) {
      snap.marks[s] = *m;
    }
  };
  addMark(symbol);
  for (const auto& pos : snap.positions) {
    addMark(pos.symbol);
  }

  for (const auto& o : tracker_.openOrders()) {
    addMark(o.symbol);
    double px = o.limit_price.value_or(0.0);
    if (px <= 0.0) {
      auto it = snap.marks.find(o.symbol);
      px = it != snap.marks.end() ? it->second : o.avg_fill_price.value_or(0.0);
    }
    snap.open_order_notional += std::max(o.remainingQty(), 0.0) * px;
    ++snap.open_order_count;
  }
  for (const auto& [id, reservation] : in_flight_) {
    snap.open_order_notional += reservation.notional;
    ++snap.open_order_count;
  }
  return snap;
}

domain::Order ExecutionDispatcher::makeOrder(const OrderSpec& spec) const {
  domain::Order order;
  order.client_id = spec.client_id;
  order.symbol = spec.symbol;
  order.side = spec.side;
  order.type = spec.type;
  order.requested_qty = spec.qty;
  order.limit_price = spec.limit_price;
  order.created_at = clock_.now_ms();
  return order;
}

void ExecutionDispatcher::pushUpdate(domain::OrderStatus previous,
                                     const domain::ClientOrderId& client_id,
                                     Updates& updates) {
  auto snapshot = tracker_.get(client_id);
  if (!snapshot) {
    return;
  }
  OrderUpdateEvent update;
  update.order = std::move(*snapshot);
  update.previous_status = previous;
  update.timestamp = clock_.now_ms();
  updates.push_back(std::move(update));
}

void ExecutionDispatcher::emit(const Updates& updates) {
  if (!listener_) {
    return;
  }
  for (const auto& update : updates) {
    listener_(update);
  }
}

}  // namespace tradeguard
