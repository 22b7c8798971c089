#include "gridmm/engine/account_context.hpp"
#include "gridmm/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace gridmm {

// -----------------------------------------------------------------------------
// Constructor: build components; no threads yet
// -----------------------------------------------------------------------------
AccountContext::AccountContext(AccountConfig config, IntentIdGenerator& ids,
                               const ITimeProvider& clock,
                               std::unique_ptr<IExchangeAdapter> adapter,
                               ProfitRecorder* recorder,
                               TelemetrySink telemetry,
                               ExecutionGateway::Sleeper sleeper)
    : config_(std::move(config)),
      clock_(clock),
      recorder_(recorder),
      telemetry_(std::move(telemetry)),
      reconcile_loop_("reconcile:" + config_.userid),
      ledger_(ids, config_.instrument.symbol),
      planner_(config_.grid, config_.instrument),
      guard_(config_.grid.max_position, config_.instrument),
      adapter_(std::move(adapter)) {
  engine_ = std::make_unique<ReconciliationEngine>(
      reconcile_loop_.eventBus(), clock_, config_.userid, ledger_, planner_,
      guard_);

  routing_ = std::make_unique<OrderRoutingThread>(
      *adapter_, clock_, config_.instrument.symbol, config_.retry,
      config_.grid.call_deadline_ms, std::move(sleeper));

  tick_timer_ = std::make_unique<PeriodicTimer>(
      "tick:" + config_.userid, tickPeriod(),
      [this] { reconcile_loop_.push(ClockTickEvent{clock_.now_ms()}); });

  snapshot_timer_ = std::make_unique<PeriodicTimer>(
      "snapshot:" + config_.userid,
      std::chrono::milliseconds(config_.grid.snapshot_poll_interval_ms),
      [this] { routing_->push(SnapshotRequestEvent{clock_.now_ms()}); });

  wireBridges();
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop, then tear down in dependency order
// -----------------------------------------------------------------------------
AccountContext::~AccountContext() {
  stop();
  snapshot_timer_.reset();
  tick_timer_.reset();
  routing_.reset();
  engine_.reset();
}

// -----------------------------------------------------------------------------
// start(): snapshot gate, hydrate, then threads
// -----------------------------------------------------------------------------
void AccountContext::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Synchronization gate ---------------------------------------------
  SnapshotResult snapshot = routing_->gateway().fetchSnapshot();
  if (snapshot.error != domain::VenueError::None) {
    throw StartupError(config_.userid + ": initial snapshot failed with " +
                       domain::toString(snapshot.error) + " " +
                       snapshot.message);
  }
  hydrate(snapshot);

  // ---  2) Loops ------------------------------------------------------------
  reconcile_loop_.start();
  routing_->start();

  // ---  3) Venue stream -----------------------------------------------------
  adapter_->start([this](Event event) { reconcile_loop_.push(std::move(event)); });

  // ---  4) Timers -----------------------------------------------------------
  tick_timer_->start();
  snapshot_timer_->start();

  created_at_ms_ = clock_.now_ms();
  running_.store(true);
  recordStatus(domain::AccountStatus::Active);

  std::cout << "[AccountContext] " << config_.userid << " started on "
            << config_.instrument.symbol << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): inflow first, then loops
// -----------------------------------------------------------------------------
void AccountContext::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  snapshot_timer_->stop();
  tick_timer_->stop();
  adapter_->stop();
  routing_->stop();
  reconcile_loop_.stop();

  recordStatus(domain::AccountStatus::Stopped);

  const auto snap = ledger_.snapshot();
  std::cout << "[AccountContext] " << config_.userid
            << " stopped. position=" << snap.position.net_quantity
            << " realized_pnl=" << snap.position.realized_pnl
            << " working_orders=" << snap.working_orders << "\n";
}

void AccountContext::pushEvent(Event event) {
  reconcile_loop_.push(std::move(event));
}

void AccountContext::pause() {
  if (paused_.exchange(true)) {
    return;
  }
  reconcile_loop_.push(
      AccountCommandEvent{AccountCommandEvent::Command::Pause});
  recordStatus(domain::AccountStatus::Paused);
  std::cout << "[AccountContext] " << config_.userid << " paused.\n";
}

void AccountContext::resume() {
  if (!paused_.exchange(false)) {
    return;
  }
  reconcile_loop_.push(
      AccountCommandEvent{AccountCommandEvent::Command::Resume});
  recordStatus(domain::AccountStatus::Active);
  std::cout << "[AccountContext] " << config_.userid << " resumed.\n";
}

AccountStatusView AccountContext::status() const {
  AccountStatusView view;
  view.userid = config_.userid;
  view.symbol = config_.instrument.symbol;
  view.running = running_.load();
  view.paused = paused_.load();
  view.ledger = ledger_.snapshot();
  return view;
}

std::chrono::milliseconds AccountContext::tickPeriod() const {
  const std::int64_t period =
      std::clamp<std::int64_t>(config_.grid.ack_deadline_ms / 4, 50, 1000);
  return std::chrono::milliseconds(period);
}

// -----------------------------------------------------------------------------
// hydrate(): seed the ledger from the startup snapshot
// -----------------------------------------------------------------------------
// Runs on the calling thread before the reconcile loop exists, so the
// ledger has a single writer.
// -----------------------------------------------------------------------------
void AccountContext::hydrate(const SnapshotResult& snapshot) {
  const std::int64_t now_ms = clock_.now_ms();

  ledger_.correctPosition(snapshot.net_position, 0.0);
  for (const auto& report : snapshot.open_orders) {
    ledger_.adoptVenueOrder(report, now_ms);
  }

  std::cout << "[AccountContext] " << config_.userid
            << " hydrated: position=" << snapshot.net_position << ", "
            << snapshot.open_orders.size() << " open order(s) adopted.\n";
}

// -----------------------------------------------------------------------------
// wireBridges(): cross-thread forwarding and telemetry
// -----------------------------------------------------------------------------
void AccountContext::wireBridges() {
  EventBus& reconcile = reconcile_loop_.eventBus();
  EventBus& routing = routing_->eventBus();

  // Bridge 1: commands from reconcile → routing.
  reconcile.subscribe<PlaceOrderCommand>(
      [this](const PlaceOrderCommand& e) { routing_->push(e); });
  reconcile.subscribe<CancelOrderCommand>(
      [this](const CancelOrderCommand& e) { routing_->push(e); });
  reconcile.subscribe<QueryOrderCommand>(
      [this](const QueryOrderCommand& e) { routing_->push(e); });

  // Bridge 2: results from routing → reconcile.
  routing.subscribe<PlaceResultEvent>(
      [this](const PlaceResultEvent& e) { reconcile_loop_.push(e); });
  routing.subscribe<CancelResultEvent>(
      [this](const CancelResultEvent& e) { reconcile_loop_.push(e); });
  routing.subscribe<StatusQueryResultEvent>(
      [this](const StatusQueryResultEvent& e) { reconcile_loop_.push(e); });
  routing.subscribe<AccountSnapshotEvent>(
      [this](const AccountSnapshotEvent& e) { reconcile_loop_.push(e); });

  // Bridge 3: realized profit → recorder.
  if (recorder_ != nullptr) {
    reconcile.subscribe<ProfitRealizedEvent>(
        [this](const ProfitRealizedEvent& e) {
          recorder_->recordProfit(config_.userid, e.entry);
        });
  }

  // Bridge 4: telemetry.
  if (telemetry_) {
    reconcile.subscribe<OrderUpdateEvent>(
        [this](const OrderUpdateEvent& e) { telemetry_(e); });
    reconcile.subscribe<PositionUpdateEvent>(
        [this](const PositionUpdateEvent& e) { telemetry_(e); });
    reconcile.subscribe<ProfitRealizedEvent>(
        [this](const ProfitRealizedEvent& e) { telemetry_(e); });
    reconcile.subscribe<RiskRejectEvent>(
        [this](const RiskRejectEvent& e) { telemetry_(e); });
    reconcile.subscribe<DivergenceEvent>(
        [this](const DivergenceEvent& e) { telemetry_(e); });
    reconcile.subscribe<HeartbeatEvent>(
        [this](const HeartbeatEvent& e) { telemetry_(e); });
  }
}

void AccountContext::recordStatus(domain::AccountStatus status) {
  if (recorder_ == nullptr) {
    return;
  }
  domain::MonitorAccount account;
  account.userid = config_.userid;
  account.username = config_.username;
  account.status = status;
  account.created_at_ms = created_at_ms_;
  account.updated_at_ms = clock_.now_ms();
  recorder_->recordAccount(account);
}

}  // namespace gridmm
