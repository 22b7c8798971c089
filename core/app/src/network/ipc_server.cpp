#include "gridmm/network/ipc_server.hpp"
#include "gridmm/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace gridmm {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain: publish any remaining telemetry before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  // REP requires exactly one reply per request, so a failing handler still
  // answers.
  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    nlohmann::json j;
    j["status"] = "error";
    j["response"] = e.what();
    response = j.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    return formatOrderUpdate(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<ProfitRealizedEvent>(&event)) {
    return formatProfit(*e);
  }
  if (auto* e = std::get_if<RiskRejectEvent>(&event)) {
    return formatRiskReject(*e);
  }
  if (auto* e = std::get_if<DivergenceEvent>(&event)) {
    return formatDivergence(*e);
  }
  if (auto* e = std::get_if<HeartbeatEvent>(&event)) {
    return formatHealth(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatOrderUpdate(const OrderUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "order_update";
  j["userid"] = e.userid;
  j["intent_id"] = e.order.intent_id;
  j["venue_order_id"] =
      e.order.venue_order_id ? nlohmann::json(*e.order.venue_order_id)
                             : nlohmann::json(nullptr);
  j["side"] = domain::toString(e.order.side);
  j["order_type"] = domain::toString(e.order.type);
  j["purpose"] = domain::toString(e.order.purpose);
  j["status"] = domain::toString(e.order.status);
  j["previous_status"] = domain::toString(e.previous_status);
  j["price"] = e.order.price;
  j["quantity"] = e.order.quantity;
  j["filled_quantity"] = e.order.filled_quantity;
  if (e.order.level_index) {
    j["level_index"] = *e.order.level_index;
  }
  j["generation"] = e.order.generation;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatPositionUpdate(const PositionUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "position_update";
  j["userid"] = e.userid;
  j["symbol"] = e.position.symbol;
  j["net_quantity"] = e.position.net_quantity;
  j["average_price"] = e.position.average_price;
  j["realized_pnl"] = e.position.realized_pnl;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatProfit(const ProfitRealizedEvent& e) {
  nlohmann::json j;
  j["type"] = "profit";
  j["userid"] = e.userid;
  j["price"] = e.entry.price;
  j["position"] = e.entry.position;
  j["period_profit"] = e.entry.period_profit;
  j["closed_quantity"] = e.closed_quantity;
  j["created_at_ms"] = e.entry.created_at_ms;
  return j.dump();
}

std::string IpcServer::formatRiskReject(const RiskRejectEvent& e) {
  nlohmann::json j;
  j["type"] = "risk_reject";
  j["userid"] = e.userid;
  j["reason"] = domain::toString(e.reason);
  j["side"] = domain::toString(e.side);
  j["purpose"] = domain::toString(e.purpose);
  j["requested_quantity"] = e.requested_quantity;
  j["price"] = e.price;
  j["position"] = e.position;
  return j.dump();
}

std::string IpcServer::formatDivergence(const DivergenceEvent& e) {
  nlohmann::json j;
  j["type"] = "divergence";
  j["userid"] = e.userid;
  j["kind"] = toString(e.kind);
  j["intent_id"] = e.intent_id;
  j["venue_order_id"] = e.venue_order_id;
  j["local_value"] = e.local_value;
  j["venue_value"] = e.venue_value;
  return j.dump();
}

std::string IpcServer::formatHealth(const HeartbeatEvent& e) {
  nlohmann::json j;
  j["type"] = "health";
  j["component"] = e.component_id;
  j["status"] = e.status;
  j["detail"] = e.detail;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

}  // namespace gridmm
