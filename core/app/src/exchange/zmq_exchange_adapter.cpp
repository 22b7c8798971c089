#include "gridmm/exchange/zmq_exchange_adapter.hpp"
#include "gridmm/exchange/venue_codec.hpp"

#include <iostream>
#include <utility>

namespace gridmm {

ZmqExchangeAdapter::ZmqExchangeAdapter(std::string symbol,
                                       std::string command_endpoint,
                                       std::string event_endpoint)
    : symbol_(std::move(symbol)),
      command_endpoint_(std::move(command_endpoint)),
      event_endpoint_(std::move(event_endpoint)) {
  std::lock_guard lock(req_mutex_);
  resetRequestSocket();
}

ZmqExchangeAdapter::~ZmqExchangeAdapter() {
  stop();
  std::lock_guard lock(req_mutex_);
  req_socket_.reset();
}

// -----------------------------------------------------------------------------
// start(): spawn the stream thread
// -----------------------------------------------------------------------------
void ZmqExchangeAdapter::start(EventSink sink) {
  if (running_.load()) {
    return;
  }
  sink_ = std::move(sink);
  running_.store(true);
  stream_thread_ = std::thread([this] { runStream(); });

  std::cout << "[ZmqExchange] started for " << symbol_
            << ". CMD=" << command_endpoint_ << " EVT=" << event_endpoint_
            << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join the stream thread
// -----------------------------------------------------------------------------
void ZmqExchangeAdapter::stop() {
  if (!running_.exchange(false)) {
    if (stream_thread_.joinable()) {
      stream_thread_.join();
    }
    return;
  }
  if (stream_thread_.joinable()) {
    stream_thread_.join();
  }
  std::cout << "[ZmqExchange] stopped.\n";
}

PlaceResult ZmqExchangeAdapter::placeOrder(const PlaceRequest& request,
                                           std::int64_t deadline_ms) {
  nlohmann::json reply;
  PlaceResult result;
  result.error =
      call(VenueCodec::encodePlace(request), deadline_ms, reply, result.message);
  if (result.error != domain::VenueError::None) {
    return result;
  }
  return VenueCodec::decodePlaceReply(reply);
}

CancelResult ZmqExchangeAdapter::cancelOrder(const std::string& symbol,
                                             const std::string& venue_order_id,
                                             std::int64_t deadline_ms) {
  nlohmann::json reply;
  CancelResult result;
  result.error = call(VenueCodec::encodeCancel(symbol, venue_order_id),
                      deadline_ms, reply, result.message);
  if (result.error != domain::VenueError::None) {
    return result;
  }
  return VenueCodec::decodeCancelReply(reply);
}

QueryResult ZmqExchangeAdapter::queryOrder(
    const std::string& symbol, domain::IntentId intent_id,
    const std::optional<std::string>& venue_order_id,
    std::int64_t deadline_ms) {
  nlohmann::json reply;
  QueryResult result;
  result.error =
      call(VenueCodec::encodeQuery(symbol, intent_id, venue_order_id),
           deadline_ms, reply, result.message);
  if (result.error != domain::VenueError::None) {
    return result;
  }
  return VenueCodec::decodeQueryReply(reply);
}

SnapshotResult ZmqExchangeAdapter::getAccountSnapshot(
    const std::string& symbol, std::int64_t deadline_ms) {
  nlohmann::json reply;
  SnapshotResult result;
  result.error = call(VenueCodec::encodeSnapshot(symbol), deadline_ms, reply,
                      result.message);
  if (result.error != domain::VenueError::None) {
    return result;
  }
  return VenueCodec::decodeSnapshotReply(reply);
}

// -----------------------------------------------------------------------------
// call(): one REQ/REP cycle bounded by the deadline
// -----------------------------------------------------------------------------
domain::VenueError ZmqExchangeAdapter::call(const nlohmann::json& request,
                                            std::int64_t deadline_ms,
                                            nlohmann::json& reply,
                                            std::string& message) {
  std::lock_guard lock(req_mutex_);
  const std::string payload = request.dump();

  try {
    req_socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(deadline_ms));

    zmq::message_t out(payload.data(), payload.size());
    req_socket_->send(out, zmq::send_flags::none);

    zmq::message_t in;
    auto received = req_socket_->recv(in, zmq::recv_flags::none);
    if (!received.has_value()) {
      std::cerr << "[ZmqExchange] WARNING: no reply within " << deadline_ms
                << " ms for " << request.value("op", std::string("?"))
                << ", resetting socket.\n";
      resetRequestSocket();
      message = "deadline expired";
      return domain::VenueError::Timeout;
    }

    reply = nlohmann::json::parse(in.to_string());
    return domain::VenueError::None;

  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqExchange] transport error: " << e.what() << "\n";
    resetRequestSocket();
    message = e.what();
    return domain::VenueError::TransportFailure;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqExchange] unparseable reply: " << e.what() << "\n";
    message = e.what();
    return domain::VenueError::TransportFailure;
  }
}

void ZmqExchangeAdapter::resetRequestSocket() {
  if (req_socket_) {
    req_socket_->set(zmq::sockopt::linger, 0);
    req_socket_->close();
  }
  req_socket_ =
      std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  req_socket_->set(zmq::sockopt::linger, 0);
  req_socket_->connect(command_endpoint_);
}

// -----------------------------------------------------------------------------
// runStream(): SUB recv loop on the stream thread
// -----------------------------------------------------------------------------
void ZmqExchangeAdapter::runStream() {
  zmq::socket_t socket(context_, zmq::socket_type::sub);
  socket.set(zmq::sockopt::subscribe, "");
  socket.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket.set(zmq::sockopt::linger, 0);
  socket.connect(event_endpoint_);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[ZmqExchange] stream error: " << e.what() << "\n";
      break;
    }

    if (!result.has_value()) {
      continue;
    }

    const std::string payload = msg.to_string();
    nlohmann::json json;
    try {
      json = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[ZmqExchange] JSON parse error: " << e.what()
                << ", payload: " << payload << "\n";
      continue;
    }

    if (auto event = VenueCodec::decodeStreamMessage(json, symbol_)) {
      sink_(std::move(*event));
    }
  }
}

}  // namespace gridmm
