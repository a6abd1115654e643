#include "condorder/condition/zmq_condition_source.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace condorder {

// -----------------------------------------------------------------------------
// Constructor: create and connect the REQ socket
// -----------------------------------------------------------------------------
ZmqConditionSource::ZmqConditionSource(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {
  resetSocket();
}

// -----------------------------------------------------------------------------
// resetSocket(): drop the old socket and connect a new one
// -----------------------------------------------------------------------------
// May throw zmq::error_t. Only called from the constructor and from inside
// getStatus()'s try block, so callers of getStatus() only ever see
// ConditionSourceError.
// -----------------------------------------------------------------------------
void ZmqConditionSource::resetSocket() const {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);

  // Bound both directions so getStatus() can never block forever, and drop
  // unsent requests on close instead of lingering.
  socket_->set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::sndtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::linger, 0);

  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// getStatus(): one request/reply round trip
// -----------------------------------------------------------------------------
domain::ConditionStatus ZmqConditionSource::getStatus(
    const domain::ConditionRef& ref) const {
  nlohmann::json request;
  request["type"] = "get_status";
  request["condition_ref"] = ref.toHex();
  const std::string body = request.dump();

  zmq::message_t reply;
  try {
    // Dropped after the previous failure; reconnect here.
    if (!socket_) {
      resetSocket();
    }

    zmq::message_t msg(body.data(), body.size());
    auto sent = socket_->send(msg, zmq::send_flags::none);
    if (!sent.has_value()) {
      socket_.reset();
      throw ConditionSourceError("status request to " + endpoint_ +
                                 " timed out on send");
    }

    auto received = socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      // REQ is now waiting for a reply that may never come; start over.
      socket_.reset();
      std::cerr << "[ZmqConditionSource] no reply from " << endpoint_
                << " within " << timeout_ms_ << " ms for "
                << ref.toHex() << "\n";
      throw ConditionSourceError("status request to " + endpoint_ +
                                 " timed out");
    }
  } catch (const zmq::error_t& e) {
    socket_.reset();
    throw ConditionSourceError(std::string("zmq error talking to ") +
                               endpoint_ + ": " + e.what());
  }

  return parseReply(reply.to_string());
}

// -----------------------------------------------------------------------------
// shutdown(): fail pending and future requests
// -----------------------------------------------------------------------------
void ZmqConditionSource::shutdown() {
  std::cerr << "[ZmqConditionSource] shutting down client for " << endpoint_
            << "\n";
  context_.shutdown();
}

// -----------------------------------------------------------------------------
// parseReply(): JSON body -> ConditionStatus
// -----------------------------------------------------------------------------
domain::ConditionStatus ZmqConditionSource::parseReply(
    const std::string& body) {
  try {
    auto json = nlohmann::json::parse(body);

    if (json.contains("error")) {
      throw ConditionSourceError("status service error: " +
                                 json.at("error").get<std::string>());
    }

    domain::ConditionStatus status;
    status.remaining =
        domain::Word256::fromHex(json.at("remaining").get<std::string>());
    status.resolved_or_cancelled =
        json.at("resolved_or_cancelled").get<bool>();
    return status;

  } catch (const nlohmann::json::exception& e) {
    throw ConditionSourceError(std::string("malformed status reply: ") +
                               e.what() + " - payload: " + body);
  } catch (const std::invalid_argument& e) {
    throw ConditionSourceError(std::string("malformed status reply: ") +
                               e.what());
  }
}

}  // namespace condorder
