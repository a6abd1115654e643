#pragma once

#include "condorder/condition/i_condition_status_source.hpp"

#include <zmq.hpp>

#include <memory>
#include <string>

namespace condorder {

// -----------------------------------------------------------------------------
// ZmqConditionSource - ZeroMQ client for a market status service
// -----------------------------------------------------------------------------
//
// @brief  Answers getStatus() by asking an external status service over a
//         ZeroMQ REQ socket.
//
// @details
// The service (an indexer or node sidecar that watches the prediction
// market) binds a REP socket. Each getStatus() is one request/reply round
// trip with JSON bodies:
//
//   request:  { "type": "get_status", "condition_ref": "0x<64 hex>" }
//   reply:    { "remaining": "0x<hex>", "resolved_or_cancelled": true }
//         or  { "error": "<message>" }
//
// Failure handling:
//   - No reply within timeout_ms (ZMQ_RCVTIMEO) -> ConditionSourceError.
//     A REQ socket that sent without receiving is stuck in the "expect
//     reply" state, so the socket is dropped before the exception leaves
//     and the next call connects a fresh one.
//   - Reply that is not JSON, lacks a field, or carries "error"
//     -> ConditionSourceError.
//   - zmq::error_t from send/recv or from reconnecting -> ConditionSourceError.
//   The source never retries; retry policy belongs to the scheduler.
//
// Thread model:
//   NOT thread-safe. One REQ socket serves one request at a time. Use one
//   instance per polling thread. shutdown() is the exception and may be
//   called from any thread.
//
// Ownership:
//   Owns the zmq::context_t and the socket (RAII). The socket is held in a
//   unique_ptr so it can be dropped after a failure and replaced on the
//   next call.
// -----------------------------------------------------------------------------
class ZmqConditionSource final : public IConditionStatusSource {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Creates the context and connects a REQ socket to endpoint.
  //
  // @param  endpoint    ZMQ endpoint of the status service.
  // @param  timeout_ms  Per-request receive (and send) timeout.
  //
  // @details
  // connect() is asynchronous; an absent service only shows up as a timeout
  // on the first getStatus().
  // -------------------------------------------------------------------------
  explicit ZmqConditionSource(std::string endpoint = "tcp://127.0.0.1:5560",
                              int timeout_ms = kDefaultTimeoutMs);

  ~ZmqConditionSource() override = default;

  ZmqConditionSource(const ZmqConditionSource&) = delete;
  ZmqConditionSource& operator=(const ZmqConditionSource&) = delete;
  ZmqConditionSource(ZmqConditionSource&&) = delete;
  ZmqConditionSource& operator=(ZmqConditionSource&&) = delete;

  domain::ConditionStatus getStatus(
      const domain::ConditionRef& ref) const override;

  // -------------------------------------------------------------------------
  // shutdown()
  // -------------------------------------------------------------------------
  // Shuts the context down. A getStatus() blocked in another thread returns
  // at once, and every later call, fails with ConditionSourceError.
  // -------------------------------------------------------------------------
  void shutdown();

  static constexpr int kDefaultTimeoutMs = 1000;

 private:
  // Closes the current socket (if any) and connects a fresh one.
  void resetSocket() const;

  // Parses a reply body; throws ConditionSourceError on anything malformed.
  static domain::ConditionStatus parseReply(const std::string& body);

  std::string endpoint_;
  int timeout_ms_;

  // getStatus() is logically const (a read of remote state) but drives the
  // socket; the socket members are therefore mutable.
  mutable zmq::context_t context_{1};
  mutable std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace condorder
