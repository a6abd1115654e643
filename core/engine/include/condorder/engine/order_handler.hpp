#pragma once

#include "condorder/condition/i_condition_status_source.hpp"
#include "condorder/evaluation/order_evaluator.hpp"
#include "condorder/evaluation/poll_outcome.hpp"
#include "condorder/order/linked_bet_order.hpp"
#include "condorder/time/i_time_provider.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace condorder {

// -----------------------------------------------------------------------------
// OrderHandler - evaluate(payload) entry point for the scheduler
// -----------------------------------------------------------------------------
//
// @brief  Decodes an order payload, reads the clock, and runs the
//         OrderEvaluator against the configured condition source.
//
// @details
// This is the only surface a scheduler needs. It owns no state beyond the
// references and the polarity it was built with, so one handler can serve
// any number of payloads and every call is independent.
//
// Flow of evaluate():
//
//   payload ──decode──> OrderSpec ──> LinkedBetOrder
//                                          │
//   clock.now_s() ─────────────────────────┤
//                                          ▼
//                            OrderEvaluator::evaluate(order, now, source)
//                                          │
//                                          ▼
//                                       Outcome
//
// Failures that are not outcomes:
//   PayloadDecodeError    payload does not decode to an OrderSpec
//   ConditionSourceError  status read failed
// Both are logged once to stderr and rethrown unchanged.
//
// Ownership:
//   Holds const references to the clock and the source; both must outlive
//   the handler.
// -----------------------------------------------------------------------------
class OrderHandler {
 public:
  OrderHandler(const ITimeProvider& clock,
               const IConditionStatusSource& source,
               ConditionRefPolarity polarity = kConditionRefPolarity);

  OrderHandler(const OrderHandler&) = delete;
  OrderHandler& operator=(const OrderHandler&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(payload)
  // -------------------------------------------------------------------------
  // @brief  Evaluates a 256-byte static payload (see codec/abi_codec.hpp).
  //
  // @throws PayloadDecodeError, ConditionSourceError
  // -------------------------------------------------------------------------
  Outcome evaluate(const std::vector<std::uint8_t>& payload) const;

  // -------------------------------------------------------------------------
  // evaluateJson(text)
  // -------------------------------------------------------------------------
  // @brief  Evaluates a JSON order spec (see codec/json_codec.hpp).
  //
  // @throws PayloadDecodeError, ConditionSourceError
  // -------------------------------------------------------------------------
  Outcome evaluateJson(const std::string& text) const;

 private:
  Outcome evaluateSpec(const domain::OrderSpec& spec) const;

  const ITimeProvider& clock_;
  const IConditionStatusSource& source_;
  const ConditionRefPolarity polarity_;
  OrderEvaluator evaluator_;
};

}  // namespace condorder
