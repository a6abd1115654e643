#pragma once

#include "condorder/condition/i_condition_status_source.hpp"
#include "condorder/domain/condition_status.hpp"
#include "condorder/domain/validation_error.hpp"
#include "condorder/evaluation/poll_outcome.hpp"
#include "condorder/order/i_conditional_order.hpp"

#include <cstdint>

namespace condorder {

// -----------------------------------------------------------------------------
// OrderEvaluator - liveness polling state machine
// -----------------------------------------------------------------------------
//
// @brief  Classifies a conditional order as Tradeable, Never or RetryLater
//         from its fields, the clock and the external condition's status.
//
// @details
// Steps of evaluate():
//
//   1. order.validate(now)
//        structural failure          -> Never(<error tag>)
//        InvalidStartDate            -> RetryLater(InvalidStartDate)
//   2. source.getStatus(ref), exactly once
//        read failure                -> ConditionSourceError propagates
//   3. order.validateCondition(status)
//        unknown reference           -> RetryLater(ConditionUnknown)
//   4. classify on the status
//        resolved && remaining == 0  -> Tradeable(order.toOrder())
//        resolved && remaining != 0  -> Never(ConditionCancelled)
//        open                        -> RetryLater(ConditionOpen)
//
// Lifecycle of the external condition, as seen through the outcomes:
//
//   unknown ──> open ──(filled)──────────> Tradeable
//     │           │
//     │           └──(cancelled early)───> Never
//     └──(resolved directly)──> Tradeable / Never
//
// Status-driven Never only comes from a resolved condition, and the market
// never reopens one, so once an order reads Never it stays Never.
//
// Thread model:
//   Stateless. Every call recomputes from its arguments; calls are
//   idempotent and may run concurrently.
// -----------------------------------------------------------------------------
class OrderEvaluator {
 public:
  // -------------------------------------------------------------------------
  // evaluate(order, now_s, source)
  // -------------------------------------------------------------------------
  // @brief  Full poll: field rules, one status read, classification.
  //
  // @param  order   The conditional order to poll.
  // @param  now_s   Current time, epoch seconds.
  // @param  source  Live condition status lookup.
  // @return The outcome for this poll.
  //
  // @throws ConditionSourceError if the status read fails. The source is
  //         not consulted at all when a field rule fails.
  // -------------------------------------------------------------------------
  Outcome evaluate(const IConditionalOrder& order, std::int64_t now_s,
                   const IConditionStatusSource& source) const;

  // -------------------------------------------------------------------------
  // evaluate(order, now_s, status)
  // -------------------------------------------------------------------------
  // @brief  Same classification over an already-read status snapshot.
  //
  // @details
  // The pure form (OrderSpec, now, ConditionStatus) -> Outcome. Used by
  // schedulers that batch or cache status reads, and by property tests.
  // -------------------------------------------------------------------------
  Outcome evaluate(const IConditionalOrder& order, std::int64_t now_s,
                   const domain::ConditionStatus& status) const;

  // Maps a validation failure to Never or RetryLater, tagged with the error.
  static Outcome fromValidationError(domain::ValidationError error);

 private:
  static Outcome classifyCondition(const IConditionalOrder& order,
                                   const domain::ConditionStatus& status);
};

}  // namespace condorder
