#pragma once

#include "condorder/domain/condition_status.hpp"
#include "condorder/domain/derived_order.hpp"
#include "condorder/domain/validation_error.hpp"
#include "condorder/domain/word256.hpp"

#include <cstdint>
#include <optional>

namespace condorder {

// -----------------------------------------------------------------------------
// IConditionalOrder - capability interface for an order type
// -----------------------------------------------------------------------------
//
// @brief  What an order type must provide for OrderEvaluator to poll it.
//
// @details
// The evaluator does not care what kind of conditional order it is polling.
// Any type that can (a) check its own fields against a clock, (b) check an
// external condition snapshot, and (c) map itself to the exchange record
// can be evaluated. LinkedBetOrder is the one shipped implementation.
//
// Validation is split in two so the evaluator can run every pure rule
// before touching the network, and then read the condition status exactly
// once:
//
//   validate(now)              pure field and clock rules, fail-fast
//   validateCondition(status)  rules over the external status snapshot
//   toOrder()                  field mapping; only meaningful after both
//                              checks passed
//
// The combined "validate / deriveOrder against a live source" operations are
// free functions in order_validation.hpp built on these three.
//
// Thread model:
//   Implementations are immutable after construction; all methods are const
//   and safe to call from any thread.
// -----------------------------------------------------------------------------
class IConditionalOrder {
 public:
  virtual ~IConditionalOrder() = default;

  // Reference of the external condition that gates this order.
  virtual const domain::ConditionRef& conditionRef() const = 0;

  // -------------------------------------------------------------------------
  // validate(now_s)
  // -------------------------------------------------------------------------
  // @brief  Checks every rule that depends only on the fields and the clock.
  //
  // @param  now_s  Current time, epoch seconds.
  // @return std::nullopt when all rules pass, otherwise the first failure.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::ValidationError> validate(
      std::int64_t now_s) const = 0;

  // -------------------------------------------------------------------------
  // validateCondition(status)
  // -------------------------------------------------------------------------
  // @brief  Checks that the condition reference points at something real.
  //
  // @param  status  Snapshot read for conditionRef().
  // @return std::nullopt when the reference is usable, otherwise the error.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::ValidationError> validateCondition(
      const domain::ConditionStatus& status) const = 0;

  // Exchange record for this order. Precondition: both checks passed.
  virtual domain::DerivedOrder toOrder() const = 0;
};

}  // namespace condorder
