#include "condorder/evaluation/order_evaluator.hpp"

namespace condorder {

// -----------------------------------------------------------------------------
// evaluate: field rules before the status read
// -----------------------------------------------------------------------------
Outcome OrderEvaluator::evaluate(const IConditionalOrder& order,
                                 std::int64_t now_s,
                                 const IConditionStatusSource& source) const {
  if (auto error = order.validate(now_s)) {
    return fromValidationError(*error);
  }

  // Any ConditionSourceError leaves here untouched; it is not an outcome.
  const domain::ConditionStatus status = source.getStatus(order.conditionRef());

  return classifyCondition(order, status);
}

Outcome OrderEvaluator::evaluate(const IConditionalOrder& order,
                                 std::int64_t now_s,
                                 const domain::ConditionStatus& status) const {
  if (auto error = order.validate(now_s)) {
    return fromValidationError(*error);
  }
  return classifyCondition(order, status);
}

// -----------------------------------------------------------------------------
// fromValidationError: temporal -> RetryLater, structural -> Never
// -----------------------------------------------------------------------------
Outcome OrderEvaluator::fromValidationError(domain::ValidationError error) {
  if (domain::isTemporal(error)) {
    return Outcome::retryLater(domain::toString(error));
  }
  return Outcome::never(domain::toString(error));
}

// -----------------------------------------------------------------------------
// classifyCondition: reference check, then the lifecycle table
// -----------------------------------------------------------------------------
// A reference the market does not know yet reads like an empty open
// condition. It may still be registered and later filled, so it is retried
// rather than dropped.
// -----------------------------------------------------------------------------
Outcome OrderEvaluator::classifyCondition(
    const IConditionalOrder& order, const domain::ConditionStatus& status) {
  if (order.validateCondition(status)) {
    return Outcome::retryLater(kReasonConditionUnknown);
  }

  if (!status.resolved_or_cancelled) {
    return Outcome::retryLater(kReasonConditionOpen);
  }

  if (!status.remaining.isZero()) {
    return Outcome::never(kReasonConditionCancelled);
  }

  return Outcome::tradeable(order.toOrder());
}

}  // namespace condorder
