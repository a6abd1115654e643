#include "condorder/order/order_validation.hpp"

namespace condorder {

std::optional<domain::ValidationError> validate(
    const IConditionalOrder& order, std::int64_t now_s,
    const IConditionStatusSource& source) {
  if (auto error = order.validate(now_s)) {
    return error;
  }
  return order.validateCondition(source.getStatus(order.conditionRef()));
}

DeriveResult deriveOrder(const IConditionalOrder& order, std::int64_t now_s,
                         const IConditionStatusSource& source) {
  if (auto error = validate(order, now_s, source)) {
    return *error;
  }
  return order.toOrder();
}

}  // namespace condorder
