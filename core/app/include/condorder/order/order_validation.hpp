#pragma once

#include "condorder/condition/i_condition_status_source.hpp"
#include "condorder/domain/derived_order.hpp"
#include "condorder/domain/validation_error.hpp"
#include "condorder/order/i_conditional_order.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace condorder {

// Either the exchange record or the first rule that failed.
using DeriveResult = std::variant<domain::DerivedOrder, domain::ValidationError>;

// -----------------------------------------------------------------------------
// validate(order, now_s, source)
// -----------------------------------------------------------------------------
//
// @brief  Full validation of an order against the clock and the live
//         condition source.
//
// @return std::nullopt if the order is valid now, otherwise the first
//         failing rule.
//
// @details
// Runs order.validate(now_s) first. Only when every field rule passes is the
// source queried (once) and order.validateCondition() applied, so a
// malformed order never costs a network round trip.
//
// @throws ConditionSourceError if the status read fails.
// -----------------------------------------------------------------------------
std::optional<domain::ValidationError> validate(
    const IConditionalOrder& order, std::int64_t now_s,
    const IConditionStatusSource& source);

// -----------------------------------------------------------------------------
// deriveOrder(order, now_s, source)
// -----------------------------------------------------------------------------
//
// @brief  validate(), then the field mapping to the exchange record.
//
// @return The DerivedOrder, or the validation failure unchanged.
//
// @throws ConditionSourceError if the status read fails.
// -----------------------------------------------------------------------------
DeriveResult deriveOrder(const IConditionalOrder& order, std::int64_t now_s,
                         const IConditionStatusSource& source);

}  // namespace condorder
