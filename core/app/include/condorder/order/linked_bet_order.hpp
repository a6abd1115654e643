#pragma once

#include "condorder/domain/order_spec.hpp"
#include "condorder/order/i_conditional_order.hpp"

#include <cstdint>

namespace condorder {

// -----------------------------------------------------------------------------
// ConditionRefPolarity
// -----------------------------------------------------------------------------
// Which condition references the structural rule accepts.
//
//   RequireNonZero - a reference must name a condition (the intended rule).
//   RequireZero    - only the zero reference passes. Some deployed
//                    validators for this order type behave this way; keep
//                    it available until their accepted payloads are known.
// -----------------------------------------------------------------------------
enum class ConditionRefPolarity {
  RequireNonZero,
  RequireZero,
};

// Single switch for the reference rule. Everything else reads this constant
// (or a config value defaulted from it).
constexpr ConditionRefPolarity kConditionRefPolarity =
    ConditionRefPolarity::RequireNonZero;

// Exclusive upper bound for valid_until: the exchange stores validity as a
// uint32 and reserves 2^32 - 1.
constexpr std::uint64_t kMaxValidUntil = 0xFFFFFFFFull;

// -----------------------------------------------------------------------------
// LinkedBetOrder - swap order gated on a prediction-market outcome
// -----------------------------------------------------------------------------
//
// @brief  IConditionalOrder over an OrderSpec. Turns the spec into an
//         exchange sell order once the linked condition has resolved.
//
// @details
// validate(now) checks, in order, failing on the first violation:
//
//   1. sell_asset != buy_asset                       else SameToken
//   2. both assets non-zero                          else InvalidToken
//   3. valid_from > now                              else InvalidStartDate
//   4. valid_from < valid_until < 2^32 - 1           else InvalidEndDate
//   5. sell_amount > 0                               else InvalidSellAmount
//   6. min_buy_amount > 0                            else InvalidMinBuyAmount
//   7. condition_ref matches the configured polarity else InvalidConditionRef
//
// validateCondition(status) rejects a reference the market knows nothing
// about: remaining == 0 while the condition is still open. Every other
// status is a legitimate lifecycle state and is left to the evaluator. The
// evaluator retries on this failure; deriveOrder() reports it as is.
//
// toOrder() is a direct field mapping (see DerivedOrder).
//
// Thread model:
//   Immutable after construction.
// -----------------------------------------------------------------------------
class LinkedBetOrder final : public IConditionalOrder {
 public:
  explicit LinkedBetOrder(domain::OrderSpec spec,
                          ConditionRefPolarity polarity = kConditionRefPolarity);

  const domain::ConditionRef& conditionRef() const override {
    return spec_.condition_ref;
  }

  std::optional<domain::ValidationError> validate(
      std::int64_t now_s) const override;

  std::optional<domain::ValidationError> validateCondition(
      const domain::ConditionStatus& status) const override;

  domain::DerivedOrder toOrder() const override;

 private:
  bool conditionRefAccepted() const;

  const domain::OrderSpec spec_;
  const ConditionRefPolarity polarity_;
};

}  // namespace condorder
