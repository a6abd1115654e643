#include "condorder/order/linked_bet_order.hpp"

#include <utility>

namespace condorder {

using domain::ValidationError;

LinkedBetOrder::LinkedBetOrder(domain::OrderSpec spec,
                               ConditionRefPolarity polarity)
    : spec_(std::move(spec)), polarity_(polarity) {}

// -----------------------------------------------------------------------------
// validate: field and clock rules, fail-fast in declaration order
// -----------------------------------------------------------------------------
std::optional<ValidationError> LinkedBetOrder::validate(
    std::int64_t now_s) const {
  if (spec_.sell_asset == spec_.buy_asset) {
    return ValidationError::SameToken;
  }

  if (spec_.sell_asset.isZero() || spec_.buy_asset.isZero()) {
    return ValidationError::InvalidToken;
  }

  // A negative clock is before every representable valid_from.
  if (now_s >= 0 && spec_.valid_from <= static_cast<std::uint64_t>(now_s)) {
    return ValidationError::InvalidStartDate;
  }

  if (spec_.valid_until <= spec_.valid_from ||
      spec_.valid_until >= kMaxValidUntil) {
    return ValidationError::InvalidEndDate;
  }

  if (spec_.sell_amount.isZero()) {
    return ValidationError::InvalidSellAmount;
  }

  if (spec_.min_buy_amount.isZero()) {
    return ValidationError::InvalidMinBuyAmount;
  }

  if (!conditionRefAccepted()) {
    return ValidationError::InvalidConditionRef;
  }

  return std::nullopt;
}

// -----------------------------------------------------------------------------
// validateCondition: an open condition with nothing remaining is unknown
// -----------------------------------------------------------------------------
std::optional<ValidationError> LinkedBetOrder::validateCondition(
    const domain::ConditionStatus& status) const {
  if (!status.resolved_or_cancelled && status.remaining.isZero()) {
    return ValidationError::InvalidConditionRef;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// toOrder: direct mapping onto the exchange record
// -----------------------------------------------------------------------------
domain::DerivedOrder LinkedBetOrder::toOrder() const {
  domain::DerivedOrder order;
  order.sell_token = spec_.sell_asset;
  order.buy_token = spec_.buy_asset;
  order.receiver = spec_.receiver;
  order.sell_amount = spec_.sell_amount;
  order.buy_amount = spec_.min_buy_amount;
  order.valid_to = static_cast<std::uint32_t>(spec_.valid_until);
  order.app_data = spec_.condition_ref;
  order.fee_amount = domain::Word256{};
  order.kind = domain::OrderKind::Sell;
  order.partially_fillable = false;
  order.sell_token_balance = domain::TokenBalance::Erc20;
  order.buy_token_balance = domain::TokenBalance::Erc20;
  return order;
}

bool LinkedBetOrder::conditionRefAccepted() const {
  switch (polarity_) {
    case ConditionRefPolarity::RequireNonZero:
      return !spec_.condition_ref.isZero();
    case ConditionRefPolarity::RequireZero:
      return spec_.condition_ref.isZero();
  }
  return false;
}

}  // namespace condorder
