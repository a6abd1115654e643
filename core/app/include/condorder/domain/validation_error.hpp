#pragma once

namespace condorder {
namespace domain {

// -----------------------------------------------------------------------------
// ValidationError - why an OrderSpec is not valid right now
// -----------------------------------------------------------------------------
//
// @brief  One value per validation rule, in the order the rules are checked.
//
// @details
// Two families:
//
//   Structural  - SameToken, InvalidToken, InvalidEndDate, InvalidSellAmount,
//                 InvalidMinBuyAmount, InvalidConditionRef.
//                 The fields are immutable, so a structural failure can never
//                 heal. The evaluator maps these to PollResult::Never.
//
//   Temporal    - InvalidStartDate.
//                 Depends only on the clock. The evaluator maps it to
//                 PollResult::RetryLater.
// -----------------------------------------------------------------------------
enum class ValidationError {
  SameToken,
  InvalidToken,
  InvalidStartDate,
  InvalidEndDate,
  InvalidSellAmount,
  InvalidMinBuyAmount,
  InvalidConditionRef,
};

// True only for errors whose rule may pass later without any field change.
inline bool isTemporal(ValidationError error) {
  return error == ValidationError::InvalidStartDate;
}

// Machine-readable tag, used as the outcome reason.
inline const char* toString(ValidationError error) {
  using E = ValidationError;
  switch (error) {
    case E::SameToken:           return "SameToken";
    case E::InvalidToken:        return "InvalidToken";
    case E::InvalidStartDate:    return "InvalidStartDate";
    case E::InvalidEndDate:      return "InvalidEndDate";
    case E::InvalidSellAmount:   return "InvalidSellAmount";
    case E::InvalidMinBuyAmount: return "InvalidMinBuyAmount";
    case E::InvalidConditionRef: return "InvalidConditionRef";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace condorder
