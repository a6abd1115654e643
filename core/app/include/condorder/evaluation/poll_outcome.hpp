#pragma once

#include "condorder/domain/derived_order.hpp"

#include <optional>
#include <string>
#include <utility>

namespace condorder {

// -----------------------------------------------------------------------------
// PollResult - what the scheduler must do with an order after a poll
// -----------------------------------------------------------------------------
//
//   Tradeable   offer the derived order for execution now
//   Never       drop the order; no future poll can make it tradeable
//   RetryLater  keep the order and poll it again later
//
// Transport and decode failures are not PollResults; they arrive as
// exceptions.
// -----------------------------------------------------------------------------
enum class PollResult {
  Tradeable,
  Never,
  RetryLater,
};

inline const char* toString(PollResult result) {
  switch (result) {
    case PollResult::Tradeable:  return "Tradeable";
    case PollResult::Never:      return "Never";
    case PollResult::RetryLater: return "RetryLater";
  }
  return "Unknown";
}

// Reason tags for classifications driven by the condition status. Validation
// failures use toString(ValidationError) as their tag.
constexpr const char* kReasonConditionCancelled = "ConditionCancelled";
constexpr const char* kReasonConditionOpen = "ConditionOpen";
constexpr const char* kReasonConditionUnknown = "ConditionUnknown";

// -----------------------------------------------------------------------------
// Outcome - result of one evaluation
// -----------------------------------------------------------------------------
//
// @brief  A PollResult plus either the derived order (Tradeable) or a short
//         machine-readable reason (Never / RetryLater).
//
// @details
// Build through the named constructors so the order is present exactly
// when the result is Tradeable.
// -----------------------------------------------------------------------------
struct Outcome {
  PollResult result{PollResult::RetryLater};
  std::optional<domain::DerivedOrder> order;
  std::string reason;

  static Outcome tradeable(domain::DerivedOrder derived) {
    Outcome o;
    o.result = PollResult::Tradeable;
    o.order = std::move(derived);
    return o;
  }

  static Outcome never(std::string why) {
    Outcome o;
    o.result = PollResult::Never;
    o.reason = std::move(why);
    return o;
  }

  static Outcome retryLater(std::string why) {
    Outcome o;
    o.result = PollResult::RetryLater;
    o.reason = std::move(why);
    return o;
  }
};

inline bool operator==(const Outcome& a, const Outcome& b) {
  return a.result == b.result && a.order == b.order && a.reason == b.reason;
}

inline bool operator!=(const Outcome& a, const Outcome& b) {
  return !(a == b);
}

}  // namespace condorder
