// =============================================================================
// order_evaluator_test.cpp
// =============================================================================
// Unit tests for condorder::OrderEvaluator.
//
// Validates:
//   - The concrete polling scenarios (filled, cancelled, open, early start,
//     same token)
//   - Every validation rule maps to exactly one classification
//   - Determinism and idempotence over fixed inputs
//   - Status-read accounting (zero reads on field failure, one otherwise)
//   - Transport failures propagate instead of becoming outcomes
//   - An unknown condition is retried, not dropped
//   - Monotone lifecycle: generated market histories never go from Never
//     to Tradeable
//
// Design: the evaluator is stateless, so each test builds what it needs on
// the stack. Randomized histories use a fixed seed.
// =============================================================================

#include "condorder/condition/in_memory_condition_source.hpp"
#include "condorder/evaluation/order_evaluator.hpp"
#include "condorder/order/linked_bet_order.hpp"

#include "order_fixtures.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>

using condorder::ConditionSourceError;
using condorder::LinkedBetOrder;
using condorder::Outcome;
using condorder::PollResult;
using condorder::domain::ConditionStatus;
using condorder::domain::OrderSpec;
using namespace testing_fixtures;

namespace {

class UnreachableSource final : public condorder::IConditionStatusSource {
 public:
  ConditionStatus getStatus(
      const condorder::domain::ConditionRef&) const override {
    ++reads;
    throw ConditionSourceError("status service down");
  }

  mutable int reads{0};
};

}  // namespace

// =============================================================================
// Test fixture: an evaluator and a status table keyed by the fixture ref.
// =============================================================================
class OrderEvaluatorTest : public ::testing::Test {
 protected:
  condorder::OrderEvaluator evaluator;
  condorder::InMemoryConditionSource source;

  Outcome evaluateWith(const OrderSpec& spec, const ConditionStatus& s) {
    source.setStatus(spec.condition_ref, s);
    return evaluator.evaluate(LinkedBetOrder(spec), kNow, source);
  }
};

// -----------------------------------------------------------------------------
// 1. Concrete scenarios
// -----------------------------------------------------------------------------
TEST_F(OrderEvaluatorTest, FilledConditionIsTradeable) {
  Outcome outcome = evaluateWith(validSpec(), status(0, true));

  ASSERT_EQ(outcome.result, PollResult::Tradeable);
  ASSERT_TRUE(outcome.order.has_value());
  EXPECT_EQ(outcome.order->buy_amount, word(50));
  EXPECT_EQ(outcome.order->sell_amount, word(100));
  EXPECT_EQ(outcome.order->valid_to, static_cast<std::uint32_t>(kNow + 1000));
  EXPECT_EQ(outcome.order->app_data, conditionRef());
  EXPECT_TRUE(outcome.reason.empty());
}

TEST_F(OrderEvaluatorTest, CancelledConditionIsNever) {
  Outcome outcome = evaluateWith(validSpec(), status(5, true));
  EXPECT_EQ(outcome.result, PollResult::Never);
  EXPECT_EQ(outcome.reason, condorder::kReasonConditionCancelled);
  EXPECT_FALSE(outcome.order.has_value());
}

TEST_F(OrderEvaluatorTest, OpenConditionIsRetryLater) {
  Outcome outcome = evaluateWith(validSpec(), status(5, false));
  EXPECT_EQ(outcome.result, PollResult::RetryLater);
  EXPECT_EQ(outcome.reason, condorder::kReasonConditionOpen);
}

TEST_F(OrderEvaluatorTest, PastStartDateIsRetryLater) {
  OrderSpec spec = validSpec();
  spec.valid_from = kNow - 1;

  Outcome outcome = evaluateWith(spec, status(0, true));
  EXPECT_EQ(outcome.result, PollResult::RetryLater);
  EXPECT_EQ(outcome.reason, "InvalidStartDate");
}

TEST_F(OrderEvaluatorTest, SameTokenIsNeverRegardlessOfStatus) {
  OrderSpec spec = validSpec();
  spec.buy_asset = spec.sell_asset;

  for (const ConditionStatus& s :
       {status(0, true), status(5, true), status(5, false), status(0, false)}) {
    Outcome outcome = evaluateWith(spec, s);
    EXPECT_EQ(outcome.result, PollResult::Never);
    EXPECT_EQ(outcome.reason, "SameToken");
  }
}

TEST_F(OrderEvaluatorTest, UnknownConditionRetriesLater) {
  Outcome outcome = evaluator.evaluate(LinkedBetOrder(validSpec()), kNow,
                                       source);  // nothing set for the ref
  EXPECT_EQ(outcome.result, PollResult::RetryLater);
  EXPECT_EQ(outcome.reason, "ConditionUnknown");
}

TEST_F(OrderEvaluatorTest, UnknownConditionCanLaterBecomeTradeable) {
  LinkedBetOrder order(validSpec());

  Outcome before = evaluator.evaluate(order, kNow, status(0, false));
  EXPECT_EQ(before.result, PollResult::RetryLater);

  Outcome after = evaluator.evaluate(order, kNow, status(0, true));
  EXPECT_EQ(after.result, PollResult::Tradeable);
}

// -----------------------------------------------------------------------------
// 2. Each rule maps to exactly one classification
// -----------------------------------------------------------------------------
TEST_F(OrderEvaluatorTest, EachRuleHasItsClassification) {
  struct Case {
    void (*breakRule)(OrderSpec&);
    PollResult expected;
    const char* reason;
  };

  const std::vector<Case> cases = {
      {[](OrderSpec& s) { s.buy_asset = s.sell_asset; },
       PollResult::Never, "SameToken"},
      {[](OrderSpec& s) { s.buy_asset = condorder::domain::Address{}; },
       PollResult::Never, "InvalidToken"},
      {[](OrderSpec& s) { s.valid_from = kNow; },
       PollResult::RetryLater, "InvalidStartDate"},
      {[](OrderSpec& s) { s.valid_until = s.valid_from; },
       PollResult::Never, "InvalidEndDate"},
      {[](OrderSpec& s) { s.sell_amount = word(0); },
       PollResult::Never, "InvalidSellAmount"},
      {[](OrderSpec& s) { s.min_buy_amount = word(0); },
       PollResult::Never, "InvalidMinBuyAmount"},
      {[](OrderSpec& s) { s.condition_ref = condorder::domain::Word256{}; },
       PollResult::Never, "InvalidConditionRef"},
  };

  for (const Case& c : cases) {
    OrderSpec spec = validSpec();
    c.breakRule(spec);
    Outcome outcome = evaluateWith(spec, status(0, true));
    EXPECT_EQ(outcome.result, c.expected) << c.reason;
    EXPECT_EQ(outcome.reason, c.reason);
  }
}

// -----------------------------------------------------------------------------
// 3. Determinism and idempotence
// -----------------------------------------------------------------------------
TEST_F(OrderEvaluatorTest, RepeatedEvaluationIsIdentical) {
  LinkedBetOrder order(validSpec());

  for (const ConditionStatus& s :
       {status(0, true), status(5, true), status(5, false)}) {
    source.setStatus(conditionRef(), s);
    const Outcome first = evaluator.evaluate(order, kNow, source);
    for (int i = 0; i < 10; ++i) {
      EXPECT_EQ(evaluator.evaluate(order, kNow, source), first);
      EXPECT_EQ(evaluator.evaluate(order, kNow, s), first);
    }
  }
}

TEST_F(OrderEvaluatorTest, SourceAndSnapshotFormsAgree) {
  LinkedBetOrder order(validSpec());
  const ConditionStatus s = status(7, false);
  source.setStatus(conditionRef(), s);
  EXPECT_EQ(evaluator.evaluate(order, kNow, source),
            evaluator.evaluate(order, kNow, s));
}

// -----------------------------------------------------------------------------
// 4. Transport failures
// -----------------------------------------------------------------------------
TEST_F(OrderEvaluatorTest, SourceFailurePropagates) {
  UnreachableSource down;
  EXPECT_THROW(evaluator.evaluate(LinkedBetOrder(validSpec()), kNow, down),
               ConditionSourceError);
  EXPECT_EQ(down.reads, 1);
}

TEST_F(OrderEvaluatorTest, FieldFailureNeverTouchesSource) {
  OrderSpec spec = validSpec();
  spec.min_buy_amount = word(0);
  UnreachableSource down;

  Outcome outcome = evaluator.evaluate(LinkedBetOrder(spec), kNow, down);
  EXPECT_EQ(outcome.result, PollResult::Never);
  EXPECT_EQ(down.reads, 0);
}

// -----------------------------------------------------------------------------
// 5. Monotone lifecycle over generated market histories
// -----------------------------------------------------------------------------
// A history follows the market's own rules. A reference may start unknown
// (remaining 0, open) until the market registers it with some quantity.
// While open, remaining only shrinks and stays > 0 once registered. At some
// point the condition resolves, either filled (remaining 0) or cancelled
// (remaining frozen), and never reopens. Once an evaluation reads Never, no
// later one may read Tradeable.
// -----------------------------------------------------------------------------
TEST_F(OrderEvaluatorTest, NeverIsPermanentAcrossHistories) {
  std::mt19937_64 rng(20240917);
  LinkedBetOrder order(validSpec());

  // (remaining == 0, resolved) combinations reached across all histories.
  bool seen_state[2][2] = {{false, false}, {false, false}};

  for (int history = 0; history < 500; ++history) {
    std::uint64_t remaining = rng() % 2 == 0 ? 0 : 1 + rng() % 1000;
    bool resolved = false;
    bool seen_never = false;
    bool seen_tradeable = false;

    for (int step = 0; step < 40; ++step) {
      seen_state[remaining == 0][resolved] = true;

      Outcome outcome = evaluator.evaluate(order, kNow,
                                           status(remaining, resolved));
      if (outcome.result == PollResult::Never) {
        seen_never = true;
      }
      if (outcome.result == PollResult::Tradeable) {
        ASSERT_FALSE(seen_never) << "history " << history << " step " << step;
        seen_tradeable = true;
      }
      if (seen_tradeable) {
        ASSERT_NE(outcome.result, PollResult::Never)
            << "history " << history << " step " << step;
      }
      if (!resolved) {
        ASSERT_EQ(outcome.result, PollResult::RetryLater);
      }

      if (!resolved) {
        switch (rng() % 4) {
          case 0:  // register, or fill some
            remaining = remaining == 0 ? 1 + rng() % 1000
                                       : 1 + rng() % remaining;
            break;
          case 1:  // resolve filled
            resolved = true;
            remaining = 0;
            break;
          case 2:  // cancel with whatever is left
            resolved = true;
            break;
          default:
            break;
        }
      }
    }
  }

  EXPECT_TRUE(seen_state[1][0]);  // unknown
  EXPECT_TRUE(seen_state[0][0]);  // open
  EXPECT_TRUE(seen_state[1][1]);  // filled
  EXPECT_TRUE(seen_state[0][1]);  // cancelled
}
