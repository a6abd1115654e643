// =============================================================================
// order_handler_test.cpp
// =============================================================================
// Unit tests for condorder::OrderHandler, the evaluate(payload) entry point.
//
// Validates:
//   - Binary and JSON payloads classify the same way
//   - The handler reads time from the injected clock, so advancing a
//     SimulationTimeProvider moves an order out of its start window
//   - A market lifecycle observed through successive polls
//   - Decode and status failures are rethrown, not turned into outcomes
//   - The configured polarity reaches validation
// =============================================================================

#include "condorder/codec/abi_codec.hpp"
#include "condorder/codec/json_codec.hpp"
#include "condorder/condition/in_memory_condition_source.hpp"
#include "condorder/engine/order_handler.hpp"
#include "condorder/time/live_time_provider.hpp"
#include "condorder/time/simulation_time_provider.hpp"

#include "order_fixtures.hpp"

#include <gtest/gtest.h>

using condorder::ConditionSourceError;
using condorder::OrderHandler;
using condorder::Outcome;
using condorder::PayloadDecodeError;
using condorder::PollResult;
using namespace testing_fixtures;

namespace {

class DownSource final : public condorder::IConditionStatusSource {
 public:
  condorder::domain::ConditionStatus getStatus(
      const condorder::domain::ConditionRef&) const override {
    throw ConditionSourceError("connection refused");
  }
};

}  // namespace

// =============================================================================
// Test fixture: pinned clock + status table, shared by one handler.
// =============================================================================
class OrderHandlerTest : public ::testing::Test {
 protected:
  condorder::SimulationTimeProvider clock{kNow};
  condorder::InMemoryConditionSource source;
  OrderHandler handler{clock, source};

  std::vector<std::uint8_t> payload() const {
    return condorder::codec::encodeOrderSpec(validSpec());
  }
};

TEST_F(OrderHandlerTest, BinaryAndJsonPayloadsAgree) {
  source.setStatus(conditionRef(), status(0, true));

  const Outcome from_bytes = handler.evaluate(payload());
  const Outcome from_json =
      handler.evaluateJson(condorder::codec::orderSpecToJson(validSpec()).dump());

  EXPECT_EQ(from_bytes.result, PollResult::Tradeable);
  EXPECT_EQ(from_bytes, from_json);
}

TEST_F(OrderHandlerTest, ClockDrivesStartWindow) {
  source.setStatus(conditionRef(), status(0, true));
  EXPECT_EQ(handler.evaluate(payload()).result, PollResult::Tradeable);

  clock.advance_time(kNow + 10);  // now == valid_from
  const Outcome outcome = handler.evaluate(payload());
  EXPECT_EQ(outcome.result, PollResult::RetryLater);
  EXPECT_EQ(outcome.reason, "InvalidStartDate");
}

TEST_F(OrderHandlerTest, FollowsMarketLifecycle) {
  source.setStatus(conditionRef(), status(40, false));
  EXPECT_EQ(handler.evaluate(payload()).result, PollResult::RetryLater);

  source.setStatus(conditionRef(), status(10, false));
  EXPECT_EQ(handler.evaluate(payload()).result, PollResult::RetryLater);

  source.setStatus(conditionRef(), status(0, true));
  const Outcome filled = handler.evaluate(payload());
  ASSERT_EQ(filled.result, PollResult::Tradeable);
  EXPECT_EQ(filled.order->app_data, conditionRef());
}

TEST_F(OrderHandlerTest, CancelledMarketIsNever) {
  source.setStatus(conditionRef(), status(10, true));
  const Outcome outcome = handler.evaluate(payload());
  EXPECT_EQ(outcome.result, PollResult::Never);
  EXPECT_EQ(outcome.reason, condorder::kReasonConditionCancelled);
}

TEST_F(OrderHandlerTest, DecodeFailuresAreRethrown) {
  std::vector<std::uint8_t> truncated = payload();
  truncated.resize(100);
  EXPECT_THROW(handler.evaluate(truncated), PayloadDecodeError);
  EXPECT_THROW(handler.evaluateJson("{}"), PayloadDecodeError);
}

TEST_F(OrderHandlerTest, StatusFailuresAreRethrown) {
  DownSource down;
  OrderHandler offline(clock, down);
  EXPECT_THROW(offline.evaluate(payload()), ConditionSourceError);
}

TEST_F(OrderHandlerTest, PolarityReachesValidation) {
  condorder::domain::OrderSpec zero_ref = validSpec();
  zero_ref.condition_ref = condorder::domain::Word256{};
  source.setStatus(zero_ref.condition_ref, status(0, true));
  const auto bytes = condorder::codec::encodeOrderSpec(zero_ref);

  EXPECT_EQ(handler.evaluate(bytes).reason, "InvalidConditionRef");

  OrderHandler flipped(clock, source, condorder::ConditionRefPolarity::RequireZero);
  EXPECT_EQ(flipped.evaluate(bytes).result, PollResult::Tradeable);
  EXPECT_EQ(flipped.evaluate(payload()).reason, "InvalidConditionRef");
}

TEST(TimeProviderTest, SimulationClockNeverGoesBack) {
  condorder::SimulationTimeProvider clock(100);
  clock.advance_time(200);
  EXPECT_EQ(clock.now_s(), 200);
  clock.advance_time(150);
  EXPECT_EQ(clock.now_s(), 200);
}

TEST(TimeProviderTest, LiveClockIsEpochSeconds) {
  condorder::LiveTimeProvider clock;
  const std::int64_t now = clock.now_s();
  EXPECT_GT(now, kNow);          // after Nov 2023
  EXPECT_LT(now, 0xFFFFFFFFll);  // still a 32-bit time
}
