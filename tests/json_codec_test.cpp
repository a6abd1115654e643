// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the JSON rendition of orders, statuses and outcomes.
//
// Validates:
//   - A complete spec object decodes field by field
//   - Missing keys, wrong types and bad hex surface as PayloadDecodeError
//   - Outcome rendering for each PollResult
// =============================================================================

#include "condorder/codec/json_codec.hpp"

#include "order_fixtures.hpp"

#include <gtest/gtest.h>

using condorder::Outcome;
using condorder::PayloadDecodeError;
using namespace condorder::codec;
using namespace testing_fixtures;

namespace {

const char* kSpecJson = R"({
  "sell_asset": "0x1111111111111111111111111111111111111111",
  "buy_asset": "0x2222222222222222222222222222222222222222",
  "receiver": "0x3333333333333333333333333333333333333333",
  "sell_amount": "0x64",
  "min_buy_amount": "0x32",
  "valid_from": 1700000010,
  "valid_until": 1700001000,
  "condition_ref": "0xabc"
})";

}  // namespace

TEST(JsonCodecTest, ParsesCompleteSpec) {
  const condorder::domain::OrderSpec spec = parseOrderSpec(kSpecJson);
  const condorder::domain::OrderSpec expected = validSpec();

  EXPECT_EQ(spec.sell_asset, expected.sell_asset);
  EXPECT_EQ(spec.buy_asset, expected.buy_asset);
  EXPECT_EQ(spec.receiver, expected.receiver);
  EXPECT_EQ(spec.sell_amount, expected.sell_amount);
  EXPECT_EQ(spec.min_buy_amount, expected.min_buy_amount);
  EXPECT_EQ(spec.valid_from, expected.valid_from);
  EXPECT_EQ(spec.valid_until, expected.valid_until);
  EXPECT_EQ(spec.condition_ref, expected.condition_ref);
}

TEST(JsonCodecTest, SpecToJsonIsAccepted) {
  const nlohmann::json j = orderSpecToJson(validSpec());
  EXPECT_EQ(j.at("valid_until").get<std::uint64_t>(), 1700001000u);
  EXPECT_EQ(orderSpecFromJson(j).condition_ref, conditionRef());
}

TEST(JsonCodecTest, RejectsMalformedSpecs) {
  EXPECT_THROW(parseOrderSpec("not json"), PayloadDecodeError);
  EXPECT_THROW(parseOrderSpec("[1, 2]"), PayloadDecodeError);

  nlohmann::json missing = nlohmann::json::parse(kSpecJson);
  missing.erase("receiver");
  EXPECT_THROW(orderSpecFromJson(missing), PayloadDecodeError);

  nlohmann::json bad_hex = nlohmann::json::parse(kSpecJson);
  bad_hex["sell_amount"] = "0xnope";
  EXPECT_THROW(orderSpecFromJson(bad_hex), PayloadDecodeError);

  nlohmann::json short_address = nlohmann::json::parse(kSpecJson);
  short_address["buy_asset"] = "0x22";
  EXPECT_THROW(orderSpecFromJson(short_address), PayloadDecodeError);

  nlohmann::json negative_time = nlohmann::json::parse(kSpecJson);
  negative_time["valid_from"] = -5;
  EXPECT_THROW(orderSpecFromJson(negative_time), PayloadDecodeError);

  nlohmann::json string_time = nlohmann::json::parse(kSpecJson);
  string_time["valid_until"] = "1700001000";
  EXPECT_THROW(orderSpecFromJson(string_time), PayloadDecodeError);
}

TEST(JsonCodecTest, ParsesConditionStatus) {
  const condorder::domain::ConditionStatus s = conditionStatusFromJson(
      nlohmann::json::parse(R"({"remaining":"0x5","resolved_or_cancelled":true})"));
  EXPECT_EQ(s.remaining, word(5));
  EXPECT_TRUE(s.resolved_or_cancelled);

  EXPECT_THROW(conditionStatusFromJson(nlohmann::json::parse(R"({"remaining":"0x5"})")),
               PayloadDecodeError);
}

TEST(JsonCodecTest, RendersOutcomes) {
  condorder::domain::DerivedOrder order;
  order.buy_amount = word(50);
  order.valid_to = 1700001000u;

  const nlohmann::json tradeable = outcomeToJson(Outcome::tradeable(order));
  EXPECT_EQ(tradeable.at("result"), "Tradeable");
  EXPECT_FALSE(tradeable.contains("reason"));
  EXPECT_EQ(tradeable.at("order").at("kind"), "sell");
  EXPECT_EQ(tradeable.at("order").at("valid_to"), 1700001000u);
  EXPECT_EQ(tradeable.at("order").at("sell_token_balance"), "erc20");
  EXPECT_EQ(tradeable.at("order").at("partially_fillable"), false);

  const nlohmann::json never = outcomeToJson(Outcome::never("SameToken"));
  EXPECT_EQ(never.at("result"), "Never");
  EXPECT_EQ(never.at("reason"), "SameToken");
  EXPECT_FALSE(never.contains("order"));

  const nlohmann::json retry =
      outcomeToJson(Outcome::retryLater(condorder::kReasonConditionOpen));
  EXPECT_EQ(retry.at("result"), "RetryLater");
  EXPECT_EQ(retry.at("reason"), "ConditionOpen");
}

TEST(JsonCodecTest, NamesEveryExchangeEnumValue) {
  using condorder::domain::OrderKind;
  using condorder::domain::TokenBalance;

  EXPECT_STREQ(orderKindToString(OrderKind::Sell), "sell");
  EXPECT_STREQ(orderKindToString(OrderKind::Buy), "buy");
  EXPECT_STREQ(tokenBalanceToString(TokenBalance::Erc20), "erc20");
  EXPECT_STREQ(tokenBalanceToString(TokenBalance::External), "external");
  EXPECT_STREQ(tokenBalanceToString(TokenBalance::Internal), "internal");

  condorder::domain::DerivedOrder order;
  order.kind = OrderKind::Buy;
  order.buy_token_balance = TokenBalance::Internal;
  const nlohmann::json j = derivedOrderToJson(order);
  EXPECT_EQ(j.at("kind"), "buy");
  EXPECT_EQ(j.at("buy_token_balance"), "internal");
}
