#include "condorder/codec/json_codec.hpp"

#include <stdexcept>

namespace condorder {
namespace codec {

namespace {

// Wraps the two failure families of field extraction (json type/key errors
// and hex parse errors) into PayloadDecodeError naming the field.
template <typename Fn>
auto field(const char* name, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const nlohmann::json::exception& e) {
    throw PayloadDecodeError(std::string("field '") + name + "': " + e.what());
  } catch (const std::invalid_argument& e) {
    throw PayloadDecodeError(std::string("field '") + name + "': " + e.what());
  }
}

domain::Address addressField(const nlohmann::json& j, const char* name) {
  return field(name, [&] {
    return domain::Address::fromHex(j.at(name).get<std::string>());
  });
}

domain::Word256 wordField(const nlohmann::json& j, const char* name) {
  return field(name, [&] {
    return domain::Word256::fromHex(j.at(name).get<std::string>());
  });
}

std::uint64_t timeField(const nlohmann::json& j, const char* name) {
  return field(name, [&] {
    const nlohmann::json& v = j.at(name);
    if (!v.is_number_unsigned()) {
      throw std::invalid_argument("expected a non-negative integer");
    }
    return v.get<std::uint64_t>();
  });
}

}  // namespace

// -----------------------------------------------------------------------------
// OrderSpec
// -----------------------------------------------------------------------------
domain::OrderSpec orderSpecFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw PayloadDecodeError("order spec must be a JSON object");
  }

  domain::OrderSpec spec;
  spec.sell_asset = addressField(j, "sell_asset");
  spec.buy_asset = addressField(j, "buy_asset");
  spec.receiver = addressField(j, "receiver");
  spec.sell_amount = wordField(j, "sell_amount");
  spec.min_buy_amount = wordField(j, "min_buy_amount");
  spec.valid_from = timeField(j, "valid_from");
  spec.valid_until = timeField(j, "valid_until");
  spec.condition_ref = wordField(j, "condition_ref");
  return spec;
}

domain::OrderSpec parseOrderSpec(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw PayloadDecodeError(std::string("order spec is not JSON: ") +
                             e.what());
  }
  return orderSpecFromJson(j);
}

nlohmann::json orderSpecToJson(const domain::OrderSpec& spec) {
  nlohmann::json j;
  j["sell_asset"] = spec.sell_asset.toHex();
  j["buy_asset"] = spec.buy_asset.toHex();
  j["receiver"] = spec.receiver.toHex();
  j["sell_amount"] = spec.sell_amount.toHex();
  j["min_buy_amount"] = spec.min_buy_amount.toHex();
  j["valid_from"] = spec.valid_from;
  j["valid_until"] = spec.valid_until;
  j["condition_ref"] = spec.condition_ref.toHex();
  return j;
}

// -----------------------------------------------------------------------------
// ConditionStatus
// -----------------------------------------------------------------------------
domain::ConditionStatus conditionStatusFromJson(const nlohmann::json& j) {
  domain::ConditionStatus status;
  status.remaining = wordField(j, "remaining");
  status.resolved_or_cancelled = field("resolved_or_cancelled", [&] {
    return j.at("resolved_or_cancelled").get<bool>();
  });
  return status;
}

// -----------------------------------------------------------------------------
// DerivedOrder / Outcome
// -----------------------------------------------------------------------------
nlohmann::json derivedOrderToJson(const domain::DerivedOrder& order) {
  nlohmann::json j;
  j["sell_token"] = order.sell_token.toHex();
  j["buy_token"] = order.buy_token.toHex();
  j["receiver"] = order.receiver.toHex();
  j["sell_amount"] = order.sell_amount.toHex();
  j["buy_amount"] = order.buy_amount.toHex();
  j["valid_to"] = order.valid_to;
  j["app_data"] = order.app_data.toHex();
  j["fee_amount"] = order.fee_amount.toHex();
  j["kind"] = orderKindToString(order.kind);
  j["partially_fillable"] = order.partially_fillable;
  j["sell_token_balance"] = tokenBalanceToString(order.sell_token_balance);
  j["buy_token_balance"] = tokenBalanceToString(order.buy_token_balance);
  return j;
}

nlohmann::json outcomeToJson(const Outcome& outcome) {
  nlohmann::json j;
  j["result"] = toString(outcome.result);
  if (outcome.order.has_value()) {
    j["order"] = derivedOrderToJson(*outcome.order);
  } else {
    j["reason"] = outcome.reason;
  }
  return j;
}

const char* orderKindToString(domain::OrderKind kind) {
  switch (kind) {
    case domain::OrderKind::Sell: return "sell";
    case domain::OrderKind::Buy:  return "buy";
  }
  return "unknown";
}

const char* tokenBalanceToString(domain::TokenBalance balance) {
  switch (balance) {
    case domain::TokenBalance::Erc20:    return "erc20";
    case domain::TokenBalance::External: return "external";
    case domain::TokenBalance::Internal: return "internal";
  }
  return "unknown";
}

}  // namespace codec
}  // namespace condorder
