#pragma once

#include "condorder/codec/payload_error.hpp"
#include "condorder/domain/condition_status.hpp"
#include "condorder/domain/derived_order.hpp"
#include "condorder/domain/order_spec.hpp"
#include "condorder/evaluation/poll_outcome.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace condorder {
namespace codec {

// -----------------------------------------------------------------------------
// JSON rendition of the order records
// -----------------------------------------------------------------------------
//
// @details
// OrderSpec:
//   {
//     "sell_asset":     "0x<40 hex>",
//     "buy_asset":      "0x<40 hex>",
//     "receiver":       "0x<40 hex>",
//     "sell_amount":    "0x<hex>",        // uint256
//     "min_buy_amount": "0x<hex>",        // uint256
//     "valid_from":     1700000000,       // epoch seconds
//     "valid_until":    1700003600,       // epoch seconds
//     "condition_ref":  "0x<hex>"         // bytes32
//   }
//
// 256-bit values travel as hex strings because JSON numbers lose precision
// past 2^53 in most consumers.
//
// ConditionStatus:
//   { "remaining": "0x<hex>", "resolved_or_cancelled": false }
//
// Decoders throw PayloadDecodeError for a missing key, a wrong type, or a
// malformed hex string. nlohmann::json exceptions never escape.
// -----------------------------------------------------------------------------

domain::OrderSpec orderSpecFromJson(const nlohmann::json& j);

// Parses text, then orderSpecFromJson().
domain::OrderSpec parseOrderSpec(const std::string& text);

nlohmann::json orderSpecToJson(const domain::OrderSpec& spec);

domain::ConditionStatus conditionStatusFromJson(const nlohmann::json& j);

nlohmann::json derivedOrderToJson(const domain::DerivedOrder& order);

// -------------------------------------------------------------------------
// outcomeToJson(outcome)
// -------------------------------------------------------------------------
// @brief  Renders an Outcome for logs and the CLI.
//
// @return { "result": "Tradeable", "order": { ... } }
//      or { "result": "Never" | "RetryLater", "reason": "<tag>" }
// -------------------------------------------------------------------------
nlohmann::json outcomeToJson(const Outcome& outcome);

const char* orderKindToString(domain::OrderKind kind);
const char* tokenBalanceToString(domain::TokenBalance balance);

}  // namespace codec
}  // namespace condorder
