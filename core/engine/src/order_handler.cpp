#include "condorder/engine/order_handler.hpp"
#include "condorder/codec/abi_codec.hpp"
#include "condorder/codec/json_codec.hpp"
#include "condorder/codec/payload_error.hpp"

#include <iostream>

namespace condorder {

OrderHandler::OrderHandler(const ITimeProvider& clock,
                           const IConditionStatusSource& source,
                           ConditionRefPolarity polarity)
    : clock_(clock), source_(source), polarity_(polarity) {}

// -----------------------------------------------------------------------------
// evaluate: binary payload
// -----------------------------------------------------------------------------
Outcome OrderHandler::evaluate(const std::vector<std::uint8_t>& payload) const {
  domain::OrderSpec spec;
  try {
    spec = codec::decodeOrderSpec(payload);
  } catch (const PayloadDecodeError& e) {
    std::cerr << "[OrderHandler] payload rejected: " << e.what() << "\n";
    throw;
  }
  return evaluateSpec(spec);
}

// -----------------------------------------------------------------------------
// evaluateJson: JSON payload
// -----------------------------------------------------------------------------
Outcome OrderHandler::evaluateJson(const std::string& text) const {
  domain::OrderSpec spec;
  try {
    spec = codec::parseOrderSpec(text);
  } catch (const PayloadDecodeError& e) {
    std::cerr << "[OrderHandler] JSON payload rejected: " << e.what() << "\n";
    throw;
  }
  return evaluateSpec(spec);
}

// -----------------------------------------------------------------------------
// evaluateSpec: one clock read, one evaluator pass
// -----------------------------------------------------------------------------
Outcome OrderHandler::evaluateSpec(const domain::OrderSpec& spec) const {
  const LinkedBetOrder order(spec, polarity_);
  const std::int64_t now_s = clock_.now_s();

  try {
    return evaluator_.evaluate(order, now_s, source_);
  } catch (const ConditionSourceError& e) {
    std::cerr << "[OrderHandler] status unavailable for "
              << order.conditionRef().toHex() << ": " << e.what() << "\n";
    throw;
  }
}

}  // namespace condorder
