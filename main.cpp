// -----------------------------------------------------------------------------
// condorder_poll - one polling pass over a set of conditional orders
// -----------------------------------------------------------------------------
//
// Usage:  condorder_poll <config.json>
//
//   1) Load the PollerConfig (status source, optional pinned clock, orders).
//   2) Build the clock: SimulationTimeProvider when "now" is pinned,
//      LiveTimeProvider otherwise.
//   3) Build the condition source: ZmqConditionSource for a live status
//      service, InMemoryConditionSource for a static table.
//   4) Evaluate every order once through OrderHandler and print one JSON
//      line per order on stdout:
//        {"index":0,"result":"Tradeable","order":{...}}
//        {"index":1,"result":"RetryLater","reason":"ConditionOpen"}
//        {"index":2,"error":"..."}
//   5) Print a one-line summary on stderr.
//
// Exit status: 0 every order evaluated, 1 some order failed to decode or
// its status could not be read, 2 bad usage or configuration.
//
// Re-polling RetryLater orders is the scheduler's job; this binary runs one
// pass and exits.
// -----------------------------------------------------------------------------

#include "condorder/codec/abi_codec.hpp"
#include "condorder/codec/json_codec.hpp"
#include "condorder/codec/payload_error.hpp"
#include "condorder/condition/in_memory_condition_source.hpp"
#include "condorder/condition/zmq_condition_source.hpp"
#include "condorder/config/poller_config.hpp"
#include "condorder/engine/order_handler.hpp"
#include "condorder/time/live_time_provider.hpp"
#include "condorder/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <cstddef>
#include <iostream>
#include <memory>

namespace {

std::unique_ptr<condorder::IConditionStatusSource> makeSource(
    const condorder::StatusSourceConfig& cfg) {
  if (cfg.type == condorder::StatusSourceConfig::Type::Static) {
    auto table = std::make_unique<condorder::InMemoryConditionSource>();
    for (const auto& entry : cfg.statuses) {
      table->setStatus(entry.first, entry.second);
    }
    std::cerr << "[main] static status table with " << cfg.statuses.size()
              << " condition(s)\n";
    return table;
  }

  std::cerr << "[main] status service " << cfg.endpoint << " (timeout "
            << cfg.timeout_ms << " ms)\n";
  return std::make_unique<condorder::ZmqConditionSource>(cfg.endpoint,
                                                         cfg.timeout_ms);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << (argc > 0 ? argv[0] : "condorder_poll")
              << " <config.json>\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  condorder::PollerConfig config;
  try {
    config = condorder::loadConfig(argv[1]);
  } catch (const condorder::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 2) Clock. Both providers live on the stack; the handler borrows one.
  // -------------------------------------------------------------------------
  condorder::LiveTimeProvider live_clock;
  condorder::SimulationTimeProvider pinned_clock(config.now_s.value_or(0));
  const condorder::ITimeProvider& clock =
      config.now_s.has_value()
          ? static_cast<const condorder::ITimeProvider&>(pinned_clock)
          : static_cast<const condorder::ITimeProvider&>(live_clock);

  // -------------------------------------------------------------------------
  // 3) Condition source. A malformed endpoint fails in connect().
  // -------------------------------------------------------------------------
  std::unique_ptr<condorder::IConditionStatusSource> source;
  try {
    source = makeSource(config.status_source);
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot connect status source: " << e.what() << "\n";
    return 2;
  }

  condorder::OrderHandler handler(clock, *source, config.polarity);

  // -------------------------------------------------------------------------
  // 4) One pass.
  // -------------------------------------------------------------------------
  std::size_t tradeable = 0;
  std::size_t never = 0;
  std::size_t retry = 0;
  std::size_t failed = 0;

  for (std::size_t i = 0; i < config.orders.size(); ++i) {
    const condorder::OrderPayload& payload = config.orders[i];

    nlohmann::json line;
    line["index"] = i;

    try {
      condorder::Outcome outcome =
          payload.encoding == condorder::OrderPayload::Encoding::Abi
              ? handler.evaluate(condorder::codec::bytesFromHex(payload.text))
              : handler.evaluateJson(payload.text);

      line.update(condorder::codec::outcomeToJson(outcome));

      switch (outcome.result) {
        case condorder::PollResult::Tradeable:  ++tradeable; break;
        case condorder::PollResult::Never:      ++never;     break;
        case condorder::PollResult::RetryLater: ++retry;     break;
      }
    } catch (const condorder::PayloadDecodeError& e) {
      line["error"] = std::string("decode: ") + e.what();
      ++failed;
    } catch (const condorder::ConditionSourceError& e) {
      line["error"] = std::string("status: ") + e.what();
      ++failed;
    }

    std::cout << line.dump() << "\n";
  }

  // -------------------------------------------------------------------------
  // 5) Summary.
  // -------------------------------------------------------------------------
  std::cerr << "[main] " << config.orders.size() << " order(s): " << tradeable
            << " tradeable, " << never << " never, " << retry
            << " retry-later, " << failed << " failed\n";

  return failed == 0 ? 0 : 1;
}
