#pragma once

#include "condorder/domain/condition_status.hpp"
#include "condorder/domain/word256.hpp"
#include "condorder/order/linked_bet_order.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace condorder {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// The configuration file is missing, unreadable, not JSON, or has a key of
// the wrong shape. Raised before any order is evaluated.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// StatusSourceConfig - which IConditionStatusSource the poller builds
// -----------------------------------------------------------------------------
//   Zmq     endpoint + timeout_ms of a status service (ZmqConditionSource)
//   Static  fixed table of statuses (InMemoryConditionSource)
// -----------------------------------------------------------------------------
struct StatusSourceConfig {
  enum class Type { Zmq, Static };

  Type type{Type::Zmq};
  std::string endpoint{"tcp://127.0.0.1:5560"};
  int timeout_ms{1000};
  std::map<domain::ConditionRef, domain::ConditionStatus> statuses;
};

// -----------------------------------------------------------------------------
// OrderPayload - one order as written in the config, still undecoded
// -----------------------------------------------------------------------------
// Decoding is deferred to OrderHandler so a bad payload fails only its own
// evaluation. For Abi, text is the "0x..." hex of the 256-byte payload; for
// Json, text is the serialized spec object.
// -----------------------------------------------------------------------------
struct OrderPayload {
  enum class Encoding { Abi, Json };

  Encoding encoding{Encoding::Abi};
  std::string text;
};

// -----------------------------------------------------------------------------
// PollerConfig - everything condorder_poll needs for one pass
// -----------------------------------------------------------------------------
//
// @details
// File format:
//   {
//     "status_source": {
//       "type": "zmq",                         // or "static"
//       "endpoint": "tcp://127.0.0.1:5560",    // zmq only
//       "timeout_ms": 1000,                    // zmq only
//       "statuses": {                          // static only
//         "0x<ref>": { "remaining": "0x0", "resolved_or_cancelled": true }
//       }
//     },
//     "now": 1700000000,                       // optional, pins the clock
//     "condition_ref_polarity": "non_zero",    // optional, or "zero"
//     "orders": [ { "abi": "0x..." }, { "spec": { ... } } ]
//   }
//
// Defaults mirror the struct initializers; "orders" is required.
// -----------------------------------------------------------------------------
struct PollerConfig {
  StatusSourceConfig status_source;
  std::optional<std::int64_t> now_s;
  ConditionRefPolarity polarity{kConditionRefPolarity};
  std::vector<OrderPayload> orders;
};

// @throws ConfigError
PollerConfig parseConfig(const nlohmann::json& j);

// Reads path and parses it. @throws ConfigError
PollerConfig loadConfig(const std::string& path);

}  // namespace condorder
