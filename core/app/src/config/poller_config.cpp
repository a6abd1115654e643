#include "condorder/config/poller_config.hpp"
#include "condorder/codec/json_codec.hpp"

#include <fstream>

namespace condorder {

namespace {

StatusSourceConfig parseStatusSource(const nlohmann::json& j) {
  StatusSourceConfig cfg;

  const std::string type = j.value("type", std::string("zmq"));
  if (type == "zmq") {
    cfg.type = StatusSourceConfig::Type::Zmq;
    cfg.endpoint = j.value("endpoint", cfg.endpoint);
    cfg.timeout_ms = j.value("timeout_ms", cfg.timeout_ms);
    if (cfg.timeout_ms <= 0) {
      throw ConfigError("status_source.timeout_ms must be positive");
    }
  } else if (type == "static") {
    cfg.type = StatusSourceConfig::Type::Static;
    if (j.contains("statuses")) {
      for (const auto& item : j.at("statuses").items()) {
        try {
          cfg.statuses[domain::Word256::fromHex(item.key())] =
              codec::conditionStatusFromJson(item.value());
        } catch (const std::invalid_argument& e) {
          throw ConfigError("status_source.statuses key '" + item.key() +
                            "': " + e.what());
        } catch (const PayloadDecodeError& e) {
          throw ConfigError("status_source.statuses['" + item.key() +
                            "']: " + e.what());
        }
      }
    }
  } else {
    throw ConfigError("unknown status_source.type '" + type + "'");
  }

  return cfg;
}

OrderPayload parseOrder(const nlohmann::json& j, std::size_t index) {
  OrderPayload order;
  if (j.contains("abi")) {
    order.encoding = OrderPayload::Encoding::Abi;
    order.text = j.at("abi").get<std::string>();
  } else if (j.contains("spec")) {
    order.encoding = OrderPayload::Encoding::Json;
    order.text = j.at("spec").dump();
  } else {
    throw ConfigError("orders[" + std::to_string(index) +
                      "] needs an \"abi\" or a \"spec\" key");
  }
  return order;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
PollerConfig parseConfig(const nlohmann::json& j) {
  PollerConfig cfg;

  try {
    if (j.contains("status_source")) {
      cfg.status_source = parseStatusSource(j.at("status_source"));
    }

    if (j.contains("now")) {
      cfg.now_s = j.at("now").get<std::int64_t>();
    }

    const std::string polarity =
        j.value("condition_ref_polarity", std::string("non_zero"));
    if (polarity == "non_zero") {
      cfg.polarity = ConditionRefPolarity::RequireNonZero;
    } else if (polarity == "zero") {
      cfg.polarity = ConditionRefPolarity::RequireZero;
    } else {
      throw ConfigError("unknown condition_ref_polarity '" + polarity + "'");
    }

    const auto& orders = j.at("orders");
    if (!orders.is_array()) {
      throw ConfigError("\"orders\" must be an array");
    }
    for (std::size_t i = 0; i < orders.size(); ++i) {
      cfg.orders.push_back(parseOrder(orders.at(i), i));
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }

  return cfg;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
PollerConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config file '" + path + "' is not JSON: " + e.what());
  }
  return parseConfig(j);
}

}  // namespace condorder
