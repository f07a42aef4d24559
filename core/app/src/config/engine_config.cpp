#include "dca/config/engine_config.hpp"

#include "dca/network/json_format.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace dca {

namespace {

// Applies the "pair" object, if any. Missing or empty assets leave the pair
// empty so the engine starts uninitialized.
void readPair(const nlohmann::json& j, EngineConfig& config) {
  if (!j.contains("pair")) {
    return;
  }
  const auto& pair = j.at("pair");
  config.pair.funding_asset = pair.value("funding_asset", std::string{});
  config.pair.target_asset = pair.value("target_asset", std::string{});
}

void readEndpoints(const nlohmann::json& j, EngineConfig& config) {
  if (!j.contains("endpoints")) {
    return;
  }
  const auto& ep = j.at("endpoints");
  config.price_feed_endpoint =
      ep.value("price_feed", config.price_feed_endpoint);
  config.ipc_cmd_endpoint = ep.value("ipc_cmd", config.ipc_cmd_endpoint);
  config.ipc_pub_endpoint = ep.value("ipc_pub", config.ipc_pub_endpoint);
}

void readKeeper(const nlohmann::json& j, EngineConfig& config) {
  if (!j.contains("keeper")) {
    return;
  }
  const auto& keeper = j.at("keeper");
  config.keeper_enabled = keeper.value("enabled", config.keeper_enabled);
  config.keeper_poll_interval_ms =
      keeper.value("poll_interval_ms", config.keeper_poll_interval_ms);
  if (config.keeper_poll_interval_ms <= 0) {
    throw ConfigError("keeper.poll_interval_ms must be positive");
  }
}

ClockMode parseClock(const std::string& name) {
  if (name == "simulation") {
    return ClockMode::Simulation;
  }
  if (name == "live") {
    return ClockMode::Live;
  }
  throw ConfigError("unknown clock mode: " + name);
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig(): JSON text → EngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const std::string& json_text) {
  EngineConfig config;

  try {
    auto j = nlohmann::json::parse(json_text);
    if (!j.is_object()) {
      throw ConfigError("configuration root must be a JSON object");
    }

    config.admin_id = j.value("admin", config.admin_id);
    config.agent_id = j.value("agent", config.agent_id);
    config.execution_fee =
        readUnsigned(j, "execution_fee", config.execution_fee);
    config.price_scale = readUnsigned(j, "price_scale", config.price_scale);
    config.slippage_bps =
        readUnsigned(j, "slippage_bps", config.slippage_bps);
    config.clock = parseClock(j.value("clock", std::string{"simulation"}));

    readPair(j, config);
    readEndpoints(j, config);
    readKeeper(j, config);

    if (j.contains("initial_balances")) {
      const auto& balances = j.at("initial_balances");
      if (!balances.is_object()) {
        throw ConfigError("initial_balances must be a JSON object");
      }
      for (const auto& item : balances.items()) {
        config.initial_balances[item.key()] =
            readUnsigned<domain::Amount>(balances, item.key());
      }
    }
  } catch (const nlohmann::json::exception& e) {
    // parse_error, type_error and out_of_range all land here.
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  } catch (const JsonFieldError& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  if (config.admin_id.empty() || config.agent_id.empty()) {
    throw ConfigError("admin and agent identities must be non-empty");
  }
  if (config.price_scale == 0) {
    throw ConfigError("price_scale must be positive");
  }
  if (config.slippage_bps > 10000) {
    throw ConfigError("slippage_bps must not exceed 10000");
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadConfig(): read file, delegate to parseConfig()
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseConfig(buffer.str());
}

}  // namespace dca
