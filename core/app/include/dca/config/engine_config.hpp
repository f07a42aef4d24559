#pragma once

#include "dca/domain/engine_settings.hpp"
#include "dca/domain/order.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// ClockMode — which ITimeProvider the executable wires into the engine
// -----------------------------------------------------------------------------
enum class ClockMode {
  Simulation,  // Advanced by price feed ticks
  Live,        // std::chrono::system_clock
};

// -----------------------------------------------------------------------------
// EngineConfig — everything the executable reads from its JSON file
// -----------------------------------------------------------------------------
//
// @details
// Every field has a default so an empty JSON object is a valid config.
// An empty endpoint disables the thread that would use it (the engine
// tests rely on this, exactly like passing "" to the IPC server).
//
// An empty pair leaves the engine uninitialized; an operator must then send
// an initialize command before orders can be created.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::AccountId admin_id{"admin"};
  domain::AccountId agent_id{"keeper"};
  domain::Amount execution_fee{0};
  domain::PairConfig pair;

  ClockMode clock{ClockMode::Simulation};

  // SimulatedExchange: amount_out = amount_in * price / price_scale,
  // reduced by slippage_bps basis points.
  std::uint64_t price_scale{1};
  std::uint32_t slippage_bps{0};

  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  bool keeper_enabled{true};
  std::int64_t keeper_poll_interval_ms{1000};

  // Seed balances for LedgerCustody, keyed by account.
  std::map<domain::AccountId, domain::Amount> initial_balances;
};

// Thrown by loadConfig()/parseConfig() on unreadable files, malformed JSON
// and type mismatches.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Reads and parses the file at `path`.
EngineConfig loadConfig(const std::string& path);

// Parses a JSON document held in memory. Used by loadConfig() and tests.
EngineConfig parseConfig(const std::string& json_text);

}  // namespace dca
