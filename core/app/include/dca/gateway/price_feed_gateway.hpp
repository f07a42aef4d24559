#pragma once

#include "dca/oracle/simulated_price_oracle.hpp"
#include "dca/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// PriceTick — one decoded price feed message
// -----------------------------------------------------------------------------
struct PriceTick {
  domain::UnixSeconds timestamp{0};
  domain::Price price{0};
};

// -----------------------------------------------------------------------------
// PriceFeedGateway — ZeroMQ SUB endpoint feeding the simulated oracle
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks {"timestamp": <unix s>, "price": <int>} from a
//         publisher (replay script, market data bridge) and applies them.
//
// @details
// For each valid tick, in this order:
//   1. clock.advance_time(tick.timestamp)   (only if a clock is attached)
//   2. oracle.update(tick.price, tick.timestamp)
//
// Advancing the clock first means a keeper poll racing with the tick sees
// either (old time, old price), (new time, old price) or (new time, new
// price), never a price from the future.
//
// Malformed payloads are logged to stderr and skipped; the loop never exits
// on bad input.
//
// run() blocks on recv with kRecvTimeoutMs so stop() is noticed promptly.
// stop() is the only method safe to call from another thread.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  PriceFeedGateway(SimulatedPriceOracle& oracle,
                   SimulationTimeProvider* clock,
                   const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~PriceFeedGateway() = default;

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  void run();

  void stop();

  // Decodes one payload. nullopt on malformed JSON, missing fields, wrong
  // types or a zero price. Does not log.
  static std::optional<PriceTick> parseTick(const std::string& payload);

  std::uint64_t ticksApplied() const { return ticks_applied_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void apply(const PriceTick& tick);

  SimulatedPriceOracle& oracle_;
  SimulationTimeProvider* clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_applied_{0};
};

}  // namespace dca
