#include "dca/gateway/price_feed_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace dca {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe-all, receive timeout, connect
// -----------------------------------------------------------------------------
PriceFeedGateway::PriceFeedGateway(SimulatedPriceOracle& oracle,
                                   SimulationTimeProvider* clock,
                                   const std::string& endpoint)
    : oracle_(oracle), clock_(clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// parseTick()
// -----------------------------------------------------------------------------
std::optional<PriceTick> PriceFeedGateway::parseTick(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    PriceTick tick;
    tick.timestamp = json.at("timestamp").get<domain::UnixSeconds>();
    tick.price = json.at("price").get<domain::Price>();
    if (tick.price == 0) {
      return std::nullopt;
    }
    return tick;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

void PriceFeedGateway::apply(const PriceTick& tick) {
  if (clock_ != nullptr) {
    clock_->advance_time(tick.timestamp);
  }
  oracle_.update(tick.price, tick.timestamp);
  ticks_applied_.fetch_add(1);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void PriceFeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // Timeout: re-check running_
    }

    std::string payload = msg.to_string();
    auto tick = parseTick(payload);
    if (!tick) {
      std::cerr << "[PriceFeedGateway] malformed tick skipped: " << payload
                << "\n";
      continue;
    }
    apply(*tick);
  }
}

void PriceFeedGateway::stop() { running_.store(false); }

}  // namespace dca
