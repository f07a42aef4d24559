#pragma once

#include "dca/gateway/price_feed_gateway.hpp"
#include "dca/oracle/simulated_price_oracle.hpp"
#include "dca/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace dca {

// -----------------------------------------------------------------------------
// PriceFeedThread — owns a PriceFeedGateway and the thread running it
// -----------------------------------------------------------------------------
//
// @details
// start() builds the gateway (connecting its socket) and hands run() to a
// worker thread. stop() flips the gateway's flag, joins, then destroys it,
// so the socket is never used by two threads at once.
//
// Ownership:
//   Created by main() when a price feed endpoint is configured. Borrows the
//   oracle and the optional simulation clock; both must outlive it.
// -----------------------------------------------------------------------------
class PriceFeedThread {
 public:
  PriceFeedThread(SimulatedPriceOracle& oracle, SimulationTimeProvider* clock,
                  std::string endpoint);

  ~PriceFeedThread();

  PriceFeedThread(const PriceFeedThread&) = delete;
  PriceFeedThread& operator=(const PriceFeedThread&) = delete;
  PriceFeedThread(PriceFeedThread&&) = delete;
  PriceFeedThread& operator=(PriceFeedThread&&) = delete;

  void start();

  void stop();

 private:
  SimulatedPriceOracle& oracle_;
  SimulationTimeProvider* clock_;
  std::string endpoint_;

  std::unique_ptr<PriceFeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace dca
