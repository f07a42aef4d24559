#include "dca/network/price_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace dca {

PriceFeedThread::PriceFeedThread(SimulatedPriceOracle& oracle,
                                 SimulationTimeProvider* clock,
                                 std::string endpoint)
    : oracle_(oracle), clock_(clock), endpoint_(std::move(endpoint)) {}

PriceFeedThread::~PriceFeedThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): connect the gateway and spawn the recv thread
// -----------------------------------------------------------------------------
void PriceFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<PriceFeedGateway>(oracle_, clock_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[PriceFeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[PriceFeedThread] recv loop exited after "
              << gateway_->ticksApplied() << " tick(s).\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal, join, release the socket
// -----------------------------------------------------------------------------
void PriceFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace dca
