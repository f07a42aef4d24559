// -----------------------------------------------------------------------------
// dca_engine — single executable entry point.
//
//   1) Load the JSON config (argv[1], default config/dca_engine.json).
//   2) Build the clock, custody ledger, simulated exchange and oracle the
//      config asks for.
//   3) Create the DcaEngine, initialize it when a pair is configured, and
//      subscribe a console logger to its EventBus.
//   4) Start the price feed thread and the engine's service threads.
//   5) Sleep on the main thread until SIGINT, then shut down in reverse.
//
// Thread layout:
//   main thread        → waits for SIGINT
//   price_feed thread  → PriceFeedGateway recv loop (oracle + sim clock)
//   ipc thread         → IpcServer (REP commands, PUB telemetry)
//   keeper thread      → DcaEngine::executeDue(agent) every poll interval
// -----------------------------------------------------------------------------

#include "dca/config/engine_config.hpp"
#include "dca/custody/ledger_custody.hpp"
#include "dca/domain/error.hpp"
#include "dca/engine/dca_engine.hpp"
#include "dca/events/event.hpp"
#include "dca/execution/simulated_exchange.hpp"
#include "dca/network/json_format.hpp"
#include "dca/network/price_feed_thread.hpp"
#include "dca/oracle/simulated_price_oracle.hpp"
#include "dca/time/live_time_provider.hpp"
#include "dca/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. The only global in the program; a
// lock-free atomic store is async-signal-safe.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown{false};

static void sigint_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/dca_engine.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. A bad file is fatal.
  // -------------------------------------------------------------------------
  dca::EngineConfig config;
  try {
    config = dca::loadConfig(config_path);
  } catch (const dca::ConfigError& e) {
    std::cerr << "[main] config error: " << e.what() << "\n";
    return 1;
  }
  std::cout << "[main] loaded " << config_path << "\n";

  // -------------------------------------------------------------------------
  // 2) Collaborators. In simulation mode the price feed drives the clock.
  // -------------------------------------------------------------------------
  std::unique_ptr<dca::ITimeProvider> clock;
  dca::SimulationTimeProvider* sim_clock = nullptr;
  if (config.clock == dca::ClockMode::Simulation) {
    auto sim = std::make_unique<dca::SimulationTimeProvider>();
    sim_clock = sim.get();
    clock = std::move(sim);
  } else {
    clock = std::make_unique<dca::LiveTimeProvider>();
  }

  dca::LedgerCustody custody(config.initial_balances);
  dca::SimulatedExchange exchange(config.price_scale, config.slippage_bps);
  dca::SimulatedPriceOracle oracle;

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  dca::DcaEngine engine(*clock, custody, exchange, config, &oracle);

  if (!config.pair.funding_asset.empty() || !config.pair.target_asset.empty()) {
    try {
      engine.initialize(config.admin_id, config.pair, &oracle);
    } catch (const dca::OrderError& e) {
      std::cerr << "[main] cannot initialize engine: " << e.what() << "\n";
      return 1;
    }
  } else {
    std::cout << "[main] no pair configured; waiting for an initialize "
                 "command.\n";
  }

  // Runs on whichever thread performed the operation.
  engine.eventBus().subscribe([](const dca::Event& event) {
    std::cout << "[Event] " << dca::eventToJson(event).dump() << "\n";
  });

  // -------------------------------------------------------------------------
  // 4) Threads: price feed first so the keeper sees prices from the start.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  std::unique_ptr<dca::PriceFeedThread> price_feed;
  if (!config.price_feed_endpoint.empty()) {
    price_feed = std::make_unique<dca::PriceFeedThread>(
        oracle, sim_clock, config.price_feed_endpoint);
    price_feed->start();
  }

  engine.start();

  std::cout << "[main] running. Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait for SIGINT, then stop everything that consumes engine state
  //    before the collaborators go out of scope.
  // -------------------------------------------------------------------------
  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();
  price_feed.reset();

  std::cout << "[main] active orders at shutdown: "
            << engine.activeOrderCount()
            << ", accrued fees: " << engine.accruedFees() << "\n";

  return 0;
}
