#pragma once

#include "dca/concurrent/order_id_generator.hpp"
#include "dca/config/engine_config.hpp"
#include "dca/custody/i_funds_custody.hpp"
#include "dca/domain/engine_settings.hpp"
#include "dca/domain/order.hpp"
#include "dca/eventbus/event_bus.hpp"
#include "dca/events/event.hpp"
#include "dca/execution/execution_engine.hpp"
#include "dca/execution/i_exchange.hpp"
#include "dca/lifecycle/lifecycle_terminator.hpp"
#include "dca/network/ipc_server.hpp"
#include "dca/network/keeper_thread.hpp"
#include "dca/oracle/i_price_oracle.hpp"
#include "dca/order/order_factory.hpp"
#include "dca/scheduling/due_order_scanner.hpp"
#include "dca/store/order_store.hpp"
#include "dca/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dca {

// -----------------------------------------------------------------------------
// DcaEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns the order components, serialises every operation on them,
//         publishes lifecycle events and runs the service threads.
//
// @details
// Every public operation is one all-or-nothing unit under mutex_:
//
//   1. lock
//   2. read `now` from the time provider (and the price from the oracle
//      for executions)
//   3. run the component call chain; an OrderError leaves the components
//      exactly as they were
//   4. append notifications to a local outbox
//   5. unlock
//   6. publish the outbox on the EventBus
//
// Subscribers therefore never observe a half-applied operation and may call
// back into the engine without deadlocking.
//
// Component wiring (all value members, constructed in declaration order):
//
//   settings_ ─┬─> OrderFactory (reads fee)
//              └─> ExecutionEngine (reads agent, pair, fee)
//   store_ ────┬─> DueOrderScanner
//              ├─> LifecycleTerminator ──> IFundsCustody
//              └─> ExecutionEngine ──────> IExchange, LifecycleTerminator
//
// Service threads (start()/stop()):
//
//   ipc server  ─ REP commands -> executeCommand(); PUB telemetry fed by an
//                 EventBus subscription. Skipped when an endpoint is empty.
//   keeper      ─ executeDue(agent) every keeper_poll_interval_ms. Skipped
//                 when keeper_enabled is false.
//
// Thread model:
//   Public operations are safe from any thread. start()/stop() belong to
//   the owning thread (main or a test).
//
// Ownership:
//   Borrows the time provider, custody and exchange; they must outlive the
//   engine. The oracle is bound by initialize() and borrowed likewise.
// -----------------------------------------------------------------------------
class DcaEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock           Source of `now` for every operation.
  // @param  custody         Holds order funds between creation and refund.
  // @param  exchange        Venue for the per-slice swaps.
  // @param  config          Identities, fee, endpoints and keeper settings.
  //                         The pair is NOT applied here; see initialize().
  // @param  command_oracle  Oracle bound when initialization arrives as an
  //                         IPC "initialize" command. May be null, in which
  //                         case that command fails.
  // -------------------------------------------------------------------------
  DcaEngine(const ITimeProvider& clock, IFundsCustody& custody,
            IExchange& exchange, const EngineConfig& config,
            const IPriceOracle* command_oracle = nullptr);

  ~DcaEngine();

  DcaEngine(const DcaEngine&) = delete;
  DcaEngine& operator=(const DcaEngine&) = delete;
  DcaEngine(DcaEngine&&) = delete;
  DcaEngine& operator=(DcaEngine&&) = delete;

  // -------------------------------------------------------------------------
  // Administrative surface (caller must be the admin)
  // -------------------------------------------------------------------------

  // Binds the pair and the oracle, once.
  // Throws Unauthorized, AlreadyInitialized, InvalidConfiguration (empty or
  // identical assets, null oracle).
  void initialize(const domain::AccountId& caller,
                  const domain::PairConfig& pair, const IPriceOracle* oracle);

  // Throws Unauthorized, InvalidConfiguration (empty agent).
  void setAgent(const domain::AccountId& caller,
                const domain::AccountId& agent);

  // Throws Unauthorized. Applies to orders created afterwards and to the
  // pre-authorization reserve of every order.
  void setExecutionFee(const domain::AccountId& caller, domain::Amount fee);

  // -------------------------------------------------------------------------
  // createOrder(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Validates, funds and stores a new order.
  //
  // @return The new order id.
  //
  // @details
  // Order of effects: NotInitialized check, OrderFactory::build() (all
  // validation, id drawn last), insertion, custody transferIn of
  // total_amount. A refused transfer removes the order again and throws
  // CustodyTransferFailed. On success fee_payment is added to the accrued
  // fee counter and an OrderCreatedEvent is published.
  // -------------------------------------------------------------------------
  domain::OrderId createOrder(const domain::OrderRequest& request);

  // Owner-initiated termination; refunds the whole remaining balance.
  TerminationResult cancelOrder(domain::OrderId id,
                                const domain::AccountId& caller);

  // -------------------------------------------------------------------------
  // executeOrder(id, caller)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one scheduled swap at the current time and oracle price.
  //
  // @details
  // Throws NotInitialized when no oracle is bound, otherwise whatever
  // ExecutionEngine::execute() throws. Publishes SwapExecutedEvent, then
  // OrderCompletedEvent (and RefundDeferredEvent) when the swap completed
  // the order.
  // -------------------------------------------------------------------------
  ExecutionResult executeOrder(domain::OrderId id,
                               const domain::AccountId& caller);

  // Pure pre-trade gate at the current oracle price. Never debits.
  void preAuthorize(domain::OrderId id, const domain::AccountId& caller) const;

  // -------------------------------------------------------------------------
  // executeDue(caller)
  // -------------------------------------------------------------------------
  //
  // @brief  Keeper entry point: executes every order due now, once.
  //
  // @return Number of successful executions.
  //
  // @details
  // Throws Unauthorized when the caller is not the agent; nothing else
  // escapes. The due set is snapshotted with findAllDue(now) and walked in
  // scan order. A per-order OrderError is logged to stderr, published as
  // ExecutionRejectedEvent and does not stop the batch.
  // -------------------------------------------------------------------------
  std::size_t executeDue(const domain::AccountId& caller);

  // Pays out a parked completion refund. Throws NothingToClaim,
  // CustodyTransferFailed.
  domain::Amount claimRefund(const domain::AccountId& owner);

  // -------------------------------------------------------------------------
  // Queries
  // -------------------------------------------------------------------------
  std::optional<domain::Order> getOrder(domain::OrderId id) const;
  std::size_t activeOrderCount() const;
  bool containsOrder(domain::OrderId id) const;
  std::vector<domain::OrderId> dueOrders() const;
  domain::Amount accruedFees() const;
  domain::Amount pendingRefund(const domain::AccountId& owner) const;
  domain::EngineSettings settings() const;

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one JSON command from the IPC REP socket.
  //
  // @return A JSON reply; never throws.
  //
  // @details
  // Request: {"cmd": "<name>", ...arguments}. Reply on success:
  // {"status": "ok", ...payload}. Reply on failure:
  // {"status": "error", "code": "<name>", "retryable": bool,
  //  "message": "..."}. `code` is errorCodeToString() for OrderError,
  // "BadRequest" for malformed JSON or missing, mistyped or negative
  // arguments and "UnknownCommand" for an unrecognised cmd.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // Starts the IPC server and keeper as configured. Idempotent.
  void start();

  // Stops and joins the service threads. Idempotent.
  void stop();

  EventBus& eventBus() { return bus_; }

 private:
  using Outbox = std::vector<Event>;

  void requireAdmin(const domain::AccountId& caller) const;
  domain::Price currentPrice() const;
  std::uint64_t nextSequence() { return ++sequence_; }

  ExecutionResult executeLocked(domain::OrderId id,
                                const domain::AccountId& caller,
                                domain::UnixSeconds now, Outbox& outbox);

  void recordRejection(domain::OrderId id, const OrderError& error,
                       domain::UnixSeconds now, Outbox& outbox);

  const ITimeProvider& clock_;
  IFundsCustody& custody_;
  EngineConfig config_;
  const IPriceOracle* command_oracle_;

  mutable std::mutex mutex_;

  domain::EngineSettings settings_;
  const IPriceOracle* oracle_{nullptr};
  domain::Amount accrued_fees_{0};
  std::uint64_t sequence_{0};

  OrderIdGenerator id_gen_;
  OrderStore store_;
  OrderFactory factory_;
  DueOrderScanner scanner_;
  LifecycleTerminator terminator_;
  ExecutionEngine execution_;

  EventBus bus_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<KeeperThread> keeper_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
};

}  // namespace dca
