#include "dca/engine/dca_engine.hpp"

#include "dca/domain/error.hpp"
#include "dca/network/json_format.hpp"
#include "dca/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace dca {

namespace {

nlohmann::json okReply() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

nlohmann::json errorReply(const std::string& code, bool retryable,
                          const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["code"] = code;
  j["retryable"] = retryable;
  j["message"] = message;
  return j;
}

nlohmann::json swapToJson(const SwapRecord& swap) {
  nlohmann::json j;
  j["order_id"] = swap.order_id;
  j["amount_in"] = swap.amount_in;
  j["amount_out"] = swap.amount_out;
  j["price"] = swap.price;
  j["swaps_executed"] = swap.swaps_executed;
  j["remaining_balance"] = swap.remaining_balance;
  j["executed_at"] = swap.executed_at;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: wire components, seed identities from config
// -----------------------------------------------------------------------------
DcaEngine::DcaEngine(const ITimeProvider& clock, IFundsCustody& custody,
                     IExchange& exchange, const EngineConfig& config,
                     const IPriceOracle* command_oracle)
    : clock_(clock),
      custody_(custody),
      config_(config),
      command_oracle_(command_oracle),
      factory_(id_gen_, settings_),
      scanner_(store_),
      terminator_(store_, custody),
      execution_(store_, exchange, terminator_, settings_) {
  settings_.admin_id = config.admin_id;
  settings_.agent_id = config.agent_id;
  settings_.execution_fee = config.execution_fee;
}

DcaEngine::~DcaEngine() { stop(); }

// -----------------------------------------------------------------------------
// Administrative surface
// -----------------------------------------------------------------------------
void DcaEngine::requireAdmin(const domain::AccountId& caller) const {
  if (settings_.admin_id.empty() || caller != settings_.admin_id) {
    throw OrderError(ErrorCode::Unauthorized,
                     "caller '" + caller + "' is not the admin");
  }
}

void DcaEngine::initialize(const domain::AccountId& caller,
                           const domain::PairConfig& pair,
                           const IPriceOracle* oracle) {
  std::lock_guard lock(mutex_);

  requireAdmin(caller);
  if (settings_.initialized) {
    throw OrderError(ErrorCode::AlreadyInitialized,
                     "engine already serves " + settings_.pair.funding_asset +
                         "/" + settings_.pair.target_asset);
  }
  if (pair.funding_asset.empty() || pair.target_asset.empty() ||
      pair.funding_asset == pair.target_asset) {
    throw OrderError(ErrorCode::InvalidConfiguration,
                     "pair assets must be non-empty and distinct");
  }
  if (oracle == nullptr) {
    throw OrderError(ErrorCode::InvalidConfiguration,
                     "a price oracle is required");
  }

  settings_.pair = pair;
  oracle_ = oracle;
  settings_.initialized = true;

  std::cout << "[DcaEngine] initialized. pair=" << pair.funding_asset << "/"
            << pair.target_asset << "\n";
}

void DcaEngine::setAgent(const domain::AccountId& caller,
                         const domain::AccountId& agent) {
  std::lock_guard lock(mutex_);

  requireAdmin(caller);
  if (agent.empty()) {
    throw OrderError(ErrorCode::InvalidConfiguration,
                     "agent must not be empty");
  }
  settings_.agent_id = agent;

  std::cout << "[DcaEngine] agent set to '" << agent << "'\n";
}

void DcaEngine::setExecutionFee(const domain::AccountId& caller,
                                domain::Amount fee) {
  std::lock_guard lock(mutex_);

  requireAdmin(caller);
  settings_.execution_fee = fee;

  std::cout << "[DcaEngine] execution fee set to " << fee << "\n";
}

// -----------------------------------------------------------------------------
// createOrder(): build, insert, fund; undo the insert if funding fails
// -----------------------------------------------------------------------------
domain::OrderId DcaEngine::createOrder(const domain::OrderRequest& request) {
  Outbox outbox;
  domain::OrderId id{};

  {
    std::lock_guard lock(mutex_);

    if (!settings_.initialized) {
      throw OrderError(ErrorCode::NotInitialized,
                       "engine has no pair configured yet");
    }

    const domain::UnixSeconds now = clock_.now_seconds();
    domain::Order order = factory_.build(request, now);
    id = order.id;

    if (!store_.insert(order)) {
      throw OrderError(ErrorCode::InvalidConfiguration,
                       "order id " + std::to_string(id) + " already in use");
    }
    if (!custody_.transferIn(order.owner, order.total_amount)) {
      store_.removeById(id);
      throw OrderError(ErrorCode::CustodyTransferFailed,
                       "could not take " + std::to_string(order.total_amount) +
                           " from '" + order.owner + "'");
    }

    accrued_fees_ += request.fee_payment;

    OrderCreatedEvent event;
    event.order = std::move(order);
    event.fee_paid = request.fee_payment;
    event.timestamp = seconds_to_timestamp(now);
    event.sequence_id = nextSequence();
    outbox.emplace_back(std::move(event));
  }

  bus_.publishAll(outbox);
  return id;
}

// -----------------------------------------------------------------------------
// cancelOrder()
// -----------------------------------------------------------------------------
TerminationResult DcaEngine::cancelOrder(domain::OrderId id,
                                         const domain::AccountId& caller) {
  Outbox outbox;
  TerminationResult result;

  {
    std::lock_guard lock(mutex_);

    result =
        terminator_.terminate(id, domain::TerminationReason::Cancelled, caller);

    OrderCancelledEvent event;
    event.order_id = result.order.id;
    event.owner = result.order.owner;
    event.refunded = result.refunded;
    event.timestamp = seconds_to_timestamp(clock_.now_seconds());
    event.sequence_id = nextSequence();
    outbox.emplace_back(std::move(event));
  }

  bus_.publishAll(outbox);
  return result;
}

// -----------------------------------------------------------------------------
// Execution
// -----------------------------------------------------------------------------
domain::Price DcaEngine::currentPrice() const {
  if (oracle_ == nullptr) {
    throw OrderError(ErrorCode::NotInitialized,
                     "no price oracle bound; initialize the engine first");
  }
  return oracle_->latestPrice().value;
}

ExecutionResult DcaEngine::executeLocked(domain::OrderId id,
                                         const domain::AccountId& caller,
                                         domain::UnixSeconds now,
                                         Outbox& outbox) {
  const domain::Price price = currentPrice();
  ExecutionResult result = execution_.execute(id, now, price, caller);
  const Timestamp ts = seconds_to_timestamp(now);

  SwapExecutedEvent swapped;
  swapped.order_id = result.swap.order_id;
  swapped.owner = result.swap.owner;
  swapped.amount_in = result.swap.amount_in;
  swapped.amount_out = result.swap.amount_out;
  swapped.price = result.swap.price;
  swapped.swaps_executed = result.swap.swaps_executed;
  swapped.remaining_balance = result.swap.remaining_balance;
  swapped.timestamp = ts;
  swapped.sequence_id = nextSequence();
  outbox.emplace_back(std::move(swapped));

  if (result.termination) {
    const TerminationResult& t = *result.termination;

    OrderCompletedEvent completed;
    completed.order_id = t.order.id;
    completed.owner = t.order.owner;
    completed.swaps_executed = t.order.swaps_executed;
    completed.remaining_balance = t.order.remaining_balance;
    completed.refunded = t.refunded;
    completed.timestamp = ts;
    completed.sequence_id = nextSequence();
    outbox.emplace_back(std::move(completed));

    if (t.deferred > 0) {
      RefundDeferredEvent deferred;
      deferred.order_id = t.order.id;
      deferred.owner = t.order.owner;
      deferred.amount = t.deferred;
      deferred.timestamp = ts;
      deferred.sequence_id = nextSequence();
      outbox.emplace_back(std::move(deferred));
    }
  }

  return result;
}

ExecutionResult DcaEngine::executeOrder(domain::OrderId id,
                                        const domain::AccountId& caller) {
  Outbox outbox;
  ExecutionResult result;

  {
    std::lock_guard lock(mutex_);
    result = executeLocked(id, caller, clock_.now_seconds(), outbox);
  }

  bus_.publishAll(outbox);
  return result;
}

void DcaEngine::preAuthorize(domain::OrderId id,
                             const domain::AccountId& caller) const {
  std::lock_guard lock(mutex_);
  execution_.preAuthorize(id, currentPrice(), caller);
}

void DcaEngine::recordRejection(domain::OrderId id, const OrderError& error,
                                domain::UnixSeconds now, Outbox& outbox) {
  std::cerr << "[DcaEngine] WARN: execution of order " << id << " refused ("
            << errorCodeToString(error.code()) << "): " << error.what()
            << "\n";

  ExecutionRejectedEvent event;
  event.order_id = id;
  event.code = errorCodeToString(error.code());
  event.message = error.what();
  event.retryable = isRetryable(error.code());
  event.timestamp = seconds_to_timestamp(now);
  event.sequence_id = nextSequence();
  outbox.emplace_back(std::move(event));
}

// -----------------------------------------------------------------------------
// executeDue(): one pass over the due snapshot
// -----------------------------------------------------------------------------
std::size_t DcaEngine::executeDue(const domain::AccountId& caller) {
  Outbox outbox;
  std::size_t executed = 0;

  {
    std::lock_guard lock(mutex_);

    if (settings_.agent_id.empty() || caller != settings_.agent_id) {
      throw OrderError(ErrorCode::Unauthorized,
                       "caller '" + caller + "' is not the automation agent");
    }

    const domain::UnixSeconds now = clock_.now_seconds();
    const std::vector<domain::OrderId> due = scanner_.findAllDue(now);

    for (domain::OrderId id : due) {
      try {
        executeLocked(id, caller, now, outbox);
        ++executed;
      } catch (const OrderError& e) {
        recordRejection(id, e, now, outbox);
      }
    }
  }

  bus_.publishAll(outbox);
  return executed;
}

domain::Amount DcaEngine::claimRefund(const domain::AccountId& owner) {
  std::lock_guard lock(mutex_);
  return terminator_.claimRefund(owner);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Order> DcaEngine::getOrder(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  const domain::Order* order = store_.get(id);
  if (order == nullptr) {
    return std::nullopt;
  }
  return *order;
}

std::size_t DcaEngine::activeOrderCount() const {
  std::lock_guard lock(mutex_);
  return store_.count();
}

bool DcaEngine::containsOrder(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  return store_.containsId(id);
}

std::vector<domain::OrderId> DcaEngine::dueOrders() const {
  std::lock_guard lock(mutex_);
  return scanner_.findAllDue(clock_.now_seconds());
}

domain::Amount DcaEngine::accruedFees() const {
  std::lock_guard lock(mutex_);
  return accrued_fees_;
}

domain::Amount DcaEngine::pendingRefund(const domain::AccountId& owner) const {
  std::lock_guard lock(mutex_);
  return terminator_.pendingRefund(owner);
}

domain::EngineSettings DcaEngine::settings() const {
  std::lock_guard lock(mutex_);
  return settings_;
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON request -> JSON reply
// -----------------------------------------------------------------------------
std::string DcaEngine::executeCommand(const std::string& request) {
  nlohmann::json reply;

  try {
    const auto req = nlohmann::json::parse(request);
    const std::string cmd = req.at("cmd").get<std::string>();

    reply = okReply();

    if (cmd == "ping") {
      reply["response"] = "pong";
    } else if (cmd == "status") {
      const domain::EngineSettings s = settings();
      reply["initialized"] = s.initialized;
      reply["admin"] = s.admin_id;
      reply["agent"] = s.agent_id;
      reply["execution_fee"] = s.execution_fee;
      reply["pair"] = {{"funding_asset", s.pair.funding_asset},
                       {"target_asset", s.pair.target_asset}};
      reply["now"] = clock_.now_seconds();
      reply["active_orders"] = activeOrderCount();
      reply["accrued_fees"] = accruedFees();
    } else if (cmd == "initialize") {
      domain::PairConfig pair;
      pair.funding_asset = req.at("funding_asset").get<std::string>();
      pair.target_asset = req.at("target_asset").get<std::string>();
      initialize(req.at("caller").get<std::string>(), pair, command_oracle_);
    } else if (cmd == "create") {
      domain::OrderRequest order_request;
      order_request.owner = req.at("owner").get<std::string>();
      order_request.total_amount =
          readUnsigned<domain::Amount>(req, "total_amount");
      order_request.duration_days =
          readUnsigned<std::uint32_t>(req, "duration_days");
      order_request.min_price =
          readUnsigned(req, "min_price", domain::Price{0});
      order_request.max_price =
          readUnsigned(req, "max_price", domain::Price{0});
      order_request.fee_payment =
          readUnsigned(req, "fee_payment", domain::Amount{0});

      const std::string name = req.value("frequency", std::string("Daily"));
      auto frequency = domain::frequencyFromString(name);
      if (!frequency) {
        throw OrderError(ErrorCode::InvalidSchedule,
                         "unknown frequency '" + name + "'");
      }
      order_request.frequency = *frequency;

      reply["order_id"] = createOrder(order_request);
    } else if (cmd == "cancel") {
      TerminationResult result =
          cancelOrder(readUnsigned<domain::OrderId>(req, "order_id"),
                      req.at("caller").get<std::string>());
      reply["order_id"] = result.order.id;
      reply["refunded"] = result.refunded;
    } else if (cmd == "execute") {
      ExecutionResult result =
          executeOrder(readUnsigned<domain::OrderId>(req, "order_id"),
                       req.at("caller").get<std::string>());
      reply["swap"] = swapToJson(result.swap);
      reply["completed"] = result.termination.has_value();
    } else if (cmd == "execute_due") {
      reply["executed"] = executeDue(req.at("caller").get<std::string>());
    } else if (cmd == "pre_authorize") {
      preAuthorize(readUnsigned<domain::OrderId>(req, "order_id"),
                   req.at("caller").get<std::string>());
      reply["authorized"] = true;
    } else if (cmd == "get") {
      const auto id = readUnsigned<domain::OrderId>(req, "order_id");
      auto order = getOrder(id);
      if (!order) {
        throw OrderError(ErrorCode::OrderNotFound,
                         "order " + std::to_string(id) + " not found");
      }
      reply["order"] = orderToJson(*order);
    } else if (cmd == "count") {
      reply["count"] = activeOrderCount();
    } else if (cmd == "contains") {
      reply["contains"] =
          containsOrder(readUnsigned<domain::OrderId>(req, "order_id"));
    } else if (cmd == "due") {
      reply["order_ids"] = dueOrders();
    } else if (cmd == "set_agent") {
      setAgent(req.at("caller").get<std::string>(),
               req.at("agent").get<std::string>());
    } else if (cmd == "set_fee") {
      setExecutionFee(req.at("caller").get<std::string>(),
                      readUnsigned<domain::Amount>(req, "fee"));
    } else if (cmd == "claim_refund") {
      reply["claimed"] = claimRefund(req.at("owner").get<std::string>());
    } else if (cmd == "accrued_fees") {
      reply["accrued_fees"] = accruedFees();
    } else {
      reply = errorReply("UnknownCommand", false, "unknown command: " + cmd);
    }
  } catch (const OrderError& e) {
    reply = errorReply(errorCodeToString(e.code()), isRetryable(e.code()),
                       e.what());
  } catch (const nlohmann::json::exception& e) {
    reply = errorReply("BadRequest", false, e.what());
  } catch (const JsonFieldError& e) {
    reply = errorReply("BadRequest", false, e.what());
  }

  return reply.dump();
}

// -----------------------------------------------------------------------------
// start(): IPC server first, keeper last
// -----------------------------------------------------------------------------
void DcaEngine::start() {
  if (ipc_server_ || keeper_) {
    return;
  }

  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    IpcServer* server = ipc_server_.get();
    telemetry_subscription_ = bus_.subscribe(
        [server](const Event& event) { server->pushTelemetry(event); });
  }

  if (config_.keeper_enabled) {
    keeper_ = std::make_unique<KeeperThread>(
        [this] { return executeDue(settings().agent_id); },
        std::chrono::milliseconds(config_.keeper_poll_interval_ms));
    keeper_->start();
  }

  std::cout << "[DcaEngine] started. ipc=" << (ipc_server_ ? "on" : "off")
            << " keeper=" << (keeper_ ? "on" : "off") << "\n";
}

// -----------------------------------------------------------------------------
// stop(): keeper, then the IPC worker, then the telemetry subscription
// -----------------------------------------------------------------------------
//
// The IPC worker is joined before unsubscribing: a command still running on
// it may publish through a subscriber snapshot taken before unsubscribe(),
// so the server object must stay alive until that command has returned.
// -----------------------------------------------------------------------------
void DcaEngine::stop() {
  if (!ipc_server_ && !keeper_) {
    return;
  }

  keeper_.reset();

  if (ipc_server_) {
    ipc_server_->stop();
  }
  if (telemetry_subscription_) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  std::cout << "[DcaEngine] stopped. All threads joined.\n";
}

}  // namespace dca
