#include "dca/execution/execution_engine.hpp"
#include "dca/domain/error.hpp"

#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionEngine::ExecutionEngine(OrderStore& store, IExchange& exchange,
                                 LifecycleTerminator& terminator,
                                 const domain::EngineSettings& settings)
    : store_(store),
      exchange_(exchange),
      terminator_(terminator),
      settings_(settings) {}

// -----------------------------------------------------------------------------
// Gate helpers
// -----------------------------------------------------------------------------
void ExecutionEngine::requireAgent(const domain::AccountId& caller) const {
  if (settings_.agent_id.empty() || caller != settings_.agent_id) {
    throw OrderError(ErrorCode::Unauthorized,
                     "caller '" + caller + "' is not the automation agent");
  }
}

const domain::Order& ExecutionEngine::requireOrder(domain::OrderId id) const {
  const domain::Order* order = store_.get(id);
  if (order == nullptr) {
    throw OrderError(ErrorCode::OrderNotFound,
                     "order " + std::to_string(id) + " not found");
  }
  return *order;
}

void ExecutionEngine::checkPriceBounds(const domain::Order& order,
                                       domain::Price price) {
  if (order.min_price != 0 && price < order.min_price) {
    throw OrderError(ErrorCode::PriceBelowMinimum,
                     "price " + std::to_string(price) + " below minimum " +
                         std::to_string(order.min_price) + " for order " +
                         std::to_string(order.id));
  }
  if (order.max_price != 0 && price > order.max_price) {
    throw OrderError(ErrorCode::PriceAboveMaximum,
                     "price " + std::to_string(price) + " above maximum " +
                         std::to_string(order.max_price) + " for order " +
                         std::to_string(order.id));
  }
}

bool ExecutionEngine::isComplete(const domain::Order& order,
                                 domain::UnixSeconds now) {
  return order.swaps_executed >= order.total_swaps ||
         now >= order.end_time ||
         order.remaining_balance < order.amount_per_swap;
}

// -----------------------------------------------------------------------------
// execute()
// -----------------------------------------------------------------------------
ExecutionResult ExecutionEngine::execute(domain::OrderId id,
                                         domain::UnixSeconds now,
                                         domain::Price price,
                                         const domain::AccountId& caller) {
  requireAgent(caller);
  const domain::Order& current = requireOrder(id);

  if (now < current.nextEligibleTime()) {
    throw OrderError(ErrorCode::TooEarly,
                     "order " + std::to_string(id) + " not eligible until " +
                         std::to_string(current.nextEligibleTime()));
  }
  if (now > current.end_time) {
    throw OrderError(ErrorCode::PeriodEnded,
                     "order " + std::to_string(id) + " ended at " +
                         std::to_string(current.end_time));
  }
  if (current.remaining_balance < current.amount_per_swap) {
    throw OrderError(ErrorCode::InsufficientBalance,
                     "order " + std::to_string(id) + " holds " +
                         std::to_string(current.remaining_balance) +
                         ", needs " +
                         std::to_string(current.amount_per_swap));
  }
  checkPriceBounds(current, price);

  // --- External swap: last point where failure leaves no trace -------------
  std::optional<domain::Amount> amount_out =
      exchange_.swap(settings_.pair, current.amount_per_swap, price);
  if (!amount_out) {
    throw OrderError(ErrorCode::ExchangeRejected,
                     "exchange rejected swap of " +
                         std::to_string(current.amount_per_swap) +
                         " for order " + std::to_string(id));
  }

  // --- Accounting: the single authoritative debit ---------------------------
  domain::Order& order = *store_.find(id);
  order.remaining_balance -= order.amount_per_swap;
  order.swaps_executed += 1;
  order.last_execution_time = now;

  ExecutionResult result;
  result.swap.order_id = order.id;
  result.swap.owner = order.owner;
  result.swap.amount_in = order.amount_per_swap;
  result.swap.amount_out = *amount_out;
  result.swap.price = price;
  result.swap.swaps_executed = order.swaps_executed;
  result.swap.remaining_balance = order.remaining_balance;
  result.swap.executed_at = now;

  // --- Completion: hand off before returning --------------------------------
  if (isComplete(order, now)) {
    result.termination = terminator_.terminate(
        id, domain::TerminationReason::Completed, caller);
  }

  return result;
}

// -----------------------------------------------------------------------------
// preAuthorize(): pre-trade gate, no mutation
// -----------------------------------------------------------------------------
void ExecutionEngine::preAuthorize(domain::OrderId id, domain::Price price,
                                   const domain::AccountId& caller) const {
  requireAgent(caller);
  const domain::Order& order = requireOrder(id);
  checkPriceBounds(order, price);

  // Compared by subtraction: amount_per_swap + fee may not fit in an Amount.
  if (order.remaining_balance < order.amount_per_swap ||
      order.remaining_balance - order.amount_per_swap <
          settings_.execution_fee) {
    throw OrderError(ErrorCode::InsufficientBalance,
                     "order " + std::to_string(id) + " holds " +
                         std::to_string(order.remaining_balance) +
                         ", pre-authorization needs " +
                         std::to_string(order.amount_per_swap) +
                         " plus fee " +
                         std::to_string(settings_.execution_fee));
  }
}

}  // namespace dca
