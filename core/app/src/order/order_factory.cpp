#include "dca/order/order_factory.hpp"
#include "dca/domain/error.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderFactory::OrderFactory(OrderIdGenerator& id_gen,
                           const domain::EngineSettings& settings)
    : id_gen_(id_gen), settings_(settings) {}

// -----------------------------------------------------------------------------
// deriveSchedule()
// -----------------------------------------------------------------------------
ScheduleTerms OrderFactory::deriveSchedule(domain::Amount total_amount,
                                           domain::Frequency frequency,
                                           std::uint32_t duration_days) {
  if (total_amount == 0) {
    throw OrderError(ErrorCode::InvalidSchedule,
                     "total amount must be greater than zero");
  }
  if (duration_days == 0) {
    throw OrderError(ErrorCode::InvalidSchedule,
                     "duration must be at least one day");
  }

  ScheduleTerms terms;
  terms.frequency_seconds = domain::frequencySeconds(frequency);
  terms.duration_seconds =
      static_cast<std::int64_t>(duration_days) * domain::kSecondsPerDay;
  const std::int64_t swaps = terms.duration_seconds / terms.frequency_seconds;
  if (swaps > static_cast<std::int64_t>(
                  std::numeric_limits<std::uint32_t>::max())) {
    throw OrderError(ErrorCode::InvalidSchedule,
                     "duration of " + std::to_string(duration_days) +
                         " day(s) yields " + std::to_string(swaps) +
                         " swaps, more than a schedule can hold");
  }
  terms.total_swaps = static_cast<std::uint32_t>(swaps);

  if (terms.total_swaps == 0) {
    throw OrderError(ErrorCode::InvalidSchedule,
                     std::string("duration of ") +
                         std::to_string(duration_days) +
                         " day(s) is shorter than one " +
                         domain::frequencyToString(frequency) + " interval");
  }

  terms.amount_per_swap = total_amount / terms.total_swaps;
  if (terms.amount_per_swap == 0) {
    throw OrderError(ErrorCode::InvalidSchedule,
                     "total amount " + std::to_string(total_amount) +
                         " cannot fund " + std::to_string(terms.total_swaps) +
                         " swaps");
  }

  return terms;
}

// -----------------------------------------------------------------------------
// build()
// -----------------------------------------------------------------------------
domain::Order OrderFactory::build(const domain::OrderRequest& request,
                                  domain::UnixSeconds now) {
  if (request.owner.empty()) {
    throw OrderError(ErrorCode::InvalidConfiguration,
                     "order owner must not be empty");
  }

  if (request.min_price != 0 && request.max_price != 0 &&
      request.min_price > request.max_price) {
    throw OrderError(ErrorCode::InvalidSchedule,
                     "min price " + std::to_string(request.min_price) +
                         " exceeds max price " +
                         std::to_string(request.max_price));
  }

  // Amount and duration checks run before the fee check so a caller with a
  // malformed schedule hears about the schedule first.
  if (request.total_amount == 0 || request.duration_days == 0) {
    deriveSchedule(request.total_amount, request.frequency,
                   request.duration_days);
  }

  if (request.fee_payment < settings_.execution_fee) {
    throw OrderError(ErrorCode::InsufficientFee,
                     "fee payment " + std::to_string(request.fee_payment) +
                         " is below the execution fee " +
                         std::to_string(settings_.execution_fee));
  }

  const ScheduleTerms terms = deriveSchedule(
      request.total_amount, request.frequency, request.duration_days);

  domain::Order order;
  order.id = id_gen_.next_id();
  order.owner = request.owner;
  order.total_amount = request.total_amount;
  order.amount_per_swap = terms.amount_per_swap;
  order.frequency = terms.frequency_seconds;
  order.creation_time = now;
  order.last_execution_time = now;
  order.end_time = now + terms.duration_seconds;
  order.min_price = request.min_price;
  order.max_price = request.max_price;
  order.swaps_executed = 0;
  order.total_swaps = terms.total_swaps;
  order.remaining_balance = request.total_amount;
  return order;
}

}  // namespace dca
