#pragma once

#include "dca/concurrent/order_id_generator.hpp"
#include "dca/domain/engine_settings.hpp"
#include "dca/domain/order.hpp"

#include <cstdint>

namespace dca {

// -----------------------------------------------------------------------------
// ScheduleTerms — derived schedule of a prospective order
// -----------------------------------------------------------------------------
struct ScheduleTerms {
  std::int64_t frequency_seconds{0};
  std::int64_t duration_seconds{0};
  std::uint32_t total_swaps{0};
  domain::Amount amount_per_swap{0};
};

// -----------------------------------------------------------------------------
// OrderFactory — validates an OrderRequest and builds the Order
// -----------------------------------------------------------------------------
//
// @brief  Turns user parameters into a fully-derived domain::Order, or
//         throws OrderError explaining why it cannot.
//
// @details
// Validation order (first failure wins):
//   1. owner non-empty                               → InvalidConfiguration
//   2. min_price <= max_price when both are set      → InvalidSchedule
//   3. total_amount > 0, duration_days > 0           → InvalidSchedule
//   4. fee_payment >= settings.execution_fee         → InsufficientFee
//   5. total_swaps > 0 and amount_per_swap > 0       → InvalidSchedule
//
// Derivation:
//   total_swaps     = floor(duration_days * 86400 / frequency_seconds)
//   amount_per_swap = floor(total_amount / total_swaps)
//
// The integer-division remainder stays in remaining_balance and is refunded
// when the order terminates; it is never executed as an extra swap.
//
// build() draws an id from the generator only after validation passes, so
// rejected requests do not consume ids. It does not touch custody or the
// store; DcaEngine sequences those steps.
//
// Thread model: no internal state besides the borrowed generator and
// settings. Called under DcaEngine's lock.
// -----------------------------------------------------------------------------
class OrderFactory {
 public:
  OrderFactory(OrderIdGenerator& id_gen,
               const domain::EngineSettings& settings);

  OrderFactory(const OrderFactory&) = delete;
  OrderFactory& operator=(const OrderFactory&) = delete;

  // Validates `request` and returns the new order stamped with `now`.
  domain::Order build(const domain::OrderRequest& request,
                      domain::UnixSeconds now);

  // Schedule derivation alone. Throws InvalidSchedule for zero amount,
  // zero duration, or a schedule that yields no swap or an empty swap.
  static ScheduleTerms deriveSchedule(domain::Amount total_amount,
                                      domain::Frequency frequency,
                                      std::uint32_t duration_days);

 private:
  OrderIdGenerator& id_gen_;
  const domain::EngineSettings& settings_;
};

}  // namespace dca
