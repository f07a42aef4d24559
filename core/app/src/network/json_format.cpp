#include "dca/network/json_format.hpp"

#include "dca/time/time_utils.hpp"

#include <type_traits>

namespace dca {

namespace {

const char* frequencyClassName(std::int64_t seconds) {
  using domain::Frequency;
  for (auto f : {Frequency::Hourly, Frequency::Daily, Frequency::Weekly,
                 Frequency::Monthly}) {
    if (domain::frequencySeconds(f) == seconds) {
      return domain::frequencyToString(f);
    }
  }
  return nullptr;
}

template <typename E>
void stamp(nlohmann::json& j, const char* type, const E& e) {
  j["type"] = type;
  j["timestamp"] = timestamp_to_seconds(e.timestamp);
  j["sequence_id"] = e.sequence_id;
}

}  // namespace

// -----------------------------------------------------------------------------
// orderToJson()
// -----------------------------------------------------------------------------
nlohmann::json orderToJson(const domain::Order& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["owner"] = order.owner;
  j["total_amount"] = order.total_amount;
  j["amount_per_swap"] = order.amount_per_swap;
  j["frequency"] = order.frequency;
  if (const char* name = frequencyClassName(order.frequency)) {
    j["frequency_class"] = name;
  }
  j["creation_time"] = order.creation_time;
  j["last_execution_time"] = order.last_execution_time;
  j["next_eligible_time"] = order.nextEligibleTime();
  j["end_time"] = order.end_time;
  j["min_price"] = order.min_price;
  j["max_price"] = order.max_price;
  j["swaps_executed"] = order.swaps_executed;
  j["total_swaps"] = order.total_swaps;
  j["remaining_balance"] = order.remaining_balance;
  return j;
}

// -----------------------------------------------------------------------------
// eventToJson(): one object per lifecycle event
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;

        if constexpr (std::is_same_v<T, OrderCreatedEvent>) {
          stamp(j, "order_created", e);
          j["order"] = orderToJson(e.order);
          j["fee_paid"] = e.fee_paid;
        } else if constexpr (std::is_same_v<T, SwapExecutedEvent>) {
          stamp(j, "swap_executed", e);
          j["order_id"] = e.order_id;
          j["owner"] = e.owner;
          j["amount_in"] = e.amount_in;
          j["amount_out"] = e.amount_out;
          j["price"] = e.price;
          j["swaps_executed"] = e.swaps_executed;
          j["remaining_balance"] = e.remaining_balance;
        } else if constexpr (std::is_same_v<T, OrderCompletedEvent>) {
          stamp(j, "order_completed", e);
          j["order_id"] = e.order_id;
          j["owner"] = e.owner;
          j["swaps_executed"] = e.swaps_executed;
          j["remaining_balance"] = e.remaining_balance;
          j["refunded"] = e.refunded;
        } else if constexpr (std::is_same_v<T, OrderCancelledEvent>) {
          stamp(j, "order_cancelled", e);
          j["order_id"] = e.order_id;
          j["owner"] = e.owner;
          j["refunded"] = e.refunded;
        } else if constexpr (std::is_same_v<T, RefundDeferredEvent>) {
          stamp(j, "refund_deferred", e);
          j["order_id"] = e.order_id;
          j["owner"] = e.owner;
          j["amount"] = e.amount;
        } else if constexpr (std::is_same_v<T, ExecutionRejectedEvent>) {
          stamp(j, "execution_rejected", e);
          j["order_id"] = e.order_id;
          j["code"] = e.code;
          j["message"] = e.message;
          j["retryable"] = e.retryable;
        }
        return j;
      },
      event);
}

}  // namespace dca
