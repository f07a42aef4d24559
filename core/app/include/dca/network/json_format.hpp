#pragma once

#include "dca/domain/order.hpp"
#include "dca/events/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// JSON renderings shared by the command replies and the telemetry stream
// -----------------------------------------------------------------------------
//
// @details
// Field names are snake_case and match the struct members. Frequencies are
// rendered in seconds ("frequency") plus the class name when it maps back
// to one of the four classes ("frequency_class").
//
// Telemetry objects carry a "type" discriminator:
//   order_created, swap_executed, order_completed, order_cancelled,
//   refund_deferred, execution_rejected
// plus "timestamp" (unix seconds) and "sequence_id".
// -----------------------------------------------------------------------------

nlohmann::json orderToJson(const domain::Order& order);

nlohmann::json eventToJson(const Event& event);

// A JSON field that is present but holds an unacceptable value.
class JsonFieldError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// readUnsigned<T>(j, key)
// -----------------------------------------------------------------------------
//
// @brief  Reads j[key] as an unsigned integer of type T.
//
// @details
// nlohmann converts a negative integer to an unsigned type by a plain cast,
// so the value is checked before conversion: negative, fractional,
// non-numeric and out-of-range values throw JsonFieldError. A missing key
// throws nlohmann's out_of_range like json::at().
// -----------------------------------------------------------------------------
template <typename T>
T readUnsigned(const nlohmann::json& j, const std::string& key) {
  const nlohmann::json& value = j.at(key);
  const bool non_negative =
      value.is_number_unsigned() ||
      (value.is_number_integer() && value.get<std::int64_t>() >= 0);
  if (!non_negative) {
    throw JsonFieldError("'" + key + "' must be a non-negative integer");
  }
  if (value.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
    throw JsonFieldError("'" + key + "' exceeds " +
                         std::to_string(std::numeric_limits<T>::max()));
  }
  return static_cast<T>(value.get<std::uint64_t>());
}

// Same, but an absent key yields `fallback`.
template <typename T>
T readUnsigned(const nlohmann::json& j, const std::string& key, T fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  return readUnsigned<T>(j, key);
}

}  // namespace dca
