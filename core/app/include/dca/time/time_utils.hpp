#pragma once

#include "dca/domain/order.hpp"
#include "dca/events/event_types.hpp"

#include <chrono>

namespace dca {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Engine time is domain::UnixSeconds; event structs carry a Timestamp
// (system_clock::time_point) like the rest of the event metadata. These two
// helpers are the only place the two representations meet.
// -----------------------------------------------------------------------------

inline Timestamp seconds_to_timestamp(domain::UnixSeconds s) {
  return Timestamp{std::chrono::seconds{s}};
}

inline domain::UnixSeconds timestamp_to_seconds(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace dca
