#include "dca/time/live_time_provider.hpp"

#include <chrono>

namespace dca {

// -----------------------------------------------------------------------------
// now_seconds(): system_clock truncated to whole seconds
// -----------------------------------------------------------------------------
domain::UnixSeconds LiveTimeProvider::now_seconds() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(since_epoch)
      .count();
}

}  // namespace dca
