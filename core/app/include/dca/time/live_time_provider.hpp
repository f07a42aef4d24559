#pragma once

#include "dca/time/i_time_provider.hpp"

namespace dca {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Used when the config selects "clock": "live". Stateless; safe from any
// thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  domain::UnixSeconds now_seconds() const override;
};

}  // namespace dca
