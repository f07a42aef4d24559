#include "dca/time/simulation_time_provider.hpp"

namespace dca {

domain::UnixSeconds SimulationTimeProvider::now_seconds() const {
  return current_time_.load();
}

void SimulationTimeProvider::advance_time(domain::UnixSeconds new_time) {
  current_time_.store(new_time);
}

void SimulationTimeProvider::advance_by(domain::UnixSeconds delta) {
  // fetch_add keeps concurrent advance_by() calls from losing updates.
  current_time_.fetch_add(delta);
}

}  // namespace dca
