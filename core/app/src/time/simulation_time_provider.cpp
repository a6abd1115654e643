#include "condorder/time/simulation_time_provider.hpp"

namespace condorder {

std::int64_t SimulationTimeProvider::now_s() const {
  return current_time_s_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): monotone store
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_s) {
  // Single writer, so load-compare-store cannot race with another store.
  if (new_time_s > current_time_s_.load()) {
    current_time_s_.store(new_time_s);
  }
}

}  // namespace condorder
