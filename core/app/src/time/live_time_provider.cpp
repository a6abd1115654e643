#include "condorder/time/live_time_provider.hpp"

#include <chrono>

namespace condorder {

// -----------------------------------------------------------------------------
// now_s(): delegate to system_clock and truncate to epoch seconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_s() const {
  auto duration = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

}  // namespace condorder
