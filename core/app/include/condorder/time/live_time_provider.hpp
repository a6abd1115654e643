#pragma once

#include "condorder/time/i_time_provider.hpp"

namespace condorder {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock,
//         truncated to whole seconds.
//
// Thread model:
//   system_clock::now() is safe from any thread. No internal state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_s() const override;
};

}  // namespace condorder
