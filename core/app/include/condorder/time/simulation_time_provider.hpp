#pragma once

#include "condorder/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace condorder {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the
//         caller rather than read from the system clock.
//
// @details
// Used by tests and by the CLI when a config pins "now". Evaluations made
// against a SimulationTimeProvider depend only on their inputs, which is
// what makes outcome classification reproducible.
//
// Why std::atomic instead of a mutex:
//   One writer (the harness) and any number of readers. An atomic int64 is
//   lock-free on 64-bit platforms and gives the visibility guarantee needed.
//
// Thread model:
//   advance_time() from one writer thread; now_s() from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_s)
      : current_time_s_(start_s) {}

  std::int64_t now_s() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_s)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to new_time_s.
  //
  // @details
  // The ITimeProvider contract requires non-decreasing reads, so a value
  // earlier than the current one is ignored.
  //
  // Thread-safety: Single writer; safe against concurrent now_s() readers.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_s);

 private:
  std::atomic<std::int64_t> current_time_s_{0};
};

}  // namespace condorder
