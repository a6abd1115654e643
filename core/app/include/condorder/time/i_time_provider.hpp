#pragma once

#include <cstdint>

namespace condorder {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// Validity windows are checked against whatever the provider says now is.
// In production that is the wall clock; in tests and replays it is a value
// the harness sets, so an evaluation is reproducible from its inputs.
//
//   - LiveTimeProvider       -> std::chrono::system_clock.
//   - SimulationTimeProvider -> value set by advance_time().
//
// Why int64_t seconds:
//   Order validity bounds are epoch seconds (valid_until is a 32-bit
//   seconds field on the exchange). Reading the clock in the same unit
//   keeps every comparison free of conversions.
//
// Contract:
//   Successive reads are non-decreasing. Implementations must be safe for
//   concurrent reads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_s()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time in seconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_s() const = 0;
};

}  // namespace condorder
