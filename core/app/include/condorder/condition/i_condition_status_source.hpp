#pragma once

#include "condorder/domain/condition_status.hpp"
#include "condorder/domain/word256.hpp"

#include <stdexcept>
#include <string>

namespace condorder {

// -----------------------------------------------------------------------------
// ConditionSourceError
// -----------------------------------------------------------------------------
// Raised when a status read cannot produce a ConditionStatus: the service is
// unreachable, timed out, or replied with something that does not parse.
// This is a property of the caller's environment, not of the order, so it is
// never folded into Never or RetryLater.
// -----------------------------------------------------------------------------
class ConditionSourceError : public std::runtime_error {
 public:
  explicit ConditionSourceError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// IConditionStatusSource - read-only view of the external prediction market
// -----------------------------------------------------------------------------
//
// @brief  Looks up the current status of one external condition.
//
// @details
// The evaluator calls getStatus() at most once per evaluation. Successive
// calls for the same reference may return different snapshots as the market
// progresses; implementations must not cache across calls on the engine's
// behalf (caching is the scheduler's decision).
//
// Implementations:
//   - InMemoryConditionSource - table filled by tests or a simulation.
//   - ZmqConditionSource      - REQ/REP client of a market status service.
//
// Ownership:
//   Callers hold a const reference; the source must outlive them.
// -----------------------------------------------------------------------------
class IConditionStatusSource {
 public:
  virtual ~IConditionStatusSource() = default;

  // -------------------------------------------------------------------------
  // getStatus(ref)
  // -------------------------------------------------------------------------
  // @brief  Returns the current status of the referenced condition.
  //
  // @param  ref  256-bit condition reference from the OrderSpec.
  // @return Snapshot of remaining quantity and resolved/cancelled flag.
  //
  // @throws ConditionSourceError if the status cannot be read.
  // -------------------------------------------------------------------------
  virtual domain::ConditionStatus getStatus(
      const domain::ConditionRef& ref) const = 0;
};

}  // namespace condorder
