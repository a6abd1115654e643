#pragma once

#include "condorder/condition/i_condition_status_source.hpp"

#include <map>
#include <mutex>

namespace condorder {

// -----------------------------------------------------------------------------
// InMemoryConditionSource - table-backed IConditionStatusSource
// -----------------------------------------------------------------------------
//
// @brief  Serves statuses from a map that the owner updates directly.
//
// @details
// Used by tests, by the CLI's "static" status source, and by anything that
// simulates a market lifecycle. A reference that was never set reads as
// {remaining = 0, resolved_or_cancelled = false}: the same thing a real
// market reports for an order it has never seen.
//
// Thread model:
//   setStatus() and getStatus() may run on different threads; a
//   mutex guards the map.
// -----------------------------------------------------------------------------
class InMemoryConditionSource final : public IConditionStatusSource {
 public:
  InMemoryConditionSource() = default;

  InMemoryConditionSource(const InMemoryConditionSource&) = delete;
  InMemoryConditionSource& operator=(const InMemoryConditionSource&) = delete;

  domain::ConditionStatus getStatus(
      const domain::ConditionRef& ref) const override;

  // Inserts or replaces the status for ref.
  void setStatus(const domain::ConditionRef& ref,
                 const domain::ConditionStatus& status);

 private:
  mutable std::mutex mutex_;
  std::map<domain::ConditionRef, domain::ConditionStatus> statuses_;
};

}  // namespace condorder
