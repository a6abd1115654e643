#include "condorder/condition/in_memory_condition_source.hpp"

namespace condorder {

// -----------------------------------------------------------------------------
// getStatus: unknown references read as "nothing behind it"
// -----------------------------------------------------------------------------
domain::ConditionStatus InMemoryConditionSource::getStatus(
    const domain::ConditionRef& ref) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = statuses_.find(ref);
  if (it == statuses_.end()) {
    return domain::ConditionStatus{};
  }
  return it->second;
}

void InMemoryConditionSource::setStatus(const domain::ConditionRef& ref,
                                        const domain::ConditionStatus& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  statuses_[ref] = status;
}

}  // namespace condorder
