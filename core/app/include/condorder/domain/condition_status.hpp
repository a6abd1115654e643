#pragma once

#include "condorder/domain/word256.hpp"

namespace condorder {
namespace domain {

// -----------------------------------------------------------------------------
// ConditionStatus - snapshot of an external condition
// -----------------------------------------------------------------------------
//
// @brief  What the prediction market reports for one condition reference at
//         the moment of the read.
//
// @details
// Owned by the external market, not by this engine. The two fields combine
// into the lifecycle the evaluator classifies:
//
//   resolved_or_cancelled  remaining   meaning
//   ---------------------  ---------   -------------------------------------
//   false                  > 0         open, still being filled
//   false                  0           unknown reference (nothing behind it)
//   true                   0           fully filled: the bet went through
//   true                   > 0         cancelled before completion
//
// The external market never moves a condition from resolved back to open.
// -----------------------------------------------------------------------------
struct ConditionStatus {
  Word256 remaining;
  bool resolved_or_cancelled{false};
};

}  // namespace domain
}  // namespace condorder
