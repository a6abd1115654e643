#pragma once

#include <stdexcept>
#include <string>

namespace condorder {

// -----------------------------------------------------------------------------
// PayloadDecodeError
// -----------------------------------------------------------------------------
// The payload does not decode to exactly the OrderSpec fields. The whole
// evaluation fails; there is no partially decoded order to classify.
// -----------------------------------------------------------------------------
class PayloadDecodeError : public std::runtime_error {
 public:
  explicit PayloadDecodeError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace condorder
