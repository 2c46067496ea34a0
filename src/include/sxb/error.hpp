#pragma once

#include <stdexcept>
#include <string>

namespace sxb {

  // Misuse of the element content state machine (text and child elements are
  // mutually exclusive). Thrown before the element is modified.
  class contract_violation : public std::logic_error {
  public:
    using std::logic_error::logic_error;
  };

  // Failure of the byte sink during serialization.
  class io_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace sxb
