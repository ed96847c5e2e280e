#pragma once

#include <stdexcept>

namespace dmsim {

// A qubit (or classical bit) name is registered twice in one circuit.
class DuplicateEntityError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// A gate or backend call names a qubit that does not exist.
class UnknownQubitError : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
};

class UnknownGateError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace dmsim
