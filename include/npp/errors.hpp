// include/npp/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

namespace npp {

// Bad index, malformed number, invalid configuration or a value outside a
// function's domain.
class InputError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// The requested magnitude needs more precision than the supported cap, or an
// explicit override is below what the magnitude requires.
class PrecisionError : public std::range_error {
public:
  using std::range_error::range_error;
};

// The Newton solver cannot continue (left the domain of R, or see
// DerivativeZero). Running out of iterations is NOT reported this way; that
// surfaces as converged=false.
class NumericDegeneracy : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class DerivativeZero : public NumericDegeneracy {
public:
  using NumericDegeneracy::NumericDegeneracy;
};

// Neither the symmetric window nor the bounded forward scan produced a
// probable prime.
class RefinementExhaustion : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace npp
