#pragma once

#include <stdexcept>

namespace tschnorr {

// Non-invertible divisor, negative exponent or a digest that is not base-16.
class ArithmeticError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A secret nonce pair was read after it had already been consumed.
class NonceReuseError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace tschnorr
