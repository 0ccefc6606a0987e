#include "tschnorr/crypto/modular.hpp"

#include <stdexcept>

#include "tschnorr/common/errors.hpp"

namespace tschnorr {
namespace modular {
namespace {

void RequirePositiveModulus(const mpz_class& modulus) {
  if (modulus <= 0) {
    throw std::invalid_argument("modulus must be positive");
  }
}

}  // namespace

mpz_class Normalize(const mpz_class& value, const mpz_class& modulus) {
  RequirePositiveModulus(modulus);

  mpz_class normalized;
  mpz_mod(normalized.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());
  return normalized;
}

mpz_class Add(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus) {
  return Normalize(lhs + rhs, modulus);
}

mpz_class Sub(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus) {
  return Normalize(lhs - rhs, modulus);
}

mpz_class Mul(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus) {
  return Normalize(lhs * rhs, modulus);
}

mpz_class Inverse(const mpz_class& value, const mpz_class& modulus) {
  RequirePositiveModulus(modulus);

  mpz_class inverse;
  if (mpz_invert(inverse.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t()) == 0) {
    throw ArithmeticError("value has no inverse modulo m");
  }
  return Normalize(inverse, modulus);
}

mpz_class Div(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus) {
  return Mul(lhs, Inverse(rhs, modulus), modulus);
}

mpz_class Pow(const mpz_class& base, const mpz_class& exponent, const mpz_class& modulus) {
  RequirePositiveModulus(modulus);
  if (exponent < 0) {
    throw ArithmeticError("negative exponent is not supported");
  }

  mpz_class out;
  mpz_powm(out.get_mpz_t(), base.get_mpz_t(), exponent.get_mpz_t(), modulus.get_mpz_t());
  return out;
}

}  // namespace modular
}  // namespace tschnorr
