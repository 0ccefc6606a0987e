#pragma once

#include <gmpxx.h>

namespace tschnorr {
namespace modular {

// Residue arithmetic over Z_m. Every result is normalized into [0, m).
// A non-positive modulus throws std::invalid_argument.

mpz_class Normalize(const mpz_class& value, const mpz_class& modulus);

mpz_class Add(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus);
mpz_class Sub(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus);
mpz_class Mul(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus);

// Throws ArithmeticError when gcd(value, modulus) != 1.
mpz_class Inverse(const mpz_class& value, const mpz_class& modulus);

// lhs * rhs^-1 mod m. Throws ArithmeticError when rhs is not invertible.
mpz_class Div(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus);

// Throws ArithmeticError for a negative exponent.
mpz_class Pow(const mpz_class& base, const mpz_class& exponent, const mpz_class& modulus);

}  // namespace modular
}  // namespace tschnorr
