#pragma once

#include <string>

#include <gmpxx.h>

namespace tschnorr {

// Textual group parameters, base 10 or 0x-prefixed hex.
struct GroupContextConfig {
  std::string modulus_p;
  std::string order_q;
  std::string generator;
};

// Schnorr group parameters for one deployment: elements live in Z_p^*,
// `g` generates the subgroup of prime order `q`, and scalars live in Z_q.
// Immutable once constructed; share it by const reference.
class GroupContext {
 public:
  GroupContext(mpz_class modulus_p, mpz_class order_q, mpz_class generator);

  static GroupContext FromConfig(const GroupContextConfig& config);

  const mpz_class& p() const;
  const mpz_class& q() const;
  const mpz_class& g() const;

  // True when 1 <= value < p and value^q == 1 mod p.
  bool IsGroupElement(const mpz_class& value) const;

  // g^exponent mod p. The exponent must be non-negative.
  mpz_class GeneratorPow(const mpz_class& exponent) const;

 private:
  mpz_class p_;
  mpz_class q_;
  mpz_class g_;
};

}  // namespace tschnorr
