#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <gmpxx.h>

namespace tschnorr {

// Separator placed between transcript fields. Part of the hash framing, so
// every interoperating implementation has to use the same literal.
inline constexpr std::string_view kTranscriptFieldSeparator = "::::";

// Builds a Fiat-Shamir preimage of the form `f1::::f2::::f3`. Integers are
// written in decimal.
class Transcript {
 public:
  void append(std::string_view field);
  void append(const mpz_class& value);

  const std::string& preimage() const;
  size_t field_count() const;

  std::string hex_digest() const;
  mpz_class challenge_mod(const mpz_class& modulus) const;

 private:
  std::string preimage_;
  size_t field_count_ = 0;
};

}  // namespace tschnorr
