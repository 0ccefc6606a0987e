#include "tschnorr/crypto/transcript.hpp"

#include "tschnorr/crypto/hash.hpp"
#include "tschnorr/crypto/modular.hpp"

namespace tschnorr {

void Transcript::append(std::string_view field) {
  if (field_count_ > 0) {
    preimage_.append(kTranscriptFieldSeparator);
  }
  preimage_.append(field);
  ++field_count_;
}

void Transcript::append(const mpz_class& value) {
  append(value.get_str(10));
}

const std::string& Transcript::preimage() const {
  return preimage_;
}

size_t Transcript::field_count() const {
  return field_count_;
}

std::string Transcript::hex_digest() const {
  return Sha256Hex(preimage_);
}

mpz_class Transcript::challenge_mod(const mpz_class& modulus) const {
  return modular::Normalize(ParseHexDigest(hex_digest()), modulus);
}

}  // namespace tschnorr
