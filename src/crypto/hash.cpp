#include "tschnorr/crypto/hash.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

#include <openssl/sha.h>

#include "tschnorr/common/errors.hpp"

namespace tschnorr {

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

std::string Sha256Hex(std::string_view text) {
  return HexEncode(Sha256(AsByteSpan(text)));
}

std::string HexEncode(std::span<const uint8_t> data) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t byte : data) {
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0F]);
  }
  return out;
}

mpz_class ParseHexDigest(std::string_view hex_digest) {
  if (hex_digest.empty()) {
    throw ArithmeticError("digest is empty");
  }
  // mpz_set_str tolerates embedded whitespace, a digest must not contain any.
  for (char ch : hex_digest) {
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      throw ArithmeticError("digest is not a base-16 string");
    }
  }

  mpz_class out;
  if (out.set_str(std::string(hex_digest), 16) != 0) {
    throw ArithmeticError("digest is not a base-16 string");
  }
  return out;
}

}  // namespace tschnorr
