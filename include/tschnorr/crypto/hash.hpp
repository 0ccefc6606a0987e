#pragma once

#include <span>
#include <string>
#include <string_view>

#include <gmpxx.h>

#include "tschnorr/common/bytes.hpp"

namespace tschnorr {

Bytes Sha256(std::span<const uint8_t> data);

// Lowercase hex SHA-256 of the raw UTF-8 bytes of `text`.
std::string Sha256Hex(std::string_view text);

std::string HexEncode(std::span<const uint8_t> data);

// Parses a base-16 digest string. Throws ArithmeticError on anything that is
// not a non-empty run of hex digits.
mpz_class ParseHexDigest(std::string_view hex_digest);

}  // namespace tschnorr
