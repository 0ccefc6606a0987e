#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tschnorr {

using Bytes = std::vector<uint8_t>;

inline std::span<const uint8_t> AsByteSpan(std::string_view value) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

}  // namespace tschnorr
