#pragma once

#include <cstddef>
#include <cstdint>

#include <gmpxx.h>

namespace tschnorr {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

// Wipes the limbs in place before resetting, so the old magnitude does not
// linger in the allocation GMP keeps for the next value.
inline void SecureZeroize(mpz_class* value) noexcept {
  if (value == nullptr) {
    return;
  }

  const size_t limbs = mpz_size(value->get_mpz_t());
  if (limbs > 0) {
    mp_limb_t* data = mpz_limbs_modify(value->get_mpz_t(), static_cast<mp_size_t>(limbs));
    SecureZeroizeMemory(data, limbs * sizeof(mp_limb_t));
    mpz_limbs_finish(value->get_mpz_t(), 0);
  }
  mpz_set_ui(value->get_mpz_t(), 0);
}

}  // namespace tschnorr
