#pragma once

#include <string_view>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/commitment.hpp"

namespace tschnorr {

// rho_i = H(id :::: message :::: "<id>::<D>::<E>") mod q.
//
// Binds a participant's nonce commitments to the message and to its own id,
// so nonces published by one participant cannot be replayed under another id
// or another message. Deterministic.
mpz_class ComputeBindingValue(const GroupContext& ctx,
                              const NonceCommitment& commitment,
                              std::string_view message);

}  // namespace tschnorr
