#pragma once

#include <span>
#include <string_view>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/commitment.hpp"

namespace tschnorr {

struct GroupCommitmentAndChallenge {
  mpz_class group_commitment;
  mpz_class challenge;
};

// r_i = D_i * E_i^rho_i mod p.
mpz_class ComputePartialCommitment(const GroupContext& ctx,
                                   const NonceCommitment& commitment,
                                   std::string_view message);

// c = H(R :::: Y :::: message) mod q.
mpz_class ComputeChallenge(const GroupContext& ctx,
                           const mpz_class& group_commitment,
                           const mpz_class& group_public_key,
                           std::string_view message);

// R = prod r_i mod p over `commitments` (1 for an empty list) and the
// challenge derived from it. Callers must pass the same commitment set that
// every signer of the session uses.
GroupCommitmentAndChallenge ComputeGroupCommitmentAndChallenge(
    const GroupContext& ctx,
    std::span<const NonceCommitment> commitments,
    std::string_view message,
    const mpz_class& group_public_key);

}  // namespace tschnorr
