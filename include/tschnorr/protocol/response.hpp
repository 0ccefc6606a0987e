#pragma once

#include <string_view>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/commitment.hpp"

namespace tschnorr {

// Signature share z_i = d_i + e_i * rho_i + lambda_i * s_i * c mod q.
//
// `nonces` is consumed: calling this twice with the same holder throws
// NonceReuseError. The nonces must be the ones behind `own_commitment`,
// otherwise std::invalid_argument is thrown (the holder is still consumed).
mpz_class ComputeOwnResponse(const GroupContext& ctx,
                             const NonceCommitment& own_commitment,
                             const mpz_class& private_share,
                             SigningNonces& nonces,
                             const mpz_class& lagrange_coefficient,
                             const mpz_class& challenge,
                             std::string_view message);

}  // namespace tschnorr
