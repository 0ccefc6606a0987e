#pragma once

#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/types.hpp"

namespace tschnorr {

// Index-range form: the signers are taken to be ids 1..number_of_participants,
//   lambda_i = prod_{j=1..n, j != i} j / (j - i) mod q.
// n == 0 yields the empty product 1. Throws std::invalid_argument for a zero id
// and ArithmeticError when some j - i is 0 mod q.
mpz_class LagrangeCoefficient(const GroupContext& ctx,
                              ParticipantId participant_id,
                              uint32_t number_of_participants);

// Interpolation at zero over the ids that actually signed,
//   lambda_i = prod_{j in S, j != i} x_j / (x_j - x_i) mod q.
// Ids must be nonzero and unique and `participant_id` must belong to S.
mpz_class LagrangeCoefficientForSigners(const GroupContext& ctx,
                                        ParticipantId participant_id,
                                        std::span<const ParticipantId> signer_ids);

}  // namespace tschnorr
