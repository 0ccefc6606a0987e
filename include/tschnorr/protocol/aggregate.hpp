#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/commitment.hpp"

namespace tschnorr {

struct AggregateSignature {
  mpz_class group_commitment;
  mpz_class response;
};

// For every commitment, checks r_i * Y_i^(c * lambda_i) == g^response, with
// lambda_i from the 1..number_of_participants index range. Each participant's
// term is compared against the same `response`, so a set with more than one
// signer only passes when handed that signer's own share; the aggregate
// relation is checked by VerifyAggregateSignature instead. Returns false at
// the first mismatch. An empty commitment list is accepted.
bool VerifyParticipants(const GroupContext& ctx,
                        std::span<const NonceCommitment> commitments,
                        std::string_view message,
                        const mpz_class& response,
                        const mpz_class& challenge,
                        uint32_t number_of_participants);

// g^share == r_i * Y_i^(c * lambda_i) mod p for a single participant.
bool VerifySignatureShare(const GroupContext& ctx,
                          const NonceCommitment& commitment,
                          std::string_view message,
                          const mpz_class& share,
                          const mpz_class& challenge,
                          const mpz_class& lagrange_coefficient);

// sum z_i mod q. Order independent; 0 for an empty list.
mpz_class ComputeAggregateResponse(const GroupContext& ctx, std::span<const mpz_class> responses);

AggregateSignature AggregateSignatureShares(const GroupContext& ctx,
                                            const mpz_class& group_commitment,
                                            std::span<const mpz_class> responses);

// g^z == R * Y^c mod p, with c recomputed from (R, Y, message).
bool VerifyAggregateSignature(const GroupContext& ctx,
                              const AggregateSignature& signature,
                              const mpz_class& group_public_key,
                              std::string_view message);

}  // namespace tschnorr
