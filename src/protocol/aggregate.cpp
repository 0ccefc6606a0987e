#include "tschnorr/protocol/aggregate.hpp"

#include "tschnorr/common/logging.hpp"
#include "tschnorr/crypto/modular.hpp"
#include "tschnorr/protocol/group_commitment.hpp"
#include "tschnorr/protocol/lagrange.hpp"

namespace tschnorr {
namespace {

bool MatchesShareRelation(const GroupContext& ctx,
                          const NonceCommitment& commitment,
                          std::string_view message,
                          const mpz_class& g_to_share,
                          const mpz_class& challenge,
                          const mpz_class& lagrange_coefficient) {
  const mpz_class partial = ComputePartialCommitment(ctx, commitment, message);
  const mpz_class exponent = modular::Mul(challenge, lagrange_coefficient, ctx.q());
  const mpz_class expected =
      modular::Mul(partial, modular::Pow(commitment.public_share, exponent, ctx.p()), ctx.p());
  return expected == g_to_share;
}

}  // namespace

bool VerifyParticipants(const GroupContext& ctx,
                        std::span<const NonceCommitment> commitments,
                        std::string_view message,
                        const mpz_class& response,
                        const mpz_class& challenge,
                        uint32_t number_of_participants) {
  const mpz_class g_to_response = ctx.GeneratorPow(modular::Normalize(response, ctx.q()));
  for (const NonceCommitment& commitment : commitments) {
    const mpz_class lambda =
        LagrangeCoefficient(ctx, commitment.participant_id, number_of_participants);
    if (!MatchesShareRelation(ctx, commitment, message, g_to_response, challenge, lambda)) {
      TSCHNORR_LOG_WARN("participant " << commitment.participant_id
                                       << " failed verification against the response");
      return false;
    }
  }
  return true;
}

bool VerifySignatureShare(const GroupContext& ctx,
                          const NonceCommitment& commitment,
                          std::string_view message,
                          const mpz_class& share,
                          const mpz_class& challenge,
                          const mpz_class& lagrange_coefficient) {
  const mpz_class g_to_share = ctx.GeneratorPow(modular::Normalize(share, ctx.q()));
  return MatchesShareRelation(ctx, commitment, message, g_to_share, challenge,
                              lagrange_coefficient);
}

mpz_class ComputeAggregateResponse(const GroupContext& ctx, std::span<const mpz_class> responses) {
  mpz_class sum = 0;
  for (const mpz_class& response : responses) {
    sum = modular::Add(sum, response, ctx.q());
  }
  return sum;
}

AggregateSignature AggregateSignatureShares(const GroupContext& ctx,
                                            const mpz_class& group_commitment,
                                            std::span<const mpz_class> responses) {
  AggregateSignature out;
  out.group_commitment = modular::Normalize(group_commitment, ctx.p());
  out.response = ComputeAggregateResponse(ctx, responses);
  return out;
}

bool VerifyAggregateSignature(const GroupContext& ctx,
                              const AggregateSignature& signature,
                              const mpz_class& group_public_key,
                              std::string_view message) {
  if (!ctx.IsGroupElement(signature.group_commitment) || !ctx.IsGroupElement(group_public_key)) {
    return false;
  }
  if (signature.response < 0 || signature.response >= ctx.q()) {
    return false;
  }

  const mpz_class challenge =
      ComputeChallenge(ctx, signature.group_commitment, group_public_key, message);
  const mpz_class lhs = ctx.GeneratorPow(signature.response);
  const mpz_class rhs = modular::Mul(signature.group_commitment,
                                     modular::Pow(group_public_key, challenge, ctx.p()), ctx.p());
  return lhs == rhs;
}

}  // namespace tschnorr
