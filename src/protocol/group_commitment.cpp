#include "tschnorr/protocol/group_commitment.hpp"

#include "tschnorr/common/logging.hpp"
#include "tschnorr/crypto/modular.hpp"
#include "tschnorr/crypto/transcript.hpp"
#include "tschnorr/protocol/binding.hpp"

namespace tschnorr {

mpz_class ComputePartialCommitment(const GroupContext& ctx,
                                   const NonceCommitment& commitment,
                                   std::string_view message) {
  const mpz_class binding_value = ComputeBindingValue(ctx, commitment, message);
  return modular::Mul(commitment.d, modular::Pow(commitment.e, binding_value, ctx.p()), ctx.p());
}

mpz_class ComputeChallenge(const GroupContext& ctx,
                           const mpz_class& group_commitment,
                           const mpz_class& group_public_key,
                           std::string_view message) {
  Transcript transcript;
  transcript.append(group_commitment);
  transcript.append(group_public_key);
  transcript.append(message);
  return transcript.challenge_mod(ctx.q());
}

GroupCommitmentAndChallenge ComputeGroupCommitmentAndChallenge(
    const GroupContext& ctx,
    std::span<const NonceCommitment> commitments,
    std::string_view message,
    const mpz_class& group_public_key) {
  GroupCommitmentAndChallenge out;
  out.group_commitment = 1;
  for (const NonceCommitment& commitment : commitments) {
    out.group_commitment = modular::Mul(
        out.group_commitment, ComputePartialCommitment(ctx, commitment, message), ctx.p());
  }
  out.challenge = ComputeChallenge(ctx, out.group_commitment, group_public_key, message);

  TSCHNORR_LOG_DEBUG("group commitment over " << commitments.size()
                                              << " commitments, challenge=" << out.challenge);
  return out;
}

}  // namespace tschnorr
