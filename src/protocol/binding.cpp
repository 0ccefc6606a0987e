#include "tschnorr/protocol/binding.hpp"

#include "tschnorr/crypto/transcript.hpp"

namespace tschnorr {

mpz_class ComputeBindingValue(const GroupContext& ctx,
                              const NonceCommitment& commitment,
                              std::string_view message) {
  Transcript transcript;
  transcript.append(mpz_class(commitment.participant_id));
  transcript.append(message);
  transcript.append(commitment.ToCanonicalString());
  return transcript.challenge_mod(ctx.q());
}

}  // namespace tschnorr
