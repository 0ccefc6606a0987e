#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/aggregate.hpp"
#include "tschnorr/protocol/commitment.hpp"
#include "tschnorr/protocol/types.hpp"

namespace tschnorr {

enum class RoundStatus {
  kCollecting = 0,
  kCompleted = 1,
  kAborted = 2,
};

struct SigningRoundConfig {
  std::string message;
  mpz_class group_public_key;
  std::vector<NonceCommitment> commitments;
};

// One signing instance over a fixed commitment set. The group commitment, the
// challenge and every signer's Lagrange coefficient are computed once at
// construction; shares are then checked one by one as they arrive. Not
// thread-safe.
class SigningRound {
 public:
  SigningRound(const GroupContext& ctx, SigningRoundConfig cfg);

  const GroupContext& context() const;
  const std::string& message() const;
  const mpz_class& group_public_key() const;
  const std::vector<NonceCommitment>& commitments() const;
  const std::vector<ParticipantId>& signer_ids() const;

  const mpz_class& group_commitment() const;
  const mpz_class& challenge() const;
  const mpz_class& lagrange_coefficient(ParticipantId id) const;

  // Participant side: z_i for `self_id`, consuming `nonces`.
  mpz_class ComputeResponse(ParticipantId self_id,
                            const mpz_class& private_share,
                            SigningNonces& nonces) const;

  // Coordinator side. Returns false and records `id` as misbehaving when the
  // id is unknown, already answered, or the share does not verify. Completes
  // the round once every signer has a valid share.
  bool AddSignatureShare(ParticipantId id, const mpz_class& share);

  RoundStatus status() const;
  const std::string& abort_reason() const;
  const std::unordered_set<ParticipantId>& misbehaving() const;
  size_t received_share_count() const;

  bool HasResult() const;
  const AggregateSignature& result() const;

 private:
  const NonceCommitment& CommitmentFor(ParticipantId id) const;
  void FinalizeSignature();

  GroupContext ctx_;
  std::string message_;
  mpz_class group_public_key_;
  std::vector<NonceCommitment> commitments_;
  std::vector<ParticipantId> signer_ids_;

  mpz_class group_commitment_;
  mpz_class challenge_;
  std::unordered_map<ParticipantId, mpz_class> lagrange_coefficients_;

  std::unordered_map<ParticipantId, mpz_class> shares_;
  std::unordered_set<ParticipantId> misbehaving_;

  RoundStatus status_ = RoundStatus::kCollecting;
  std::string abort_reason_;
  AggregateSignature result_;
};

}  // namespace tschnorr
