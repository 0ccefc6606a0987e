#include "tschnorr/protocol/signing_round.hpp"

#include <stdexcept>
#include <utility>

#include "tschnorr/common/logging.hpp"
#include "tschnorr/protocol/group_commitment.hpp"
#include "tschnorr/protocol/lagrange.hpp"
#include "tschnorr/protocol/response.hpp"

namespace tschnorr {

SigningRound::SigningRound(const GroupContext& ctx, SigningRoundConfig cfg)
    : ctx_(ctx),
      message_(std::move(cfg.message)),
      group_public_key_(std::move(cfg.group_public_key)),
      commitments_(std::move(cfg.commitments)) {
  if (commitments_.empty()) {
    throw std::invalid_argument("SigningRound requires at least 1 commitment");
  }
  if (!ctx_.IsGroupElement(group_public_key_)) {
    throw std::invalid_argument("group public key is not a group element");
  }
  ValidateCommitments(ctx_, commitments_);

  signer_ids_.reserve(commitments_.size());
  for (const NonceCommitment& commitment : commitments_) {
    signer_ids_.push_back(commitment.participant_id);
  }

  const GroupCommitmentAndChallenge rc =
      ComputeGroupCommitmentAndChallenge(ctx_, commitments_, message_, group_public_key_);
  group_commitment_ = rc.group_commitment;
  challenge_ = rc.challenge;

  lagrange_coefficients_.reserve(signer_ids_.size());
  for (ParticipantId id : signer_ids_) {
    lagrange_coefficients_.emplace(id, LagrangeCoefficientForSigners(ctx_, id, signer_ids_));
  }

  TSCHNORR_LOG_DEBUG("signing round opened with " << signer_ids_.size() << " signers");
}

const GroupContext& SigningRound::context() const {
  return ctx_;
}

const std::string& SigningRound::message() const {
  return message_;
}

const mpz_class& SigningRound::group_public_key() const {
  return group_public_key_;
}

const std::vector<NonceCommitment>& SigningRound::commitments() const {
  return commitments_;
}

const std::vector<ParticipantId>& SigningRound::signer_ids() const {
  return signer_ids_;
}

const mpz_class& SigningRound::group_commitment() const {
  return group_commitment_;
}

const mpz_class& SigningRound::challenge() const {
  return challenge_;
}

const mpz_class& SigningRound::lagrange_coefficient(ParticipantId id) const {
  const auto it = lagrange_coefficients_.find(id);
  if (it == lagrange_coefficients_.end()) {
    throw std::invalid_argument("participant is not a signer of this round");
  }
  return it->second;
}

mpz_class SigningRound::ComputeResponse(ParticipantId self_id,
                                        const mpz_class& private_share,
                                        SigningNonces& nonces) const {
  return ComputeOwnResponse(ctx_, CommitmentFor(self_id), private_share, nonces,
                            lagrange_coefficient(self_id), challenge_, message_);
}

bool SigningRound::AddSignatureShare(ParticipantId id, const mpz_class& share) {
  if (status_ != RoundStatus::kCollecting) {
    TSCHNORR_LOG_WARN("share from participant " << id << " arrived after the round closed");
    return false;
  }

  const auto lambda_it = lagrange_coefficients_.find(id);
  if (lambda_it == lagrange_coefficients_.end()) {
    TSCHNORR_LOG_WARN("share from unknown participant " << id);
    misbehaving_.insert(id);
    return false;
  }
  if (shares_.count(id) != 0) {
    TSCHNORR_LOG_WARN("duplicate share from participant " << id);
    misbehaving_.insert(id);
    return false;
  }
  if (share < 0 || share >= ctx_.q() ||
      !VerifySignatureShare(ctx_, CommitmentFor(id), message_, share, challenge_,
                            lambda_it->second)) {
    TSCHNORR_LOG_WARN("invalid signature share from participant " << id);
    misbehaving_.insert(id);
    return false;
  }

  shares_.emplace(id, share);
  if (shares_.size() == signer_ids_.size()) {
    FinalizeSignature();
  }
  return true;
}

RoundStatus SigningRound::status() const {
  return status_;
}

const std::string& SigningRound::abort_reason() const {
  return abort_reason_;
}

const std::unordered_set<ParticipantId>& SigningRound::misbehaving() const {
  return misbehaving_;
}

size_t SigningRound::received_share_count() const {
  return shares_.size();
}

bool SigningRound::HasResult() const {
  return status_ == RoundStatus::kCompleted;
}

const AggregateSignature& SigningRound::result() const {
  if (!HasResult()) {
    throw std::logic_error("signing round result is not ready");
  }
  return result_;
}

const NonceCommitment& SigningRound::CommitmentFor(ParticipantId id) const {
  for (const NonceCommitment& commitment : commitments_) {
    if (commitment.participant_id == id) {
      return commitment;
    }
  }
  throw std::invalid_argument("participant is not a signer of this round");
}

void SigningRound::FinalizeSignature() {
  std::vector<mpz_class> ordered_shares;
  ordered_shares.reserve(signer_ids_.size());
  for (ParticipantId id : signer_ids_) {
    ordered_shares.push_back(shares_.at(id));
  }

  AggregateSignature signature = AggregateSignatureShares(ctx_, group_commitment_, ordered_shares);
  if (!VerifyAggregateSignature(ctx_, signature, group_public_key_, message_)) {
    // Every share verified against its own public share, so the public shares
    // are not consistent with the group public key.
    TSCHNORR_LOG_ERROR("aggregate signature does not verify under the group public key");
    status_ = RoundStatus::kAborted;
    abort_reason_ = "aggregate signature does not verify under the group public key";
    return;
  }

  result_ = std::move(signature);
  status_ = RoundStatus::kCompleted;
  abort_reason_.clear();
  TSCHNORR_LOG_INFO("signing round completed with " << shares_.size() << " shares");
}

}  // namespace tschnorr
