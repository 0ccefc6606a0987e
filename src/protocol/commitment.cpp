#include "tschnorr/protocol/commitment.hpp"

#include <stdexcept>
#include <unordered_set>

#include "tschnorr/common/errors.hpp"
#include "tschnorr/common/secure_zeroize.hpp"
#include "tschnorr/crypto/modular.hpp"

namespace tschnorr {

ParticipantShare MakeParticipantShare(const GroupContext& ctx,
                                      ParticipantId id,
                                      const mpz_class& private_share) {
  if (id == 0) {
    throw std::invalid_argument("participant id must be non-zero");
  }

  ParticipantShare out;
  out.id = id;
  out.private_share = modular::Normalize(private_share, ctx.q());
  out.public_share = ctx.GeneratorPow(out.private_share);
  return out;
}

std::string NonceCommitment::ToCanonicalString() const {
  return std::to_string(participant_id) + "::" + d.get_str(10) + "::" + e.get_str(10);
}

void ValidateCommitments(const GroupContext& ctx, std::span<const NonceCommitment> commitments) {
  std::unordered_set<ParticipantId> dedup;
  for (const NonceCommitment& commitment : commitments) {
    if (commitment.participant_id == 0) {
      throw std::invalid_argument("commitment participant id must be non-zero");
    }
    if (!dedup.insert(commitment.participant_id).second) {
      throw std::invalid_argument("commitment participant ids must be unique");
    }
    if (!ctx.IsGroupElement(commitment.d) || !ctx.IsGroupElement(commitment.e)) {
      throw std::invalid_argument("nonce commitment is not a group element");
    }
    if (!ctx.IsGroupElement(commitment.public_share)) {
      throw std::invalid_argument("public share is not a group element");
    }
  }
}

SigningNonces::SigningNonces(const GroupContext& ctx, mpz_class hiding, mpz_class binding)
    : hiding_(modular::Normalize(hiding, ctx.q())), binding_(modular::Normalize(binding, ctx.q())) {
  SecureZeroize(&hiding);
  SecureZeroize(&binding);
  if (hiding_ == 0 || binding_ == 0) {
    Wipe();
    throw std::invalid_argument("signing nonces must be non-zero mod q");
  }
}

SigningNonces::~SigningNonces() {
  Wipe();
}

SigningNonces::SigningNonces(SigningNonces&& other) noexcept
    : hiding_(std::move(other.hiding_)),
      binding_(std::move(other.binding_)),
      consumed_(other.consumed_) {
  other.Wipe();
  other.consumed_ = true;
}

SigningNonces& SigningNonces::operator=(SigningNonces&& other) noexcept {
  if (this != &other) {
    Wipe();
    hiding_.swap(other.hiding_);
    binding_.swap(other.binding_);
    consumed_ = other.consumed_;
    other.Wipe();
    other.consumed_ = true;
  }
  return *this;
}

bool SigningNonces::consumed() const {
  return consumed_;
}

NonceCommitment SigningNonces::Commit(const GroupContext& ctx,
                                      ParticipantId participant_id,
                                      const mpz_class& public_share) const {
  if (consumed_) {
    throw NonceReuseError("cannot commit to consumed signing nonces");
  }
  if (participant_id == 0) {
    throw std::invalid_argument("participant id must be non-zero");
  }

  NonceCommitment out;
  out.participant_id = participant_id;
  out.d = ctx.GeneratorPow(hiding_);
  out.e = ctx.GeneratorPow(binding_);
  out.public_share = public_share;
  return out;
}

std::pair<mpz_class, mpz_class> SigningNonces::Consume() {
  if (consumed_) {
    throw NonceReuseError("signing nonces were already consumed");
  }

  std::pair<mpz_class, mpz_class> out(hiding_, binding_);
  Wipe();
  consumed_ = true;
  return out;
}

void SigningNonces::Wipe() noexcept {
  SecureZeroize(&hiding_);
  SecureZeroize(&binding_);
}

}  // namespace tschnorr
