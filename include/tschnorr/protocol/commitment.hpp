#pragma once

#include <span>
#include <string>
#include <utility>

#include <gmpxx.h>

#include "tschnorr/crypto/group_context.hpp"
#include "tschnorr/protocol/types.hpp"

namespace tschnorr {

// Long-lived key material of one participant. Never leaves the participant.
struct ParticipantShare {
  ParticipantId id = 0;
  mpz_class private_share;
  mpz_class public_share;
};

ParticipantShare MakeParticipantShare(const GroupContext& ctx,
                                      ParticipantId id,
                                      const mpz_class& private_share);

// What a participant publishes for one signing round: D = g^d, E = g^e and
// its public key share.
struct NonceCommitment {
  ParticipantId participant_id = 0;
  mpz_class d;
  mpz_class e;
  mpz_class public_share;

  // "<id>::<d>::<e>" in decimal. Hashed into the binding factor, so the
  // layout is fixed.
  std::string ToCanonicalString() const;
};

using PublicCommitment = NonceCommitment;

// Throws std::invalid_argument unless every id is nonzero and unique and every
// element is in the order-q subgroup.
void ValidateCommitments(const GroupContext& ctx, std::span<const NonceCommitment> commitments);

// Secret nonce pair (d, e) for exactly one signature. Move-only; Consume()
// hands the pair out once and wipes the holder. Reusing a pair across two
// messages leaks the private share, so a second read throws NonceReuseError.
class SigningNonces {
 public:
  // Both nonces are reduced mod q and must be nonzero.
  SigningNonces(const GroupContext& ctx, mpz_class hiding, mpz_class binding);
  ~SigningNonces();

  SigningNonces(const SigningNonces&) = delete;
  SigningNonces& operator=(const SigningNonces&) = delete;

  SigningNonces(SigningNonces&& other) noexcept;
  SigningNonces& operator=(SigningNonces&& other) noexcept;

  bool consumed() const;

  NonceCommitment Commit(const GroupContext& ctx,
                         ParticipantId participant_id,
                         const mpz_class& public_share) const;

  std::pair<mpz_class, mpz_class> Consume();

 private:
  void Wipe() noexcept;

  mpz_class hiding_;
  mpz_class binding_;
  bool consumed_ = false;
};

}  // namespace tschnorr
