#include "tschnorr/protocol/lagrange.hpp"

#include <stdexcept>
#include <unordered_set>

#include "tschnorr/crypto/modular.hpp"

namespace tschnorr {
namespace {

mpz_class LagrangeTerm(const GroupContext& ctx, ParticipantId x_j, ParticipantId x_i) {
  const mpz_class j(x_j);
  return modular::Div(j, modular::Sub(j, mpz_class(x_i), ctx.q()), ctx.q());
}

}  // namespace

mpz_class LagrangeCoefficient(const GroupContext& ctx,
                              ParticipantId participant_id,
                              uint32_t number_of_participants) {
  if (participant_id == 0) {
    throw std::invalid_argument("participant id must be non-zero");
  }

  mpz_class lambda = 1;
  // 64-bit counter so n == UINT32_MAX terminates.
  for (uint64_t j = 1; j <= number_of_participants; ++j) {
    if (j == participant_id) {
      continue;
    }
    lambda = modular::Mul(
        lambda, LagrangeTerm(ctx, static_cast<ParticipantId>(j), participant_id), ctx.q());
  }
  return lambda;
}

mpz_class LagrangeCoefficientForSigners(const GroupContext& ctx,
                                        ParticipantId participant_id,
                                        std::span<const ParticipantId> signer_ids) {
  std::unordered_set<ParticipantId> dedup;
  bool self_present = false;
  for (ParticipantId id : signer_ids) {
    if (id == 0) {
      throw std::invalid_argument("signer ids must not contain 0");
    }
    if (!dedup.insert(id).second) {
      throw std::invalid_argument("signer ids must be unique");
    }
    if (id == participant_id) {
      self_present = true;
    }
  }
  if (!self_present) {
    throw std::invalid_argument("participant id must be in the signer set");
  }

  mpz_class lambda = 1;
  for (ParticipantId j : signer_ids) {
    if (j == participant_id) {
      continue;
    }
    lambda = modular::Mul(lambda, LagrangeTerm(ctx, j, participant_id), ctx.q());
  }
  return lambda;
}

}  // namespace tschnorr
