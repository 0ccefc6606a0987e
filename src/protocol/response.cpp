#include "tschnorr/protocol/response.hpp"

#include <stdexcept>

#include "tschnorr/common/secure_zeroize.hpp"
#include "tschnorr/crypto/modular.hpp"
#include "tschnorr/protocol/binding.hpp"

namespace tschnorr {

mpz_class ComputeOwnResponse(const GroupContext& ctx,
                             const NonceCommitment& own_commitment,
                             const mpz_class& private_share,
                             SigningNonces& nonces,
                             const mpz_class& lagrange_coefficient,
                             const mpz_class& challenge,
                             std::string_view message) {
  auto [hiding, binding] = nonces.Consume();

  if (ctx.GeneratorPow(hiding) != own_commitment.d ||
      ctx.GeneratorPow(binding) != own_commitment.e) {
    SecureZeroize(&hiding);
    SecureZeroize(&binding);
    throw std::invalid_argument("signing nonces do not match the published commitment");
  }

  const mpz_class& q = ctx.q();
  const mpz_class binding_value = ComputeBindingValue(ctx, own_commitment, message);
  mpz_class weighted_share = modular::Mul(lagrange_coefficient, private_share, q);
  mpz_class key_term = modular::Mul(weighted_share, challenge, q);
  mpz_class nonce_term = modular::Mul(binding, binding_value, q);
  mpz_class blinding = modular::Add(nonce_term, key_term, q);
  const mpz_class response = modular::Add(hiding, blinding, q);

  SecureZeroize(&hiding);
  SecureZeroize(&binding);
  SecureZeroize(&weighted_share);
  SecureZeroize(&key_term);
  SecureZeroize(&nonce_term);
  SecureZeroize(&blinding);
  return response;
}

}  // namespace tschnorr
