#include "tschnorr/crypto/group_context.hpp"

#include <stdexcept>
#include <utility>

#include "tschnorr/common/logging.hpp"
#include "tschnorr/crypto/modular.hpp"

namespace tschnorr {
namespace {

constexpr int kPrimalityRounds = 40;

bool IsProbablePrime(const mpz_class& value) {
  return value > 1 && mpz_probab_prime_p(value.get_mpz_t(), kPrimalityRounds) != 0;
}

// Decimal, or hex behind an explicit 0x/0X. A leading 0 stays decimal.
mpz_class ParseParameter(const std::string& text, const char* field_name) {
  int base = 10;
  std::string digits = text;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    base = 16;
    digits.erase(0, 2);
  }

  mpz_class out;
  if (digits.empty() || digits[0] == '-' || digits[0] == '+' ||
      out.set_str(digits, base) != 0) {
    throw std::invalid_argument(std::string(field_name) + " is not a valid integer");
  }
  return out;
}

}  // namespace

GroupContext::GroupContext(mpz_class modulus_p, mpz_class order_q, mpz_class generator)
    : p_(std::move(modulus_p)), q_(std::move(order_q)), g_(std::move(generator)) {
  if (!IsProbablePrime(p_)) {
    throw std::invalid_argument("group modulus p must be prime");
  }
  if (!IsProbablePrime(q_)) {
    throw std::invalid_argument("group order q must be prime");
  }
  if ((p_ - 1) % q_ != 0) {
    throw std::invalid_argument("group order q must divide p - 1");
  }
  if (g_ <= 1 || g_ >= p_) {
    throw std::invalid_argument("generator must be in (1, p)");
  }
  if (modular::Pow(g_, q_, p_) != 1) {
    throw std::invalid_argument("generator does not have order q");
  }

  TSCHNORR_LOG_DEBUG("group context ready: |p|=" << mpz_sizeinbase(p_.get_mpz_t(), 2)
                                                 << " bits, |q|="
                                                 << mpz_sizeinbase(q_.get_mpz_t(), 2) << " bits");
}

GroupContext GroupContext::FromConfig(const GroupContextConfig& config) {
  return GroupContext(ParseParameter(config.modulus_p, "modulus_p"),
                      ParseParameter(config.order_q, "order_q"),
                      ParseParameter(config.generator, "generator"));
}

const mpz_class& GroupContext::p() const {
  return p_;
}

const mpz_class& GroupContext::q() const {
  return q_;
}

const mpz_class& GroupContext::g() const {
  return g_;
}

bool GroupContext::IsGroupElement(const mpz_class& value) const {
  if (value < 1 || value >= p_) {
    return false;
  }
  return modular::Pow(value, q_, p_) == 1;
}

mpz_class GroupContext::GeneratorPow(const mpz_class& exponent) const {
  return modular::Pow(g_, exponent, p_);
}

}  // namespace tschnorr
