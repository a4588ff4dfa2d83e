#ifndef CORE_ACCOUNT_NUMBER_GENERATOR_HPP_
#define CORE_ACCOUNT_NUMBER_GENERATOR_HPP_

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace ledger {
namespace core {

/**
 * Raised when no unused account number was found within the attempt budget.
 */
class IdentifierSpaceExhausted : public std::runtime_error {
 public:
  explicit IdentifierSpaceExhausted(int attempts);
};

/**
 * Produces 10-digit external account numbers from a cryptographically strong
 * source, checking each candidate against existing accounts before returning it.
 *
 * A candidate is a 32-bit strong-random draw reduced modulo 10^9 and zero
 * padded to 10 digits. Collisions trigger a fresh draw, up to max_attempts.
 */
class AccountNumberGenerator {
 public:
  using RandomSource = std::function<std::uint32_t()>;
  using ExistsPredicate = std::function<bool(const std::string&)>;

  static constexpr int kDefaultMaxAttempts = 32;
  static constexpr std::uint32_t kModulus = 1000000000u;
  static constexpr size_t kWidth = 10;

  /**
   * Uses OpenSSL RAND_bytes as the random source.
   */
  explicit AccountNumberGenerator(int max_attempts = kDefaultMaxAttempts);

  AccountNumberGenerator(RandomSource source, int max_attempts);

  /**
   * Returns a number for which `exists` is false. Throws IdentifierSpaceExhausted
   * after max_attempts collisions, or std::runtime_error if the CSPRNG fails.
   */
  std::string generate(const ExistsPredicate& exists) const;

  /**
   * Formats one draw: value % 10^9, zero padded to 10 digits.
   */
  static std::string format(std::uint32_t draw);

  int maxAttempts() const { return max_attempts_; }

 private:
  RandomSource source_;
  int max_attempts_;
};

/**
 * Four bytes from OpenSSL RAND_bytes, read big-endian.
 */
std::uint32_t secureRandomUint32();

}  // namespace core
}  // namespace ledger

#endif  // CORE_ACCOUNT_NUMBER_GENERATOR_HPP_
