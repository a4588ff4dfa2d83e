#include "core/account_number_generator.hpp"

#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace ledger {
namespace core {

IdentifierSpaceExhausted::IdentifierSpaceExhausted(int attempts)
    : std::runtime_error("No unused account number after " + std::to_string(attempts) +
                         " attempts") {}

AccountNumberGenerator::AccountNumberGenerator(int max_attempts)
    : AccountNumberGenerator(&secureRandomUint32, max_attempts) {}

AccountNumberGenerator::AccountNumberGenerator(RandomSource source, int max_attempts)
    : source_(std::move(source)), max_attempts_(max_attempts > 0 ? max_attempts : 1) {}

std::string AccountNumberGenerator::generate(const ExistsPredicate& exists) const {
  for (int attempt = 0; attempt < max_attempts_; ++attempt) {
    std::string candidate = format(source_());
    if (!exists(candidate)) {
      return candidate;
    }
  }
  throw IdentifierSpaceExhausted(max_attempts_);
}

std::string AccountNumberGenerator::format(std::uint32_t draw) {
  std::stringstream ss;
  ss << std::setw(kWidth) << std::setfill('0') << (draw % kModulus);
  return ss.str();
}

std::uint32_t secureRandomUint32() {
  std::array<unsigned char, 4> bytes{};

  // RAND_bytes is thread-safe on OpenSSL 1.1.0 and later.
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("CSPRNG: insufficient entropy");
  }

  return (static_cast<std::uint32_t>(bytes[0]) << 24) |
         (static_cast<std::uint32_t>(bytes[1]) << 16) |
         (static_cast<std::uint32_t>(bytes[2]) << 8) |
         static_cast<std::uint32_t>(bytes[3]);
}

}  // namespace core
}  // namespace ledger
