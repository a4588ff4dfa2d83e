#include "core/account_number_generator.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <vector>

using namespace ledger::core;

namespace {

// Replays a fixed list of draws and counts how many were taken.
struct ScriptedSource {
  std::vector<std::uint32_t> draws;
  size_t next = 0;

  AccountNumberGenerator::RandomSource bind() {
    return [this]() { return draws.at(next++ % draws.size()); };
  }
};

bool isTenDigits(const std::string& number) {
  if (number.size() != 10) return false;
  for (char c : number) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

TEST(AccountNumberGeneratorTest, FormatsDrawModuloBillionWithPadding) {
  EXPECT_EQ(AccountNumberGenerator::format(0), "0000000000");
  EXPECT_EQ(AccountNumberGenerator::format(123), "0000000123");
  EXPECT_EQ(AccountNumberGenerator::format(1000000000u), "0000000000");
  EXPECT_EQ(AccountNumberGenerator::format(4294967295u), "0294967295");
}

TEST(AccountNumberGeneratorTest, RedrawsOnCollision) {
  ScriptedSource source{{5, 5, 7}};
  AccountNumberGenerator generator(source.bind(), 10);

  std::set<std::string> taken{AccountNumberGenerator::format(5)};
  auto number = generator.generate([&taken](const std::string& n) { return taken.count(n) > 0; });

  EXPECT_EQ(number, "0000000007");
  EXPECT_EQ(source.next, 3u);
}

TEST(AccountNumberGeneratorTest, ThrowsWhenAttemptsRunOut) {
  ScriptedSource source{{9}};
  AccountNumberGenerator generator(source.bind(), 4);

  EXPECT_THROW(generator.generate([](const std::string&) { return true; }),
               IdentifierSpaceExhausted);
  EXPECT_EQ(source.next, 4u);
}

TEST(AccountNumberGeneratorTest, NonPositiveAttemptBudgetStillDrawsOnce) {
  ScriptedSource source{{1}};
  AccountNumberGenerator generator(source.bind(), 0);
  EXPECT_EQ(generator.maxAttempts(), 1);
  EXPECT_EQ(generator.generate([](const std::string&) { return false; }), "0000000001");
}

TEST(AccountNumberGeneratorTest, SecureSourceProducesWellFormedNumbers) {
  AccountNumberGenerator generator;
  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i) {
    auto number = generator.generate([&seen](const std::string& n) { return seen.count(n) > 0; });
    EXPECT_TRUE(isTenDigits(number)) << number;
    EXPECT_EQ(number[0], '0');
    seen.insert(number);
  }
  EXPECT_EQ(seen.size(), 200u);
}
