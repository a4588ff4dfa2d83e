#ifndef CORE_VALIDATION_HPP_
#define CORE_VALIDATION_HPP_

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace core {

/**
 * A single failed check: which field, which named rule, and a message that
 * can be shown to the caller.
 */
struct Violation {
  std::string field;
  std::string rule;
  std::string message;

  bool operator==(const Violation& other) const {
    return field == other.field && rule == other.rule;
  }
};

/**
 * Inclusive bounds on a single funding amount.
 */
struct FundingLimits {
  Money min_amount = 1;          // $0.01
  Money max_amount = 1000000;    // $10,000.00
};

// Named predicates. Each returns a violation when the rule does not hold.
std::optional<Violation> accountIdIsPositive(AccountId account_id);
std::optional<Violation> ownerIdIsPositive(OwnerId owner_id);
std::optional<Violation> amountIsPositive(Money amount);
std::optional<Violation> amountAtLeastMinimum(Money amount, const FundingLimits& limits);
std::optional<Violation> amountAtMostMaximum(Money amount, const FundingLimits& limits);
std::optional<Violation> fundingSourceTypeIsKnown(const FundingSource& source);
std::optional<Violation> fundingSourceAccountPresent(const FundingSource& source);
std::optional<Violation> routingNumberPresentForBank(const FundingSource& source);

/**
 * Runs every funding predicate and collects all violations, in rule order.
 */
std::vector<Violation> validateFundingRequest(const FundingRequest& request,
                                              const FundingLimits& limits);

/**
 * Checks decimal amount text such as "100.50". Rejects empty input, signs,
 * exponents, whitespace, multiple leading zeros, more than two fraction
 * digits, values that overflow Money, and zero.
 */
std::vector<Violation> validateAmountText(const std::string& text);

/**
 * Parses amount text into minor units. Returns nullopt whenever
 * validateAmountText reports a violation.
 */
std::optional<Money> parseAmount(const std::string& text);

/**
 * Formats minor units as "1234.05" (negative values keep a leading '-').
 */
std::string formatAmount(Money amount);

}  // namespace core
}  // namespace ledger

#endif  // CORE_VALIDATION_HPP_
