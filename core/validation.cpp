#include "core/validation.hpp"

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ledger {
namespace core {

namespace {

Violation makeViolation(const std::string& field, const std::string& rule,
                        const std::string& message) {
  return Violation{field, rule, message};
}

bool isBlank(const std::string& text) {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

void append(std::vector<Violation>& out, std::optional<Violation> violation) {
  if (violation) out.push_back(std::move(*violation));
}

}  // namespace

std::optional<Violation> accountIdIsPositive(AccountId account_id) {
  if (account_id > 0) return std::nullopt;
  return makeViolation("accountId", "accountIdIsPositive", "Account id must be a positive number");
}

std::optional<Violation> ownerIdIsPositive(OwnerId owner_id) {
  if (owner_id > 0) return std::nullopt;
  return makeViolation("ownerId", "ownerIdIsPositive", "Owner id must be a positive number");
}

std::optional<Violation> amountIsPositive(Money amount) {
  if (amount > 0) return std::nullopt;
  return makeViolation("amount", "amountIsPositive", "Amount must be greater than $0.00");
}

std::optional<Violation> amountAtLeastMinimum(Money amount, const FundingLimits& limits) {
  if (amount >= limits.min_amount) return std::nullopt;
  return makeViolation("amount", "amountAtLeastMinimum",
                       "Amount must be at least $" + formatAmount(limits.min_amount));
}

std::optional<Violation> amountAtMostMaximum(Money amount, const FundingLimits& limits) {
  if (amount <= limits.max_amount) return std::nullopt;
  return makeViolation("amount", "amountAtMostMaximum",
                       "Amount cannot exceed $" + formatAmount(limits.max_amount));
}

std::optional<Violation> fundingSourceTypeIsKnown(const FundingSource& source) {
  if (source.type == FundingSourceType::CARD || source.type == FundingSourceType::BANK) {
    return std::nullopt;
  }
  return makeViolation("fundingSource.type", "fundingSourceTypeIsKnown",
                       "Funding source must be a card or a bank account");
}

std::optional<Violation> fundingSourceAccountPresent(const FundingSource& source) {
  if (!isBlank(source.account_number)) return std::nullopt;
  return makeViolation("fundingSource.accountNumber", "fundingSourceAccountPresent",
                       "Funding source account number is required");
}

std::optional<Violation> routingNumberPresentForBank(const FundingSource& source) {
  if (source.type != FundingSourceType::BANK) return std::nullopt;
  if (source.routing_number && !isBlank(*source.routing_number)) return std::nullopt;
  return makeViolation("fundingSource.routingNumber", "routingNumberPresentForBank",
                       "Routing number is required for bank transfers");
}

std::vector<Violation> validateFundingRequest(const FundingRequest& request,
                                              const FundingLimits& limits) {
  std::vector<Violation> violations;
  append(violations, accountIdIsPositive(request.account_id));

  // Range checks only apply to a positive amount.
  if (auto positive = amountIsPositive(request.amount)) {
    violations.push_back(std::move(*positive));
  } else {
    append(violations, amountAtLeastMinimum(request.amount, limits));
    append(violations, amountAtMostMaximum(request.amount, limits));
  }

  append(violations, fundingSourceTypeIsKnown(request.source));
  append(violations, fundingSourceAccountPresent(request.source));
  append(violations, routingNumberPresentForBank(request.source));
  return violations;
}

std::vector<Violation> validateAmountText(const std::string& text) {
  std::vector<Violation> violations;

  if (text.empty() || isBlank(text)) {
    violations.push_back(makeViolation("amount", "amountRequired", "Amount is required"));
    return violations;
  }

  if (text.size() >= 2 && text[0] == '0' && text[1] == '0') {
    violations.push_back(makeViolation("amount", "amountNoLeadingZeros",
                                       "Amount cannot have leading zeros"));
    return violations;
  }

  // (0|[1-9][0-9]*)(\.[0-9]{1,2})?
  size_t pos = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
  size_t whole_digits = pos;
  bool well_formed = whole_digits > 0 && !(whole_digits > 1 && text[0] == '0');
  size_t fraction_digits = 0;
  if (well_formed && pos < text.size()) {
    if (text[pos] != '.') {
      well_formed = false;
    } else {
      ++pos;
      while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
        ++fraction_digits;
      }
      well_formed = pos == text.size() && fraction_digits >= 1 && fraction_digits <= 2;
    }
  }
  if (!well_formed) {
    violations.push_back(makeViolation("amount", "amountFormat", "Invalid amount format"));
    return violations;
  }

  Money whole = 0;
  const Money limit = std::numeric_limits<Money>::max() / 100;
  for (size_t i = 0; i < whole_digits; ++i) {
    whole = whole * 10 + (text[i] - '0');
    if (whole >= limit) {
      violations.push_back(makeViolation("amount", "amountInRange", "Amount is too large"));
      return violations;
    }
  }

  Money fraction = 0;
  for (size_t i = 0; i < fraction_digits; ++i) {
    fraction = fraction * 10 + (text[whole_digits + 1 + i] - '0');
  }
  if (fraction_digits == 1) fraction *= 10;

  if (whole == 0 && fraction == 0) {
    violations.push_back(makeViolation("amount", "amountIsPositive",
                                       "Amount must be greater than $0.00"));
  }
  return violations;
}

std::optional<Money> parseAmount(const std::string& text) {
  if (!validateAmountText(text).empty()) return std::nullopt;

  size_t dot = text.find('.');
  std::string whole_text = text.substr(0, dot);
  std::string fraction_text = dot == std::string::npos ? "" : text.substr(dot + 1);
  while (fraction_text.size() < 2) fraction_text.push_back('0');

  Money whole = std::stoll(whole_text);
  Money fraction = std::stoll(fraction_text);
  return whole * 100 + fraction;
}

std::string formatAmount(Money amount) {
  std::stringstream ss;
  if (amount < 0) {
    ss << "-";
    // Avoid overflow on the most negative value by working in unsigned space.
    auto magnitude = static_cast<unsigned long long>(-(amount + 1)) + 1;
    ss << magnitude / 100 << "." << std::setw(2) << std::setfill('0') << magnitude % 100;
    return ss.str();
  }
  ss << amount / 100 << "." << std::setw(2) << std::setfill('0') << amount % 100;
  return ss.str();
}

}  // namespace core
}  // namespace ledger
