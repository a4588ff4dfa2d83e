#include "core/types.hpp"

namespace ledger {
namespace core {

std::string toString(AccountType type) {
  switch (type) {
    case AccountType::CHECKING: return "checking";
    case AccountType::SAVINGS: return "savings";
  }
  return "unknown";
}

std::string toString(AccountStatus status) {
  switch (status) {
    case AccountStatus::ACTIVE: return "active";
    case AccountStatus::FROZEN: return "frozen";
    case AccountStatus::CLOSED: return "closed";
  }
  return "unknown";
}

std::string toString(TransactionType type) {
  switch (type) {
    case TransactionType::DEPOSIT: return "deposit";
  }
  return "unknown";
}

std::string toString(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::COMPLETED: return "completed";
  }
  return "unknown";
}

std::string toString(FundingSourceType type) {
  switch (type) {
    case FundingSourceType::CARD: return "card";
    case FundingSourceType::BANK: return "bank";
  }
  return "unknown";
}

std::optional<AccountType> parseAccountType(const std::string& text) {
  if (text == "checking") return AccountType::CHECKING;
  if (text == "savings") return AccountType::SAVINGS;
  return std::nullopt;
}

std::optional<AccountStatus> parseAccountStatus(const std::string& text) {
  if (text == "active") return AccountStatus::ACTIVE;
  if (text == "frozen") return AccountStatus::FROZEN;
  if (text == "closed") return AccountStatus::CLOSED;
  return std::nullopt;
}

std::optional<TransactionType> parseTransactionType(const std::string& text) {
  if (text == "deposit") return TransactionType::DEPOSIT;
  return std::nullopt;
}

std::optional<TransactionStatus> parseTransactionStatus(const std::string& text) {
  if (text == "completed") return TransactionStatus::COMPLETED;
  return std::nullopt;
}

std::optional<FundingSourceType> parseFundingSourceType(const std::string& text) {
  if (text == "card") return FundingSourceType::CARD;
  if (text == "bank") return FundingSourceType::BANK;
  return std::nullopt;
}

}  // namespace core
}  // namespace ledger
