#ifndef CORE_TYPES_HPP_
#define CORE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace ledger {
namespace core {

/**
 * Currency amount in minor units (cents). Never floating point inside the ledger.
 */
using Money = std::int64_t;

using AccountId = std::int64_t;
using OwnerId = std::int64_t;
using TransactionId = std::int64_t;

/**
 * Microseconds since the Unix epoch, as assigned by the store.
 */
using Timestamp = std::int64_t;

enum class AccountType {
  CHECKING,
  SAVINGS
};

enum class AccountStatus {
  ACTIVE,
  FROZEN,
  CLOSED
};

enum class TransactionType {
  DEPOSIT
};

enum class TransactionStatus {
  COMPLETED
};

enum class FundingSourceType {
  CARD,
  BANK
};

/**
 * One row of the accounts table.
 */
struct Account {
  AccountId id = 0;
  std::string account_number;
  OwnerId owner_id = 0;
  AccountType type = AccountType::CHECKING;
  Money balance = 0;
  AccountStatus status = AccountStatus::ACTIVE;
  Timestamp created_at = 0;
};

/**
 * One row of the transactions table. Immutable once written.
 */
struct TransactionRecord {
  TransactionId id = 0;
  AccountId account_id = 0;
  TransactionType type = TransactionType::DEPOSIT;
  Money amount = 0;
  std::string description;
  TransactionStatus status = TransactionStatus::COMPLETED;
  Timestamp created_at = 0;
  Timestamp processed_at = 0;
};

/**
 * External source of funds. Format checks on the numbers happen upstream.
 */
struct FundingSource {
  FundingSourceType type = FundingSourceType::CARD;
  std::string account_number;
  std::optional<std::string> routing_number;
};

struct FundingRequest {
  AccountId account_id = 0;
  Money amount = 0;
  FundingSource source;
};

/**
 * Outcome of a successful fund call, read back from the store after the write.
 */
struct FundingResult {
  TransactionRecord transaction;
  Money new_balance = 0;
};

/**
 * Transaction enriched with the owning account's type for history views.
 */
struct TransactionView {
  TransactionRecord transaction;
  AccountType account_type = AccountType::CHECKING;
};

struct Reconciliation {
  AccountId account_id = 0;
  Money balance = 0;
  Money completed_sum = 0;
  std::int64_t transaction_count = 0;
  bool consistent = false;
};

std::string toString(AccountType type);
std::string toString(AccountStatus status);
std::string toString(TransactionType type);
std::string toString(TransactionStatus status);
std::string toString(FundingSourceType type);

std::optional<AccountType> parseAccountType(const std::string& text);
std::optional<AccountStatus> parseAccountStatus(const std::string& text);
std::optional<TransactionType> parseTransactionType(const std::string& text);
std::optional<TransactionStatus> parseTransactionStatus(const std::string& text);
std::optional<FundingSourceType> parseFundingSourceType(const std::string& text);

}  // namespace core
}  // namespace ledger

#endif  // CORE_TYPES_HPP_
