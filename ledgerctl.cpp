#include "config/ledger_config.hpp"
#include "database/postgres_ledger_store.hpp"
#include "ledger_service.hpp"
#include "observability/logger.hpp"
#include "storage/memory_ledger_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ledger;

namespace {

const int kExitOk = 0;
const int kExitFailure = 1;
const int kExitUsage = 2;

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void printUsage() {
  std::cerr << "Usage: ledgerctl [--config <file>] <command> [args]\n"
            << "Commands:\n"
            << "  init-schema\n"
            << "  open <owner_id> <checking|savings>\n"
            << "  accounts <owner_id>\n"
            << "  fund <owner_id> <account_id> <amount> <card|bank> <source_account> [routing]\n"
            << "  history <owner_id> <account_id>\n"
            << "  reconcile <owner_id> <account_id>\n"
            << "  status <account_id> <active|frozen|closed>\n";
}

std::int64_t parseId(const std::string& text, const char* what) {
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) {
      throw UsageError(std::string("invalid ") + what + ": " + text);
    }
    return value;
  } catch (const std::invalid_argument&) {
    throw UsageError(std::string("invalid ") + what + ": " + text);
  } catch (const std::out_of_range&) {
    throw UsageError(std::string(what) + " out of range: " + text);
  }
}

nlohmann::json toJson(const core::Account& account) {
  nlohmann::json j;
  j["id"] = account.id;
  j["account_number"] = account.account_number;
  j["owner_id"] = account.owner_id;
  j["type"] = core::toString(account.type);
  j["balance_cents"] = account.balance;
  j["balance"] = core::formatAmount(account.balance);
  j["status"] = core::toString(account.status);
  j["created_at_us"] = account.created_at;
  return j;
}

nlohmann::json toJson(const core::TransactionRecord& tx) {
  nlohmann::json j;
  j["id"] = tx.id;
  j["account_id"] = tx.account_id;
  j["type"] = core::toString(tx.type);
  j["amount_cents"] = tx.amount;
  j["amount"] = core::formatAmount(tx.amount);
  j["description"] = tx.description;
  j["status"] = core::toString(tx.status);
  j["created_at_us"] = tx.created_at;
  j["processed_at_us"] = tx.processed_at;
  return j;
}

nlohmann::json toJson(const core::Error& error) {
  nlohmann::json j;
  j["error"] = core::toString(error.code);
  j["message"] = error.message;
  if (!error.violations.empty()) {
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : error.violations) {
      violations.push_back({{"field", violation.field},
                            {"rule", violation.rule},
                            {"message", violation.message}});
    }
    j["violations"] = violations;
  }
  return j;
}

template <typename T, typename Render>
int emit(const core::Result<T>& result, Render render) {
  if (!result) {
    std::cout << toJson(result.error()).dump(2) << std::endl;
    return kExitFailure;
  }
  std::cout << render(result.value()).dump(2) << std::endl;
  return kExitOk;
}

void requireArgs(const std::vector<std::string>& args, size_t min, size_t max) {
  if (args.size() < min || args.size() > max) {
    throw UsageError("wrong number of arguments for " + args.front());
  }
}

int runCommand(LedgerService& service, const std::vector<std::string>& args) {
  const std::string& command = args.front();

  if (command == "open") {
    requireArgs(args, 3, 3);
    auto type = core::parseAccountType(args[2]);
    if (!type) throw UsageError("unknown account type: " + args[2]);
    return emit(service.openAccount(parseId(args[1], "owner id"), *type),
                [](const core::Account& a) { return toJson(a); });
  }

  if (command == "accounts") {
    requireArgs(args, 2, 2);
    return emit(service.listAccounts(parseId(args[1], "owner id")),
                [](const std::vector<core::Account>& accounts) {
                  nlohmann::json j = nlohmann::json::array();
                  for (const auto& account : accounts) j.push_back(toJson(account));
                  return j;
                });
  }

  if (command == "fund") {
    requireArgs(args, 6, 7);
    core::FundingRequest request;
    request.account_id = parseId(args[2], "account id");

    auto amount_violations = core::validateAmountText(args[3]);
    if (!amount_violations.empty()) {
      auto rejected = core::Error::validationFailed(std::move(amount_violations));
      std::cout << toJson(rejected).dump(2) << std::endl;
      return kExitFailure;
    }
    request.amount = *core::parseAmount(args[3]);

    auto source = core::parseFundingSourceType(args[4]);
    if (!source) throw UsageError("unknown funding source: " + args[4]);
    request.source.type = *source;
    request.source.account_number = args[5];
    if (args.size() == 7) request.source.routing_number = args[6];

    return emit(service.fund(parseId(args[1], "owner id"), request),
                [](const core::FundingResult& funded) {
                  nlohmann::json j;
                  j["transaction"] = toJson(funded.transaction);
                  j["new_balance_cents"] = funded.new_balance;
                  j["new_balance"] = core::formatAmount(funded.new_balance);
                  return j;
                });
  }

  if (command == "history") {
    requireArgs(args, 3, 3);
    return emit(service.listTransactions(parseId(args[1], "owner id"),
                                         parseId(args[2], "account id")),
                [](const std::vector<core::TransactionView>& rows) {
                  nlohmann::json j = nlohmann::json::array();
                  for (const auto& row : rows) {
                    auto entry = toJson(row.transaction);
                    entry["account_type"] = core::toString(row.account_type);
                    j.push_back(entry);
                  }
                  return j;
                });
  }

  if (command == "reconcile") {
    requireArgs(args, 3, 3);
    return emit(service.reconcile(parseId(args[1], "owner id"), parseId(args[2], "account id")),
                [](const core::Reconciliation& report) {
                  nlohmann::json j;
                  j["account_id"] = report.account_id;
                  j["balance_cents"] = report.balance;
                  j["completed_sum_cents"] = report.completed_sum;
                  j["transaction_count"] = report.transaction_count;
                  j["consistent"] = report.consistent;
                  return j;
                });
  }

  if (command == "status") {
    requireArgs(args, 3, 3);
    auto status = core::parseAccountStatus(args[2]);
    if (!status) throw UsageError("unknown account status: " + args[2]);
    return emit(service.setAccountStatus(parseId(args[1], "account id"), *status),
                [](const core::Account& a) { return toJson(a); });
  }

  throw UsageError("unknown command: " + command);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        printUsage();
        return kExitUsage;
      }
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      printUsage();
      return kExitOk;
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    printUsage();
    return kExitUsage;
  }

  config::LedgerConfig cfg;
  try {
    cfg = config_path.empty() ? config::parseConfig("{}") : config::loadConfig(config_path);
  } catch (const config::ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return kExitUsage;
  }

  auto& logger = observability::Logger::getInstance();
  logger.setLogLevel(cfg.log_level);

  std::shared_ptr<storage::LedgerStore> store;
  if (cfg.backend == config::Backend::MEMORY) {
    store = std::make_shared<storage::MemoryLedgerStore>(
        std::chrono::milliseconds(cfg.database.lock_timeout_ms));
  } else {
    database::PostgresLedgerStore::Config store_config;
    store_config.connection.host = cfg.database.host;
    store_config.connection.port = cfg.database.port;
    store_config.connection.database = cfg.database.database;
    store_config.connection.username = cfg.database.username;
    store_config.connection.password = cfg.database.password;
    store_config.connection.connection_timeout = cfg.database.connect_timeout;
    store_config.pool_size = static_cast<size_t>(cfg.database.pool_size);
    store_config.lock_timeout = std::chrono::milliseconds(cfg.database.lock_timeout_ms);

    auto pg_store = std::make_shared<database::PostgresLedgerStore>(store_config);
    if (!pg_store->open()) {
      std::cerr << "Could not connect to database " << cfg.database.database << " at "
                << cfg.database.host << ":" << cfg.database.port << std::endl;
      return kExitFailure;
    }

    if (args.front() == "init-schema") {
      bool ok = pg_store->initializeSchema(cfg.database.schema_path);
      pg_store->close();
      return ok ? kExitOk : kExitFailure;
    }
    store = pg_store;
  }

  if (args.front() == "init-schema") {
    LOG_INFO("Memory backend needs no schema", "ledgerctl");
    store->close();
    return kExitOk;
  }

  int exit_code = kExitFailure;
  try {
    LedgerService::Options options;
    options.limits = cfg.limits;
    options.account_number_max_attempts = cfg.account_number_max_attempts;
    LedgerService service(store, options);

    exit_code = runCommand(service, args);
  } catch (const UsageError& e) {
    std::cerr << e.what() << std::endl;
    printUsage();
    exit_code = kExitUsage;
  }

  store->close();
  return exit_code;
}
