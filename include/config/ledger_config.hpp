#ifndef CONFIG_LEDGER_CONFIG_HPP_
#define CONFIG_LEDGER_CONFIG_HPP_

#include "core/validation.hpp"
#include "observability/logger.hpp"

#include <stdexcept>
#include <string>

namespace ledger {
namespace config {

/**
 * Raised for unreadable files, malformed JSON, wrongly typed keys and
 * out-of-range values.
 */
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct DatabaseConfig {
  std::string host = "localhost";
  int port = 5432;
  std::string database = "ledger";
  std::string username = "ledger_user";
  std::string password;
  int connect_timeout = 30;  // seconds
  int pool_size = 10;
  int lock_timeout_ms = 5000;
  std::string schema_path = "database/schema.sql";
};

enum class Backend {
  POSTGRES,
  MEMORY
};

struct LedgerConfig {
  Backend backend = Backend::POSTGRES;
  DatabaseConfig database;
  core::FundingLimits limits;
  int account_number_max_attempts = 32;
  observability::LogLevel log_level = observability::LogLevel::INFO;
};

/**
 * Builds a config from JSON text. Every key is optional; missing keys keep
 * their defaults. LEDGER_DB_PASSWORD, when set, replaces database.password.
 *
 * Example:
 *   {
 *     "backend": "postgres",
 *     "database": { "host": "db", "pool_size": 20 },
 *     "limits": { "min_amount_cents": 1, "max_amount_cents": 1000000 },
 *     "log_level": "debug"
 *   }
 */
LedgerConfig parseConfig(const std::string& json_text);

LedgerConfig loadConfig(const std::string& path);

}  // namespace config
}  // namespace ledger

#endif  // CONFIG_LEDGER_CONFIG_HPP_
