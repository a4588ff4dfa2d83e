#include "config/ledger_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ledger {
namespace config {

namespace {

template <typename T>
void read(const nlohmann::json& object, const char* key, T& target, const std::string& path) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return;
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("invalid value for " + path + key + ": " + e.what());
  }
}

const nlohmann::json* section(const nlohmann::json& root, const char* key) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) return nullptr;
  if (!it->is_object()) {
    throw ConfigError(std::string("section ") + key + " must be an object");
  }
  return &*it;
}

void requirePositive(int value, const char* name) {
  if (value <= 0) {
    throw ConfigError(std::string(name) + " must be positive");
  }
}

}  // namespace

LedgerConfig parseConfig(const std::string& json_text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("malformed config: ") + e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("config root must be an object");
  }

  LedgerConfig config;

  std::string backend = "postgres";
  read(root, "backend", backend, "");
  if (backend == "postgres") {
    config.backend = Backend::POSTGRES;
  } else if (backend == "memory") {
    config.backend = Backend::MEMORY;
  } else {
    throw ConfigError("unknown backend: " + backend);
  }

  if (const auto* db = section(root, "database")) {
    DatabaseConfig& out = config.database;
    read(*db, "host", out.host, "database.");
    read(*db, "port", out.port, "database.");
    read(*db, "database", out.database, "database.");
    read(*db, "username", out.username, "database.");
    read(*db, "password", out.password, "database.");
    read(*db, "connect_timeout", out.connect_timeout, "database.");
    read(*db, "pool_size", out.pool_size, "database.");
    read(*db, "lock_timeout_ms", out.lock_timeout_ms, "database.");
    read(*db, "schema_path", out.schema_path, "database.");
  }
  requirePositive(config.database.port, "database.port");
  requirePositive(config.database.pool_size, "database.pool_size");
  requirePositive(config.database.lock_timeout_ms, "database.lock_timeout_ms");

  if (const auto* limits = section(root, "limits")) {
    read(*limits, "min_amount_cents", config.limits.min_amount, "limits.");
    read(*limits, "max_amount_cents", config.limits.max_amount, "limits.");
  }
  if (config.limits.min_amount <= 0 || config.limits.max_amount < config.limits.min_amount) {
    throw ConfigError("limits must satisfy 0 < min_amount_cents <= max_amount_cents");
  }

  read(root, "account_number_max_attempts", config.account_number_max_attempts, "");
  requirePositive(config.account_number_max_attempts, "account_number_max_attempts");

  std::string level;
  read(root, "log_level", level, "");
  if (!level.empty()) {
    auto parsed = observability::parseLogLevel(level);
    if (!parsed) {
      throw ConfigError("unknown log_level: " + level);
    }
    config.log_level = *parsed;
  }

  if (const char* password = std::getenv("LEDGER_DB_PASSWORD")) {
    config.database.password = password;
  }
  return config;
}

LedgerConfig loadConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("could not open config file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parseConfig(buffer.str());
}

}  // namespace config
}  // namespace ledger
