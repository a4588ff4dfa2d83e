#include "config/ledger_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace ledger;
using namespace ledger::config;

// Test fixture that keeps LEDGER_DB_PASSWORD out of the way
class LedgerConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { unsetenv("LEDGER_DB_PASSWORD"); }
  void TearDown() override { unsetenv("LEDGER_DB_PASSWORD"); }
};

TEST_F(LedgerConfigTest, EmptyObjectKeepsDefaults) {
  auto config = parseConfig("{}");
  EXPECT_EQ(config.backend, Backend::POSTGRES);
  EXPECT_EQ(config.database.host, "localhost");
  EXPECT_EQ(config.database.port, 5432);
  EXPECT_EQ(config.database.pool_size, 10);
  EXPECT_EQ(config.limits.min_amount, 1);
  EXPECT_EQ(config.limits.max_amount, 1000000);
  EXPECT_EQ(config.account_number_max_attempts, 32);
  EXPECT_EQ(config.log_level, observability::LogLevel::INFO);
}

TEST_F(LedgerConfigTest, ReadsEverySection) {
  auto config = parseConfig(R"({
    "backend": "memory",
    "database": {
      "host": "db.internal",
      "port": 6543,
      "database": "ledger_prod",
      "username": "svc",
      "password": "secret",
      "connect_timeout": 5,
      "pool_size": 32,
      "lock_timeout_ms": 750,
      "schema_path": "/etc/ledger/schema.sql"
    },
    "limits": { "min_amount_cents": 100, "max_amount_cents": 500000 },
    "account_number_max_attempts": 8,
    "log_level": "debug"
  })");

  EXPECT_EQ(config.backend, Backend::MEMORY);
  EXPECT_EQ(config.database.host, "db.internal");
  EXPECT_EQ(config.database.port, 6543);
  EXPECT_EQ(config.database.database, "ledger_prod");
  EXPECT_EQ(config.database.username, "svc");
  EXPECT_EQ(config.database.password, "secret");
  EXPECT_EQ(config.database.connect_timeout, 5);
  EXPECT_EQ(config.database.pool_size, 32);
  EXPECT_EQ(config.database.lock_timeout_ms, 750);
  EXPECT_EQ(config.database.schema_path, "/etc/ledger/schema.sql");
  EXPECT_EQ(config.limits.min_amount, 100);
  EXPECT_EQ(config.limits.max_amount, 500000);
  EXPECT_EQ(config.account_number_max_attempts, 8);
  EXPECT_EQ(config.log_level, observability::LogLevel::DEBUG);
}

TEST_F(LedgerConfigTest, EnvironmentOverridesPassword) {
  setenv("LEDGER_DB_PASSWORD", "from-env", 1);
  auto config = parseConfig(R"({"database": {"password": "from-file"}})");
  EXPECT_EQ(config.database.password, "from-env");
}

TEST_F(LedgerConfigTest, RejectsBadInput) {
  EXPECT_THROW(parseConfig("{not json"), ConfigError);
  EXPECT_THROW(parseConfig("[]"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"backend": "sqlite"})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"database": {"port": "5432"}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"database": 7})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"database": {"pool_size": 0}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"limits": {"min_amount_cents": 0}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"limits": {"min_amount_cents": 500, "max_amount_cents": 100}})"),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"log_level": "loud"})"), ConfigError);
}

TEST_F(LedgerConfigTest, LoadsFromFile) {
  std::string path = ::testing::TempDir() + "ledger_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"backend": "memory", "log_level": "warn"})";
  }

  auto config = loadConfig(path);
  EXPECT_EQ(config.backend, Backend::MEMORY);
  EXPECT_EQ(config.log_level, observability::LogLevel::WARN);
  std::remove(path.c_str());

  EXPECT_THROW(loadConfig(path), ConfigError);
}
