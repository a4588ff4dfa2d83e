#include "database/postgres_ledger_store.hpp"
#include "ledger_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace ledger;

// Runs against a live server named by LEDGER_TEST_PG_CONNINFO, e.g.
//   LEDGER_TEST_PG_CONNINFO="host=localhost dbname=ledger_test user=ledger_user"
class PostgresLedgerStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* conninfo = std::getenv("LEDGER_TEST_PG_CONNINFO");
    if (conninfo == nullptr || *conninfo == '\0') {
      GTEST_SKIP() << "LEDGER_TEST_PG_CONNINFO not set";
    }

    config_.connection.conninfo = conninfo;
    config_.pool_size = 8;
    config_.lock_timeout = std::chrono::milliseconds(5000);

    store_ = std::make_shared<database::PostgresLedgerStore>(config_);
    ASSERT_TRUE(store_->open());
    ASSERT_TRUE(store_->initializeSchema(LEDGER_SCHEMA_PATH));

    database::PostgresConnection admin(config_.connection);
    ASSERT_TRUE(admin.connect());
    ASSERT_TRUE(admin.executeQuery("TRUNCATE transactions, accounts RESTART IDENTITY CASCADE"));
    admin.disconnect();

    service_ = std::make_unique<LedgerService>(store_, LedgerService::Options{},
                                               core::AccountNumberGenerator(), metrics_);
  }

  void TearDown() override {
    service_.reset();
    if (store_) store_->close();
  }

  static core::FundingRequest request(core::AccountId account_id, core::Money amount) {
    core::FundingRequest req;
    req.account_id = account_id;
    req.amount = amount;
    req.source.type = core::FundingSourceType::CARD;
    req.source.account_number = "4111111111111111";
    return req;
  }

  database::PostgresLedgerStore::Config config_;
  observability::MetricsCollector metrics_;
  std::shared_ptr<database::PostgresLedgerStore> store_;
  std::unique_ptr<LedgerService> service_;
};

TEST_F(PostgresLedgerStoreTest, OpenFundAndList) {
  auto account = service_->openAccount(1, core::AccountType::CHECKING);
  ASSERT_TRUE(account.ok()) << account.error().message;
  EXPECT_EQ(account->balance, 0);
  EXPECT_EQ(account->account_number.size(), 10u);

  auto funded = service_->fund(1, request(account->id, 10000));
  ASSERT_TRUE(funded.ok()) << funded.error().message;
  EXPECT_EQ(funded->new_balance, 10000);
  EXPECT_EQ(funded->transaction.description, "Funding from card");

  auto history = service_->listTransactions(1, account->id);
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history->size(), 1u);
  EXPECT_EQ(history->front().transaction.id, funded->transaction.id);
  EXPECT_EQ(history->front().account_type, core::AccountType::CHECKING);
}

TEST_F(PostgresLedgerStoreTest, DuplicateTypeConflicts) {
  ASSERT_TRUE(service_->openAccount(1, core::AccountType::SAVINGS).ok());
  auto again = service_->openAccount(1, core::AccountType::SAVINGS);
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error().code, core::ErrorCode::CONFLICT);
}

TEST_F(PostgresLedgerStoreTest, ConcurrentFundingLosesNothing) {
  auto account = service_->openAccount(1, core::AccountType::CHECKING);
  ASSERT_TRUE(account.ok());

  const int k = 50;
  std::atomic<int> succeeded{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < k; ++i) {
    threads.emplace_back([this, &succeeded, id = account->id]() {
      if (service_->fund(1, request(id, 100)).ok()) succeeded.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(succeeded.load(), k);
  auto report = service_->reconcile(1, account->id);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report->balance, k * 100);
  EXPECT_EQ(report->transaction_count, k);
  EXPECT_TRUE(report->consistent);
}

TEST_F(PostgresLedgerStoreTest, UncommittedWorkIsRolledBack) {
  auto account = service_->openAccount(1, core::AccountType::CHECKING);
  ASSERT_TRUE(account.ok());
  {
    auto uow = store_->begin(storage::AccessMode::READ_WRITE);
    storage::NewTransaction tx;
    tx.account_id = account->id;
    tx.amount = 700;
    tx.description = "Funding from card";
    uow->transactions().append(tx);
    EXPECT_EQ(uow->accounts().adjustBalance(account->id, 700), core::Money{700});
  }

  auto report = service_->reconcile(1, account->id);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report->balance, 0);
  EXPECT_EQ(report->transaction_count, 0);
}

TEST_F(PostgresLedgerStoreTest, ForeignOwnerSeesNotFound) {
  auto account = service_->openAccount(1, core::AccountType::CHECKING);
  ASSERT_TRUE(account.ok());

  auto result = service_->fund(2, request(account->id, 100));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, core::ErrorCode::NOT_FOUND);
}

TEST_F(PostgresLedgerStoreTest, PoolWaitTimesOut) {
  database::ConnectionPool pool(config_.connection, 1, std::chrono::milliseconds(100), metrics_);
  ASSERT_TRUE(pool.open());

  auto held = pool.acquire();
  EXPECT_EQ(pool.inUse(), 1u);
  EXPECT_THROW(pool.acquire(), storage::StorageError);
  pool.close();
}
