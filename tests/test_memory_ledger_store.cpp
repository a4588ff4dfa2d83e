#include "storage/memory_ledger_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>

using namespace ledger;
using namespace ledger::storage;

// Test fixture for the in-process storage engine
class MemoryLedgerStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_value_ = 1000;
    store_ = std::make_unique<MemoryLedgerStore>(
        std::chrono::milliseconds(200), [this]() { return clock_value_.load(); });
  }

  core::AccountId insertAccount(core::OwnerId owner, const std::string& number,
                                core::AccountType type = core::AccountType::CHECKING) {
    auto uow = store_->begin(AccessMode::READ_WRITE);
    auto id = uow->accounts().insert(NewAccount{number, owner, type});
    uow->commit();
    return id;
  }

  NewTransaction deposit(core::AccountId account_id, core::Money amount) {
    NewTransaction tx;
    tx.account_id = account_id;
    tx.amount = amount;
    tx.description = "Funding from card";
    return tx;
  }

  std::atomic<core::Timestamp> clock_value_;
  std::unique_ptr<MemoryLedgerStore> store_;
};

TEST_F(MemoryLedgerStoreTest, InsertedAccountStartsEmptyAndActive) {
  auto id = insertAccount(7, "0000000001");

  auto uow = store_->begin(AccessMode::READ_ONLY);
  auto account = uow->accounts().findById(id, LockMode::NONE);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->owner_id, 7);
  EXPECT_EQ(account->balance, 0);
  EXPECT_EQ(account->status, core::AccountStatus::ACTIVE);
  EXPECT_EQ(account->created_at, 1000);
  EXPECT_TRUE(uow->accounts().accountNumberExists("0000000001"));
  EXPECT_TRUE(uow->accounts().findByOwnerAndType(7, core::AccountType::CHECKING).has_value());
  EXPECT_FALSE(uow->accounts().findByOwnerAndType(7, core::AccountType::SAVINGS).has_value());
}

TEST_F(MemoryLedgerStoreTest, UncommittedWorkIsRolledBack) {
  core::AccountId abandoned = 0;
  {
    auto uow = store_->begin(AccessMode::READ_WRITE);
    abandoned = uow->accounts().insert(NewAccount{"0000000001", 7, core::AccountType::CHECKING});
  }

  auto uow = store_->begin(AccessMode::READ_WRITE);
  EXPECT_FALSE(uow->accounts().findById(abandoned, LockMode::NONE).has_value());
  EXPECT_FALSE(uow->accounts().accountNumberExists("0000000001"));

  // Sequences are not rewound.
  auto next = uow->accounts().insert(NewAccount{"0000000001", 7, core::AccountType::CHECKING});
  EXPECT_GT(next, abandoned);
}

TEST_F(MemoryLedgerStoreTest, RollbackRestoresBalanceAndLog) {
  auto id = insertAccount(7, "0000000001");
  {
    auto uow = store_->begin(AccessMode::READ_WRITE);
    uow->transactions().append(deposit(id, 500));
    EXPECT_EQ(uow->accounts().adjustBalance(id, 500), core::Money{500});
  }

  auto uow = store_->begin(AccessMode::READ_ONLY);
  EXPECT_EQ(uow->accounts().findById(id, LockMode::NONE)->balance, 0);
  EXPECT_TRUE(uow->transactions().listForAccount(id).empty());
}

TEST_F(MemoryLedgerStoreTest, DuplicateKeysAreNamed) {
  insertAccount(7, "0000000001");

  auto uow = store_->begin(AccessMode::READ_WRITE);
  try {
    uow->accounts().insert(NewAccount{"0000000001", 8, core::AccountType::CHECKING});
    FAIL() << "duplicate account number accepted";
  } catch (const DuplicateKeyError& e) {
    EXPECT_EQ(e.key(), DuplicateKeyError::Key::ACCOUNT_NUMBER);
  }

  try {
    uow->accounts().insert(NewAccount{"0000000002", 7, core::AccountType::CHECKING});
    FAIL() << "second checking account accepted";
  } catch (const DuplicateKeyError& e) {
    EXPECT_EQ(e.key(), DuplicateKeyError::Key::OWNER_AND_TYPE);
  }
}

TEST_F(MemoryLedgerStoreTest, AdjustBalanceIsRelative) {
  auto id = insertAccount(7, "0000000001");

  auto uow = store_->begin(AccessMode::READ_WRITE);
  EXPECT_EQ(uow->accounts().adjustBalance(id, 10000), core::Money{10000});
  EXPECT_EQ(uow->accounts().adjustBalance(id, 5000), core::Money{15000});
  EXPECT_FALSE(uow->accounts().adjustBalance(999, 1).has_value());

  EXPECT_TRUE(uow->accounts().setStatus(id, core::AccountStatus::FROZEN));
  EXPECT_FALSE(uow->accounts().adjustBalance(id, 1).has_value());
  EXPECT_EQ(uow->accounts().findById(id, LockMode::NONE)->balance, 15000);
}

TEST_F(MemoryLedgerStoreTest, AdjustBalanceRefusesOverflow) {
  auto id = insertAccount(7, "0000000001");

  auto uow = store_->begin(AccessMode::READ_WRITE);
  uow->accounts().adjustBalance(id, std::numeric_limits<core::Money>::max());
  EXPECT_THROW(uow->accounts().adjustBalance(id, 1), StorageError);
}

TEST_F(MemoryLedgerStoreTest, AppendRequiresExistingAccount) {
  auto uow = store_->begin(AccessMode::READ_WRITE);
  EXPECT_THROW(uow->transactions().append(deposit(42, 100)), StorageError);
}

TEST_F(MemoryLedgerStoreTest, ReadOnlyWorkRefusesWrites) {
  auto id = insertAccount(7, "0000000001");

  auto uow = store_->begin(AccessMode::READ_ONLY);
  EXPECT_THROW(uow->accounts().adjustBalance(id, 1), StorageError);
  EXPECT_THROW(uow->transactions().append(deposit(id, 1)), StorageError);
  EXPECT_THROW(uow->accounts().setStatus(id, core::AccountStatus::CLOSED), StorageError);
}

TEST_F(MemoryLedgerStoreTest, HistoryOrderedNewestFirstThenById) {
  auto id = insertAccount(7, "0000000001");

  auto uow = store_->begin(AccessMode::READ_WRITE);
  auto first = uow->transactions().append(deposit(id, 1));
  auto second = uow->transactions().append(deposit(id, 2));
  clock_value_ = 2000;
  auto third = uow->transactions().append(deposit(id, 3));
  clock_value_ = 1500;  // clock stepped backwards
  auto fourth = uow->transactions().append(deposit(id, 4));
  uow->commit();

  EXPECT_EQ(fourth.created_at, 2000);

  auto reader = store_->begin(AccessMode::READ_ONLY);
  auto rows = reader->transactions().listForAccount(id);
  ASSERT_EQ(rows.size(), 4u);
  EXPECT_EQ(rows[0].id, fourth.id);
  EXPECT_EQ(rows[1].id, third.id);
  EXPECT_EQ(rows[2].id, second.id);
  EXPECT_EQ(rows[3].id, first.id);

  auto summary = reader->transactions().summarize(id);
  EXPECT_EQ(summary.count, 4);
  EXPECT_EQ(summary.completed_sum, 10);
}

TEST_F(MemoryLedgerStoreTest, InjectedFaultsFireOnceAfterSkips) {
  auto id = insertAccount(7, "0000000001");
  store_->injectFault(FaultPoint::READ_ACCOUNT, 1, 1);

  auto uow = store_->begin(AccessMode::READ_ONLY);
  EXPECT_NO_THROW(uow->accounts().findById(id, LockMode::NONE));
  EXPECT_THROW(uow->accounts().findById(id, LockMode::NONE), StorageError);
  EXPECT_NO_THROW(uow->accounts().findById(id, LockMode::NONE));
}

TEST_F(MemoryLedgerStoreTest, FailedCommitAppliesNothing) {
  auto id = insertAccount(7, "0000000001");
  store_->injectFault(FaultPoint::COMMIT);
  {
    auto uow = store_->begin(AccessMode::READ_WRITE);
    uow->transactions().append(deposit(id, 100));
    uow->accounts().adjustBalance(id, 100);
    EXPECT_THROW(uow->commit(), StorageError);
  }

  auto uow = store_->begin(AccessMode::READ_ONLY);
  EXPECT_EQ(uow->accounts().findById(id, LockMode::NONE)->balance, 0);
  EXPECT_EQ(uow->transactions().summarize(id).count, 0);
}

TEST_F(MemoryLedgerStoreTest, WriterTimesOutBehindAnotherWriter) {
  auto holder = store_->begin(AccessMode::READ_WRITE);

  std::atomic<bool> timed_out{false};
  std::thread contender([this, &timed_out]() {
    try {
      auto uow = store_->begin(AccessMode::READ_WRITE);
    } catch (const StorageError&) {
      timed_out = true;
    }
  });
  contender.join();

  EXPECT_TRUE(timed_out.load());
  holder->commit();
  EXPECT_NO_THROW(store_->begin(AccessMode::READ_WRITE));
}

TEST_F(MemoryLedgerStoreTest, ClosedStoreRefusesWork) {
  store_->close();
  EXPECT_THROW(store_->begin(AccessMode::READ_ONLY), StorageError);
}
