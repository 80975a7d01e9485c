#include "in_memory_ledger_store.hpp"
#include "observability/metrics.hpp"
#include "test_helpers.hpp"
#include "transfer_engine.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using namespace ledger;
using ledger::test_support::FaultyLedgerStore;
using ledger::test_support::ManualClock;
using ledger::test_support::at;
using ledger::test_support::money;

// Test fixture for transfer engine tests
class TransferEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_unique<ManualClock>(at("2024-03-15 12:00:00"));
    faulty_ = std::make_unique<FaultyLedgerStore>(store_);
    engine_ = makeEngine(money("200000"));

    alice_ = open("ALICE-001", "500000.00");
    bob_ = open("BOB-001", "1000.00");
    carol_ = open("CAROL-001", "0");
  }

  std::unique_ptr<TransferEngine> makeEngine(const Money& limit) {
    ManualClock* clock = clock_.get();
    return std::make_unique<TransferEngine>(*faulty_, TransferLimits{limit},
                                            [clock] { return clock->now(); }, metrics_);
  }

  AccountId open(const std::string& number, const std::string& balance) {
    NewAccount request;
    request.account_number = number;
    request.initial_balance = money(balance);
    return store_.createAccount(request).account_id;
  }

  Money balanceOf(AccountId id) { return store_.findAccount(id)->balance; }

  void setStatus(AccountId id, AccountStatus status) {
    auto unit = store_.begin();
    Account account = *unit->getForUpdate(id);
    account.status = status;
    unit->save(account);
    unit->commit();
  }

  InMemoryLedgerStore store_;
  std::unique_ptr<FaultyLedgerStore> faulty_;
  std::unique_ptr<ManualClock> clock_;
  observability::MetricsCollector metrics_;
  std::unique_ptr<TransferEngine> engine_;
  AccountId alice_ = 0;
  AccountId bob_ = 0;
  AccountId carol_ = 0;
};

TEST_F(TransferEngineTest, SuccessfulTransferMovesFundsAndRecordsEntry) {
  TransferResult result = engine_->transfer(bob_, carol_, money("250.75"));

  ASSERT_TRUE(result.ok()) << result.message;
  ASSERT_TRUE(result.receipt.has_value());
  EXPECT_EQ(result.receipt->from_account_id, bob_);
  EXPECT_EQ(result.receipt->to_account_id, carol_);
  EXPECT_EQ(result.receipt->amount, money("250.75"));
  EXPECT_GT(result.receipt->transaction_id, 0);
  EXPECT_EQ(result.receipt->created_at, at("2024-03-15 12:00:00"));

  EXPECT_EQ(balanceOf(bob_), money("749.25"));
  EXPECT_EQ(balanceOf(carol_), money("250.75"));

  auto history = store_.transactionsFor(bob_);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].id, result.receipt->transaction_id);
  EXPECT_EQ(history[0].amount, money("250.75"));

  EXPECT_EQ(metrics_.counterValue(observability::kTransfersTotal), 1.0);
  EXPECT_EQ(metrics_.counterValue(observability::kTransferAmountCentsTotal), 25075.0);
  EXPECT_EQ(metrics_.histogramCount(observability::kTransferDurationSeconds), 1u);
}

TEST_F(TransferEngineTest, TransferInEitherDirectionUsesSameLockOrder) {
  ASSERT_TRUE(engine_->transfer(carol_, bob_, money("0.01")).status ==
              TransferStatus::INSUFFICIENT_FUNDS);
  ASSERT_TRUE(engine_->transfer(bob_, alice_, money("100")).ok());
  ASSERT_TRUE(engine_->transfer(alice_, bob_, money("50")).ok());
  EXPECT_EQ(balanceOf(bob_), money("950.00"));
  EXPECT_EQ(balanceOf(alice_), money("500050.00"));
}

TEST_F(TransferEngineTest, RejectsSameAccount) {
  TransferResult result = engine_->transfer(bob_, bob_, money("10"));
  EXPECT_EQ(result.status, TransferStatus::INVALID_REQUEST);
  EXPECT_EQ(result.message, "from_account and to_account must differ");
  EXPECT_EQ(balanceOf(bob_), money("1000.00"));
}

TEST_F(TransferEngineTest, RejectsNonPositiveAmount) {
  EXPECT_EQ(engine_->transfer(bob_, carol_, Money()).status, TransferStatus::INVALID_REQUEST);
  TransferResult negative = engine_->transfer(bob_, carol_, money("-5"));
  EXPECT_EQ(negative.status, TransferStatus::INVALID_REQUEST);
  EXPECT_EQ(negative.message, "amount must be greater than zero");
  EXPECT_TRUE(store_.transactionsFor(bob_).empty());
}

TEST_F(TransferEngineTest, RejectsUnknownAccounts) {
  TransferResult missing_source = engine_->transfer(999, bob_, money("1"));
  EXPECT_EQ(missing_source.status, TransferStatus::NOT_FOUND);
  EXPECT_EQ(missing_source.message, "source or destination account not found");

  EXPECT_EQ(engine_->transfer(bob_, 999, money("1")).status, TransferStatus::NOT_FOUND);
  EXPECT_EQ(balanceOf(bob_), money("1000.00"));

  // No lock may leak from the rejected attempts.
  EXPECT_TRUE(engine_->transfer(bob_, carol_, money("1")).ok());
}

TEST_F(TransferEngineTest, RejectsInactiveSource) {
  setStatus(bob_, AccountStatus::FROZEN);
  TransferResult result = engine_->transfer(bob_, carol_, money("10"));
  EXPECT_EQ(result.status, TransferStatus::ACCOUNT_INACTIVE);
  EXPECT_EQ(result.message, "source account status 'FROZEN' cannot transact");
  EXPECT_EQ(balanceOf(bob_), money("1000.00"));

  setStatus(bob_, AccountStatus::CLOSED);
  EXPECT_EQ(engine_->transfer(bob_, carol_, money("10")).status,
            TransferStatus::ACCOUNT_INACTIVE);
}

TEST_F(TransferEngineTest, RejectsInactiveDestination) {
  setStatus(carol_, AccountStatus::CLOSED);
  TransferResult result = engine_->transfer(bob_, carol_, money("10"));
  EXPECT_EQ(result.status, TransferStatus::ACCOUNT_CANNOT_RECEIVE);
  EXPECT_EQ(result.message, "destination account status 'CLOSED' cannot receive funds");
  EXPECT_EQ(balanceOf(bob_), money("1000.00"));
  EXPECT_EQ(balanceOf(carol_), money("0.00"));
}

TEST_F(TransferEngineTest, RejectsInsufficientFunds) {
  TransferResult result = engine_->transfer(bob_, carol_, money("1000.01"));
  EXPECT_EQ(result.status, TransferStatus::INSUFFICIENT_FUNDS);
  EXPECT_EQ(result.message, "insufficient funds");

  // Spending the whole balance is allowed.
  EXPECT_TRUE(engine_->transfer(bob_, carol_, money("1000.00")).ok());
  EXPECT_EQ(balanceOf(bob_), money("0.00"));
  EXPECT_EQ(metrics_.counterValue(observability::kTransfersRejectedTotal), 1.0);
}

TEST_F(TransferEngineTest, DailyLimitIsInclusive) {
  engine_ = makeEngine(money("1000"));

  EXPECT_TRUE(engine_->transfer(alice_, bob_, money("400")).ok());
  EXPECT_TRUE(engine_->transfer(alice_, carol_, money("600")).ok());

  TransferResult result = engine_->transfer(alice_, bob_, money("0.01"));
  EXPECT_EQ(result.status, TransferStatus::DAILY_LIMIT_EXCEEDED);
  ASSERT_TRUE(result.limit_breach.has_value());
  EXPECT_EQ(result.limit_breach->limit, money("1000"));
  EXPECT_EQ(result.limit_breach->transferred_today, money("1000"));
  EXPECT_EQ(result.limit_breach->attempted, money("0.01"));
  EXPECT_EQ(result.message,
            "daily transfer limit exceeded: limit=1000.00, already_transferred_today=1000.00, "
            "attempting=0.01");
}

TEST_F(TransferEngineTest, SingleTransferAboveLimitIsRejected) {
  engine_ = makeEngine(money("1000"));
  EXPECT_EQ(engine_->transfer(alice_, bob_, money("1001")).status,
            TransferStatus::DAILY_LIMIT_EXCEEDED);
  EXPECT_EQ(engine_->transfer(alice_, bob_, money("1000.01")).status,
            TransferStatus::DAILY_LIMIT_EXCEEDED);
  EXPECT_TRUE(engine_->transfer(alice_, bob_, money("1000.00")).ok());
  EXPECT_EQ(engine_->transfer(alice_, bob_, money("1")).status,
            TransferStatus::DAILY_LIMIT_EXCEEDED);
  EXPECT_EQ(balanceOf(alice_), money("499000.00"));
}

TEST_F(TransferEngineTest, IncomingTransfersDoNotCountTowardsLimit) {
  engine_ = makeEngine(money("500"));
  EXPECT_TRUE(engine_->transfer(alice_, bob_, money("500")).ok());
  EXPECT_TRUE(engine_->transfer(bob_, carol_, money("500")).ok());
  EXPECT_EQ(engine_->transfer(bob_, carol_, money("1")).status,
            TransferStatus::DAILY_LIMIT_EXCEEDED);
}

TEST_F(TransferEngineTest, LimitResetsAtUtcMidnight) {
  engine_ = makeEngine(money("1000"));
  clock_->set(at("2024-03-15 23:59:59.999999"));
  EXPECT_TRUE(engine_->transfer(alice_, bob_, money("1000")).ok());
  EXPECT_EQ(engine_->transfer(alice_, bob_, money("1")).status,
            TransferStatus::DAILY_LIMIT_EXCEEDED);

  clock_->set(at("2024-03-16 00:00:00"));
  EXPECT_TRUE(engine_->transfer(alice_, bob_, money("1000")).ok());
}

TEST_F(TransferEngineTest, DefaultLimitIsTwoHundredThousand) {
  EXPECT_EQ(engine_->limits().daily_limit, money("200000"));
  EXPECT_TRUE(engine_->transfer(alice_, bob_, money("200000")).ok());
  EXPECT_EQ(engine_->transfer(alice_, bob_, money("0.01")).status,
            TransferStatus::DAILY_LIMIT_EXCEEDED);
}

TEST_F(TransferEngineTest, ConstructorRejectsInvalidSettings) {
  EXPECT_THROW(TransferEngine zero(store_, TransferLimits{Money()}), std::invalid_argument);
  EXPECT_THROW(TransferEngine negative(store_, TransferLimits{money("-1")}),
               std::invalid_argument);
  EXPECT_THROW(TransferEngine clockless(store_, TransferLimits{}, TransferEngine::Clock()),
               std::invalid_argument);
}

// A fault at any step leaves balances and the log untouched.
class TransferFaultTest : public TransferEngineTest,
                          public ::testing::WithParamInterface<FaultyLedgerStore::Fault> {};

TEST_P(TransferFaultTest, StoreFaultRollsBackEverything) {
  faulty_->failOn(GetParam());
  TransferResult result = engine_->transfer(bob_, carol_, money("100"));

  EXPECT_EQ(result.status, TransferStatus::TRANSFER_FAILED);
  EXPECT_EQ(result.message, "transfer failed: injected fault");
  EXPECT_EQ(balanceOf(bob_), money("1000.00"));
  EXPECT_EQ(balanceOf(carol_), money("0.00"));
  EXPECT_TRUE(store_.transactionsFor(bob_).empty());
  EXPECT_EQ(metrics_.counterValue(observability::kTransfersFailedTotal), 1.0);

  // Locks were released by the rollback.
  faulty_->failOn(FaultyLedgerStore::Fault::NONE);
  EXPECT_TRUE(engine_->transfer(bob_, carol_, money("100")).ok());
}

INSTANTIATE_TEST_SUITE_P(Faults, TransferFaultTest,
                         ::testing::Values(FaultyLedgerStore::Fault::GET_FOR_UPDATE,
                                           FaultyLedgerStore::Fault::SAVE,
                                           FaultyLedgerStore::Fault::APPEND,
                                           FaultyLedgerStore::Fault::SUM,
                                           FaultyLedgerStore::Fault::COMMIT));

TEST(TransferStatusTest, Names) {
  EXPECT_EQ(toString(TransferStatus::SUCCESS), "SUCCESS");
  EXPECT_EQ(toString(TransferStatus::DAILY_LIMIT_EXCEEDED), "DAILY_LIMIT_EXCEEDED");
  EXPECT_EQ(toString(TransferStatus::ACCOUNT_CANNOT_RECEIVE), "ACCOUNT_CANNOT_RECEIVE");
  EXPECT_EQ(toString(TransferStatus::TRANSFER_FAILED), "TRANSFER_FAILED");
}
