#include "in_memory_ledger_store.hpp"
#include "seed/csv_seeder.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace ledger;
using ledger::seed::CsvSeeder;
using ledger::seed::SeedReport;
using ledger::seed::splitCsvLine;
using ledger::test_support::money;

TEST(SplitCsvLineTest, PlainAndQuotedFields) {
  EXPECT_EQ(splitCsvLine("a,b,c"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(splitCsvLine("a,,c"), (std::vector<std::string>{"a", "", "c"}));
  EXPECT_EQ(splitCsvLine("\"Rao, Asha\",x"), (std::vector<std::string>{"Rao, Asha", "x"}));
  EXPECT_EQ(splitCsvLine("\"say \"\"hi\"\"\""), (std::vector<std::string>{"say \"hi\""}));
  EXPECT_EQ(splitCsvLine("a,b\r"), (std::vector<std::string>{"a", "b"}));
}

class CsvSeederTest : public ::testing::Test {
 protected:
  SeedReport seed(const std::string& csv) {
    std::istringstream in(csv);
    CsvSeeder seeder(store_);
    return seeder.seedFromStream(in);
  }

  InMemoryLedgerStore store_;
};

const char* const kHeader =
    "account_id,customer_id,account_number,account_type,balance,currency,status,created_at,"
    "customer_name\n";

TEST_F(CsvSeederTest, LoadsAccountsWithTheirIds) {
  SeedReport report = seed(std::string(kHeader) +
                           "10,1,ACC-10,SAVINGS,2500.75,INR,ACTIVE,2024-01-02 03:04:05,\"Rao, Asha\"\n"
                           "20,2,ACC-20,CURRENT,0,USD,frozen,,\n");

  EXPECT_TRUE(report.seeded);
  EXPECT_EQ(report.inserted, 2u);
  EXPECT_EQ(report.skipped, 0u);

  std::optional<Account> first = store_.findAccount(10);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->account_number, "ACC-10");
  EXPECT_EQ(first->balance, money("2500.75"));
  EXPECT_EQ(first->customer_name, "Rao, Asha");
  EXPECT_EQ(formatTimestamp(first->created_at), "2024-01-02 03:04:05.000000");

  std::optional<Account> second = store_.findAccount(20);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->status, AccountStatus::FROZEN);
  EXPECT_EQ(second->currency, "USD");
  EXPECT_EQ(second->customer_name, "Customer 2");
}

TEST_F(CsvSeederTest, NewAccountsContinueAfterSeededIds) {
  seed(std::string(kHeader) + "50,1,ACC-50,SAVINGS,10,INR,ACTIVE,,\n");
  NewAccount request;
  request.account_number = "NEW";
  EXPECT_GT(store_.createAccount(request).account_id, 50);
}

TEST_F(CsvSeederTest, SkipsInvalidRows) {
  SeedReport report = seed(std::string(kHeader) +
                           "abc,1,BAD-ID,SAVINGS,10,INR,ACTIVE,,\n"
                           "2,1,,SAVINGS,10,INR,ACTIVE,,\n"
                           "3,1,BAD-BAL,SAVINGS,ten,INR,ACTIVE,,\n"
                           "4,1,NEG-BAL,SAVINGS,-1,INR,ACTIVE,,\n"
                           "5,1,BAD-STATUS,SAVINGS,10,INR,DORMANT,,\n"
                           "6,1,GOOD,SAVINGS,10,INR,ACTIVE,,\n"
                           "7,1,GOOD,SAVINGS,10,INR,ACTIVE,,\n"
                           "\n");

  EXPECT_TRUE(report.seeded);
  EXPECT_EQ(report.inserted, 1u);
  EXPECT_EQ(report.skipped, 6u);
  EXPECT_EQ(store_.accountCount(), 1u);
  EXPECT_TRUE(store_.findAccount(6).has_value());
}

TEST_F(CsvSeederTest, SkipsWhenStoreAlreadyHasAccounts) {
  NewAccount request;
  request.account_number = "EXISTING";
  store_.createAccount(request);

  SeedReport report = seed(std::string(kHeader) + "10,1,ACC-10,SAVINGS,10,INR,ACTIVE,,\n");
  EXPECT_FALSE(report.seeded);
  EXPECT_EQ(report.inserted, 0u);
  EXPECT_FALSE(store_.findAccount(10).has_value());
}

TEST_F(CsvSeederTest, MissingFileIsNotAnError) {
  CsvSeeder seeder(store_);
  SeedReport report = seeder.seedFromFile("/nonexistent/accounts.csv");
  EXPECT_FALSE(report.seeded);
  EXPECT_EQ(store_.accountCount(), 0u);
}

TEST_F(CsvSeederTest, ColumnOrderFollowsHeader) {
  SeedReport report = seed("balance,account_number,account_id\r\n"
                           "99.99,REORDERED,3\r\n");
  EXPECT_EQ(report.inserted, 1u);
  std::optional<Account> account = store_.findAccount(3);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->balance, money("99.99"));
  EXPECT_EQ(account->account_type, "SAVINGS");
}
