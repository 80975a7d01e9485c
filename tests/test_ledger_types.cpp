#include "ledger_types.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace ledger;

TEST(TimestampTest, FormatsInUtcWithMicroseconds) {
  Timestamp epoch{};
  EXPECT_EQ(formatTimestamp(epoch), "1970-01-01 00:00:00.000000");

  Timestamp ts = epoch + std::chrono::hours(24) + std::chrono::microseconds(1500);
  EXPECT_EQ(formatTimestamp(ts), "1970-01-02 00:00:00.001500");
}

TEST(TimestampTest, ParsesWithAndWithoutFraction) {
  std::optional<Timestamp> whole = parseTimestamp("2024-03-15 10:20:30");
  ASSERT_TRUE(whole.has_value());
  EXPECT_EQ(formatTimestamp(*whole), "2024-03-15 10:20:30.000000");

  std::optional<Timestamp> fraction = parseTimestamp("2024-03-15 10:20:30.25");
  ASSERT_TRUE(fraction.has_value());
  EXPECT_EQ(*fraction - *whole, std::chrono::microseconds(250000));

  std::optional<Timestamp> micros = parseTimestamp("2024-03-15 23:59:59.999999");
  ASSERT_TRUE(micros.has_value());
  EXPECT_EQ(formatTimestamp(*micros), "2024-03-15 23:59:59.999999");
}

TEST(TimestampTest, RejectsMalformedText) {
  EXPECT_FALSE(parseTimestamp("").has_value());
  EXPECT_FALSE(parseTimestamp("yesterday").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-15").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-15 10:20:30.").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-15 10:20:30.1234567").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-15 10:20:30+05:30").has_value());
}

TEST(AccountStatusTest, ParsesCaseInsensitively) {
  EXPECT_EQ(parseAccountStatus("ACTIVE"), AccountStatus::ACTIVE);
  EXPECT_EQ(parseAccountStatus("frozen"), AccountStatus::FROZEN);
  EXPECT_EQ(parseAccountStatus("Closed"), AccountStatus::CLOSED);
  EXPECT_FALSE(parseAccountStatus("DORMANT").has_value());
  EXPECT_FALSE(parseAccountStatus("").has_value());
}

TEST(AccountStatusTest, RendersCanonicalNames) {
  EXPECT_EQ(toString(AccountStatus::ACTIVE), "ACTIVE");
  EXPECT_EQ(toString(AccountStatus::FROZEN), "FROZEN");
  EXPECT_EQ(toString(AccountStatus::CLOSED), "CLOSED");
}

TEST(AccountTest, Defaults) {
  Account account;
  EXPECT_EQ(account.account_type, "SAVINGS");
  EXPECT_EQ(account.currency, "INR");
  EXPECT_TRUE(account.isActive());
  EXPECT_TRUE(account.balance.isZero());

  EXPECT_EQ(defaultCustomerName(7), "Customer 7");
}
