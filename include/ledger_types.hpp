#ifndef LEDGER_TYPES_HPP_
#define LEDGER_TYPES_HPP_

#include "money.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ledger {

using AccountId = int64_t;
using TransactionId = int64_t;

/**
 * UTC wall-clock instant with microsecond resolution, the finest the
 * PostgreSQL TIMESTAMP column keeps.
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

Timestamp nowUtc();

// "YYYY-MM-DD HH:MM:SS.ffffff", UTC.
std::string formatTimestamp(Timestamp ts);

// Accepts "YYYY-MM-DD HH:MM:SS" with an optional ".f" to ".ffffff" suffix.
std::optional<Timestamp> parseTimestamp(const std::string& text);

enum class AccountStatus {
  ACTIVE,
  FROZEN,
  CLOSED
};

std::string toString(AccountStatus status);

// Case-insensitive; nullopt for anything outside the closed set.
std::optional<AccountStatus> parseAccountStatus(const std::string& text);

struct Account {
  AccountId account_id = 0;
  int64_t customer_id = 0;
  std::string account_number;
  std::string account_type = "SAVINGS";
  std::string currency = "INR";
  std::string customer_name;
  Money balance;
  AccountStatus status = AccountStatus::ACTIVE;
  Timestamp created_at;

  bool isActive() const { return status == AccountStatus::ACTIVE; }
};

/**
 * Creation request; the store assigns the id.
 */
struct NewAccount {
  int64_t customer_id = 0;
  std::string account_number;
  std::string account_type = "SAVINGS";
  Money initial_balance;
  std::string currency = "INR";
  std::optional<std::string> customer_name;
};

struct TransactionRecord {
  TransactionId id = 0;
  AccountId from_account = 0;
  AccountId to_account = 0;
  Money amount;
  Timestamp created_at;
};

struct NewTransaction {
  AccountId from_account = 0;
  AccountId to_account = 0;
  Money amount;
  Timestamp created_at;
};

// Default display name for accounts created without one.
std::string defaultCustomerName(int64_t customer_id);

}  // namespace ledger

#endif  // LEDGER_TYPES_HPP_
