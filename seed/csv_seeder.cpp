#include "seed/csv_seeder.hpp"

#include "observability/logger.hpp"

#include <fstream>
#include <map>

namespace ledger {
namespace seed {

namespace {

using Row = std::map<std::string, std::string>;

std::string column(const Row& row, const std::string& name) {
  auto it = row.find(name);
  return it == row.end() ? "" : it->second;
}

std::optional<int64_t> parseInteger(const std::string& text) {
  if (text.empty()) return std::nullopt;
  try {
    size_t consumed = 0;
    int64_t value = std::stoll(text, &consumed);
    if (consumed != text.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// nullopt means the row cannot be used; `reason` says why.
std::optional<Account> accountFromRow(const Row& row, std::string& reason) {
  Account account;

  std::optional<int64_t> account_id = parseInteger(column(row, "account_id"));
  if (!account_id || *account_id <= 0) {
    reason = "invalid account_id";
    return std::nullopt;
  }
  account.account_id = *account_id;

  account.customer_id = parseInteger(column(row, "customer_id")).value_or(0);

  account.account_number = column(row, "account_number");
  if (account.account_number.empty()) {
    reason = "missing account_number";
    return std::nullopt;
  }

  std::string type = column(row, "account_type");
  if (!type.empty()) account.account_type = type;

  std::string balance = column(row, "balance");
  if (!balance.empty()) {
    std::optional<Money> parsed = Money::tryParse(balance);
    if (!parsed || parsed->isNegative()) {
      reason = "invalid balance '" + balance + "'";
      return std::nullopt;
    }
    account.balance = *parsed;
  }

  std::string currency = column(row, "currency");
  if (!currency.empty()) account.currency = currency;

  std::string status = column(row, "status");
  if (!status.empty()) {
    std::optional<AccountStatus> parsed = parseAccountStatus(status);
    if (!parsed) {
      reason = "unknown status '" + status + "'";
      return std::nullopt;
    }
    account.status = *parsed;
  }

  account.created_at = parseTimestamp(column(row, "created_at")).value_or(nowUtc());

  std::string name = column(row, "customer_name");
  account.customer_name = name.empty() ? defaultCustomerName(account.customer_id) : name;
  return account;
}

}  // namespace

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        current += '"';
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        current += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(current);
      current.clear();
    } else if (c == '\r' && i + 1 == line.size()) {
      // CRLF line ending
    } else {
      current += c;
    }
  }
  fields.push_back(current);
  return fields;
}

CsvSeeder::CsvSeeder(LedgerStore& store) : store_(store) {
}

SeedReport CsvSeeder::seedFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    LEDGER_LOG_BUILDER(observability::LogLevel::DEBUG, "No seed file")
        .field("path", path);
    return {};
  }
  return seedFromStream(file);
}

SeedReport CsvSeeder::seedFromStream(std::istream& in) {
  SeedReport report;
  if (store_.accountCount() > 0) {
    LEDGER_LOG_INFO("Store already holds accounts, skipping seed");
    return report;
  }

  std::string line;
  if (!std::getline(in, line)) {
    return report;
  }
  std::vector<std::string> header = splitCsvLine(line);

  report.seeded = true;
  size_t line_number = 1;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line == "\r") continue;

    std::vector<std::string> values = splitCsvLine(line);
    Row row;
    for (size_t i = 0; i < header.size() && i < values.size(); ++i) {
      row[header[i]] = values[i];
    }

    std::string reason;
    std::optional<Account> account = accountFromRow(row, reason);
    if (account) {
      try {
        store_.insertAccount(*account);
        ++report.inserted;
        continue;
      } catch (const StoreError& e) {
        reason = e.what();
      }
    }

    ++report.skipped;
    LEDGER_LOG_BUILDER(observability::LogLevel::WARN, "Skipped seed row")
        .field("line", static_cast<int64_t>(line_number))
        .field("reason", reason);
  }

  LEDGER_LOG_BUILDER(observability::LogLevel::INFO, "Seeded accounts from CSV")
      .field("inserted", static_cast<int64_t>(report.inserted))
      .field("skipped", static_cast<int64_t>(report.skipped));
  return report;
}

}  // namespace seed
}  // namespace ledger
