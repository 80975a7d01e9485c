#ifndef LEDGER_SEED_CSV_SEEDER_HPP_
#define LEDGER_SEED_CSV_SEEDER_HPP_

#include "ledger_store.hpp"

#include <istream>
#include <string>
#include <vector>

namespace ledger {
namespace seed {

struct SeedReport {
  bool seeded = false;  // false when the file was missing or the store not empty
  size_t inserted = 0;
  size_t skipped = 0;
};

/**
 * Splits one CSV record. Double-quoted fields may contain commas and ""
 * escapes; a trailing '\r' is dropped.
 */
std::vector<std::string> splitCsvLine(const std::string& line);

/**
 * Loads accounts from a CSV file with a header row naming the columns
 * account_id, customer_id, account_number, account_type, balance, currency,
 * status, created_at ("YYYY-MM-DD HH:MM:SS", UTC) and customer_name.
 *
 * Seeding only happens into an empty store. Rows without a valid
 * account_id, account_number, balance or status are skipped; missing
 * optional columns take the same defaults as account creation.
 */
class CsvSeeder {
 public:
  explicit CsvSeeder(LedgerStore& store);

  SeedReport seedFromFile(const std::string& path);
  SeedReport seedFromStream(std::istream& in);

 private:
  LedgerStore& store_;
};

}  // namespace seed
}  // namespace ledger

#endif  // LEDGER_SEED_CSV_SEEDER_HPP_
