#ifndef LEDGER_IN_MEMORY_LEDGER_STORE_HPP_
#define LEDGER_IN_MEMORY_LEDGER_STORE_HPP_

#include "ledger_store.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_set>
#include <vector>

namespace ledger {

/**
 * Process-local LedgerStore with row-level locking.
 *
 * Each account owns a std::mutex that plays the role of the row lock; a unit
 * keeps the std::unique_lock objects it acquired until commit or rollback.
 * Table contents are guarded by a shared_mutex that is only ever held briefly
 * and never while waiting on a row lock, so units touching disjoint accounts
 * never wait on each other.
 */
class InMemoryLedgerStore : public LedgerStore {
 public:
  InMemoryLedgerStore() = default;
  ~InMemoryLedgerStore() override = default;

  // Non-copyable
  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

  std::unique_ptr<Unit> begin() override;

  Account createAccount(const NewAccount& request) override;
  void insertAccount(const Account& account) override;
  std::optional<Account> findAccount(AccountId account_id) override;
  std::vector<TransactionRecord> transactionsFor(AccountId account_id,
                                                 size_t limit = 100) override;
  size_t accountCount() override;
  bool ping() override { return true; }

 private:
  class InMemoryUnit;

  /**
   * Row mutex for an existing account, nullptr when there is no such account.
   * Accounts are never removed, so the pointer stays valid.
   */
  std::mutex* findRowMutex(AccountId account_id);

  // Caller holds table_mutex_ exclusively.
  void insertLocked(const Account& account);

  mutable std::shared_mutex table_mutex_;
  std::map<AccountId, Account> accounts_;
  std::map<AccountId, std::unique_ptr<std::mutex>> row_mutexes_;
  std::unordered_set<std::string> account_numbers_;
  std::vector<TransactionRecord> transactions_;  // ascending id

  std::atomic<AccountId> next_account_id_{1};
  std::atomic<TransactionId> next_transaction_id_{1};
};

}  // namespace ledger

#endif  // LEDGER_IN_MEMORY_LEDGER_STORE_HPP_
