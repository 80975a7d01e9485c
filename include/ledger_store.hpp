#ifndef LEDGER_STORE_HPP_
#define LEDGER_STORE_HPP_

#include "ledger_types.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger {

/**
 * Raised by store implementations when the backing storage fails or a write
 * violates a storage constraint.
 */
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Abstract storage for accounts and the append-only transaction log.
 * This provides the interface that implementations must follow.
 */
class LedgerStore {
 public:
  /**
   * One atomic unit of work. Writes are staged and become visible to other
   * units only on commit. Row locks taken by getForUpdate are held until the
   * unit commits or rolls back; destroying an open unit rolls it back.
   */
  class Unit {
   public:
    virtual ~Unit() = default;

    /**
     * Returns the account and holds its row lock for the rest of the unit.
     * Blocks while another unit holds the row. A miss holds no lock.
     */
    virtual std::optional<Account> getForUpdate(AccountId account_id) = 0;

    /**
     * Stages the account's mutable fields (balance and status). The row must
     * be locked by this unit.
     */
    virtual void save(const Account& account) = 0;

    /**
     * Stages a new ledger entry and returns it with its assigned id.
     */
    virtual TransactionRecord appendTransaction(const NewTransaction& transaction) = 0;

    /**
     * Sum of amounts sent by `account_id` with created_at in
     * [window_start, window_end], both inclusive. Zero when nothing matches.
     */
    virtual Money sumSentSince(AccountId account_id, Timestamp window_start,
                               Timestamp window_end) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
  };

  virtual ~LedgerStore() = default;

  /**
   * Opens a new atomic unit.
   */
  virtual std::unique_ptr<Unit> begin() = 0;

  /**
   * Creates an account with an id drawn from the store's sequence.
   */
  virtual Account createAccount(const NewAccount& request) = 0;

  /**
   * Inserts an account with a caller-chosen id (seeding). The id sequence is
   * advanced past it.
   */
  virtual void insertAccount(const Account& account) = 0;

  /**
   * Committed snapshot of one account.
   */
  virtual std::optional<Account> findAccount(AccountId account_id) = 0;

  /**
   * Transactions sent or received by the account, newest first.
   */
  virtual std::vector<TransactionRecord> transactionsFor(AccountId account_id,
                                                         size_t limit = 100) = 0;

  virtual size_t accountCount() = 0;

  /**
   * Cheap liveness probe of the backing storage.
   */
  virtual bool ping() = 0;
};

}  // namespace ledger

#endif  // LEDGER_STORE_HPP_
