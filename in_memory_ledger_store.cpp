#include "in_memory_ledger_store.hpp"

#include "observability/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace ledger {

/**
 * Unit of work over an InMemoryLedgerStore. Staged accounts and
 * transactions live here until commit publishes them under the table lock.
 */
class InMemoryLedgerStore::InMemoryUnit : public LedgerStore::Unit {
 public:
  explicit InMemoryUnit(InMemoryLedgerStore& store) : store_(store) {}

  ~InMemoryUnit() override {
    if (open_) {
      rollback();
    }
  }

  std::optional<Account> getForUpdate(AccountId account_id) override {
    ensureOpen();

    // Re-reading a row this unit already holds must not self-deadlock.
    if (row_locks_.count(account_id)) {
      return currentView(account_id);
    }

    std::mutex* row_mutex = store_.findRowMutex(account_id);
    if (!row_mutex) {
      return std::nullopt;
    }

    std::unique_lock<std::mutex> row_lock(*row_mutex);
    row_locks_.emplace(account_id, std::move(row_lock));
    return currentView(account_id);
  }

  void save(const Account& account) override {
    ensureOpen();
    if (!row_locks_.count(account.account_id)) {
      throw StoreError("account " + std::to_string(account.account_id) +
                       " saved without holding its row lock");
    }
    if (account.balance.isNegative()) {
      throw StoreError("balance of account " + std::to_string(account.account_id) +
                       " would become negative");
    }
    staged_accounts_[account.account_id] = account;
  }

  TransactionRecord appendTransaction(const NewTransaction& transaction) override {
    ensureOpen();
    if (!transaction.amount.isPositive()) {
      throw StoreError("transaction amount must be positive");
    }

    TransactionRecord record;
    record.id = store_.next_transaction_id_.fetch_add(1);
    record.from_account = transaction.from_account;
    record.to_account = transaction.to_account;
    record.amount = transaction.amount;
    record.created_at = transaction.created_at;
    staged_transactions_.push_back(record);
    return record;
  }

  Money sumSentSince(AccountId account_id, Timestamp window_start,
                     Timestamp window_end) override {
    ensureOpen();
    auto matches = [&](const TransactionRecord& tx) {
      return tx.from_account == account_id && tx.created_at >= window_start &&
             tx.created_at <= window_end;
    };

    Money total;
    {
      std::shared_lock<std::shared_mutex> table_lock(store_.table_mutex_);
      for (const auto& tx : store_.transactions_) {
        if (matches(tx)) total += tx.amount;
      }
    }
    for (const auto& tx : staged_transactions_) {
      if (matches(tx)) total += tx.amount;
    }
    return total;
  }

  void commit() override {
    ensureOpen();
    {
      std::unique_lock<std::shared_mutex> table_lock(store_.table_mutex_);
      for (const auto& [id, staged] : staged_accounts_) {
        Account& stored = store_.accounts_.at(id);
        stored.balance = staged.balance;
        stored.status = staged.status;
      }
      // Ids are drawn at staging time, so a unit may commit after one that
      // staged later; keep the log ordered by id.
      auto by_id = [](const TransactionRecord& a, const TransactionRecord& b) {
        return a.id < b.id;
      };
      for (const auto& record : staged_transactions_) {
        auto position = std::upper_bound(store_.transactions_.begin(),
                                         store_.transactions_.end(), record, by_id);
        store_.transactions_.insert(position, record);
      }
    }
    finish();
  }

  void rollback() override {
    if (!open_) {
      return;
    }
    if (!staged_transactions_.empty() || !staged_accounts_.empty()) {
      LEDGER_LOG_BUILDER(observability::LogLevel::DEBUG, "Discarding staged changes")
          .field("accounts", static_cast<int64_t>(staged_accounts_.size()))
          .field("transactions", static_cast<int64_t>(staged_transactions_.size()));
    }
    finish();
  }

 private:
  void ensureOpen() const {
    if (!open_) {
      throw StoreError("unit of work already finished");
    }
  }

  Account currentView(AccountId account_id) {
    auto staged = staged_accounts_.find(account_id);
    if (staged != staged_accounts_.end()) {
      return staged->second;
    }
    std::shared_lock<std::shared_mutex> table_lock(store_.table_mutex_);
    return store_.accounts_.at(account_id);
  }

  void finish() {
    staged_accounts_.clear();
    staged_transactions_.clear();
    row_locks_.clear();  // releases every row lock
    open_ = false;
  }

  InMemoryLedgerStore& store_;
  bool open_ = true;
  std::unordered_map<AccountId, std::unique_lock<std::mutex>> row_locks_;
  std::unordered_map<AccountId, Account> staged_accounts_;
  std::vector<TransactionRecord> staged_transactions_;
};

std::unique_ptr<LedgerStore::Unit> InMemoryLedgerStore::begin() {
  return std::make_unique<InMemoryUnit>(*this);
}

Account InMemoryLedgerStore::createAccount(const NewAccount& request) {
  if (request.initial_balance.isNegative()) {
    throw StoreError("initial balance must not be negative");
  }

  std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
  if (account_numbers_.count(request.account_number)) {
    throw StoreError("account number already exists: " + request.account_number);
  }

  Account account;
  account.account_id = next_account_id_.fetch_add(1);
  account.customer_id = request.customer_id;
  account.account_number = request.account_number;
  account.account_type = request.account_type;
  account.currency = request.currency;
  account.customer_name = request.customer_name.value_or(defaultCustomerName(request.customer_id));
  account.balance = request.initial_balance;
  account.status = AccountStatus::ACTIVE;
  account.created_at = nowUtc();

  insertLocked(account);
  return account;
}

void InMemoryLedgerStore::insertAccount(const Account& account) {
  if (account.balance.isNegative()) {
    throw StoreError("balance must not be negative");
  }

  std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
  if (accounts_.count(account.account_id)) {
    throw StoreError("account id already exists: " + std::to_string(account.account_id));
  }
  if (account_numbers_.count(account.account_number)) {
    throw StoreError("account number already exists: " + account.account_number);
  }

  insertLocked(account);

  AccountId expected = next_account_id_.load();
  while (expected <= account.account_id &&
         !next_account_id_.compare_exchange_weak(expected, account.account_id + 1)) {
  }
}

void InMemoryLedgerStore::insertLocked(const Account& account) {
  accounts_.emplace(account.account_id, account);
  row_mutexes_.emplace(account.account_id, std::make_unique<std::mutex>());
  account_numbers_.insert(account.account_number);
}

std::optional<Account> InMemoryLedgerStore::findAccount(AccountId account_id) {
  std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TransactionRecord> InMemoryLedgerStore::transactionsFor(AccountId account_id,
                                                                    size_t limit) {
  std::vector<TransactionRecord> result;
  std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
  for (auto it = transactions_.rbegin(); it != transactions_.rend() && result.size() < limit; ++it) {
    if (it->from_account == account_id || it->to_account == account_id) {
      result.push_back(*it);
    }
  }
  return result;
}

size_t InMemoryLedgerStore::accountCount() {
  std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
  return accounts_.size();
}

std::mutex* InMemoryLedgerStore::findRowMutex(AccountId account_id) {
  std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
  auto it = row_mutexes_.find(account_id);
  return it == row_mutexes_.end() ? nullptr : it->second.get();
}

}  // namespace ledger
