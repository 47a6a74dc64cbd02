#pragma once

#include "agrovest/concurrent/id_generator.hpp"
#include "agrovest/domain/records.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agrovest {

// Row families that carry an exclusive lock. Ledger entries are append-only
// and never locked.
enum class RowKind { Package, Investment, Payment, Withdrawal };

const char* toString(RowKind kind);

// -----------------------------------------------------------------------------
// Store
// -----------------------------------------------------------------------------
//
// @brief  In-process record store with row-level exclusive locks and
//         all-or-nothing transactions.
//
// @details
// Every state-changing operation in the engine runs as one unit:
//
//   auto txn = store.begin();
//   txn.lockInvestment(id);            // read-for-update, bounded wait
//   auto inv = txn.investment(id);     // sees committed + own staged writes
//   ...
//   txn.update(inv);                   // staged, invisible to others
//   txn.append(entry);                 // staged ledger entry
//   txn.commit();                      // applied atomically, locks released
//
// If the Transaction is destroyed without commit() (an exception unwound
// it), every staged write is discarded and the row locks are released.
//
// Locking rules:
//   - Updating or erasing an existing row requires holding its lock; doing
//     so without the lock throws EngineError(Internal). This is how the
//     engine guarantees nobody changes available_slots outside the
//     allocator's locked section.
//   - Inserted rows are locked by the inserting transaction.
//   - A lock not obtained within lock_timeout throws
//     EngineError(Contention). Callers retry the whole unit at most once.
//   - Lock order inside a unit: payment -> investment -> package.
//     Withdrawal units lock investments in ascending id order.
//
// Thread model:
//   The Store is shared by all request threads. Committed data is guarded
//   by a shared_mutex (queries take it shared, commit takes it exclusive).
//   A Transaction belongs to the thread that began it.
//
// Ownership:
//   Owned by InvestmentEngine (or a test fixture). Components hold Store&.
// -----------------------------------------------------------------------------
class Store {
 public:
  class Transaction;

  explicit Store(
      std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(250));

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;
  Store(Store&&) = delete;
  Store& operator=(Store&&) = delete;

  Transaction begin();

  std::chrono::milliseconds lockTimeout() const { return lock_timeout_; }

  // --- Committed-state queries (snapshots, no row locks) --------------------
  std::optional<domain::InvestmentPackage> package(domain::PackageId id) const;
  std::vector<domain::InvestmentPackage> packages() const;

  std::optional<domain::Investment> investment(domain::InvestmentId id) const;
  std::vector<domain::Investment> investmentsForUser(domain::UserId user) const;

  std::optional<domain::Payment> payment(domain::PaymentId id) const;
  std::optional<domain::Payment> paymentByReference(
      const std::string& reference) const;
  std::vector<domain::Payment> paymentsForInvestment(
      domain::InvestmentId id) const;

  std::optional<domain::WithdrawalRequest> withdrawal(
      domain::WithdrawalId id) const;
  std::vector<domain::WithdrawalRequest> withdrawalsForUser(
      domain::UserId user) const;

  // Append order (oldest first).
  std::vector<domain::LedgerEntry> ledger() const;
  std::vector<domain::LedgerEntry> ledgerForUser(domain::UserId user) const;

  // Reserves an id without writing anything. Used when a gateway call has
  // to happen before the record can be inserted.
  domain::PaymentId reservePaymentId() { return payment_ids_.next_id(); }

 private:
  friend class Transaction;

  struct RowKey {
    RowKind kind;
    std::uint64_t id;

    bool operator<(const RowKey& other) const {
      if (kind != other.kind) {
        return kind < other.kind;
      }
      return id < other.id;
    }
  };

  using RowMutex = std::shared_ptr<std::timed_mutex>;

  RowMutex rowMutex(const RowKey& key);

  std::chrono::milliseconds lock_timeout_;

  // Lock table. Entries are created on first use and never removed.
  std::mutex lock_table_mutex_;
  std::map<RowKey, RowMutex> lock_table_;

  // Committed data.
  mutable std::shared_mutex data_mutex_;
  std::map<domain::PackageId, domain::InvestmentPackage> packages_;
  std::map<domain::InvestmentId, domain::Investment> investments_;
  std::map<domain::PaymentId, domain::Payment> payments_;
  std::unordered_map<std::string, domain::PaymentId> payment_refs_;
  std::map<domain::WithdrawalId, domain::WithdrawalRequest> withdrawals_;
  std::vector<domain::LedgerEntry> ledger_;

  IdGenerator package_ids_;
  IdGenerator investment_ids_;
  IdGenerator payment_ids_;
  IdGenerator ledger_ids_;
  IdGenerator withdrawal_ids_;
};

// -----------------------------------------------------------------------------
// Store::Transaction
// -----------------------------------------------------------------------------
//
// @brief  RAII unit of work. Holds row locks and staged writes; commit()
//         publishes them atomically, destruction without commit() discards
//         them.
//
// Thread model: single-threaded; use on the thread that called begin().
// -----------------------------------------------------------------------------
class Store::Transaction {
 public:
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  // --- Row locks (read-for-update) ------------------------------------------
  // Re-locking a row this transaction already holds is a no-op.
  void lockPackage(domain::PackageId id);
  void lockInvestment(domain::InvestmentId id);
  void lockPayment(domain::PaymentId id);
  void lockWithdrawal(domain::WithdrawalId id);

  bool holds(RowKind kind, std::uint64_t id) const;

  // --- Reads: own staged writes first, then committed state -----------------
  std::optional<domain::InvestmentPackage> package(domain::PackageId id) const;
  std::optional<domain::Investment> investment(domain::InvestmentId id) const;
  std::vector<domain::Investment> investmentsForUser(domain::UserId user) const;
  std::optional<domain::Payment> payment(domain::PaymentId id) const;
  std::optional<domain::Payment> paymentByReference(
      const std::string& reference) const;
  std::vector<domain::Payment> paymentsForInvestment(
      domain::InvestmentId id) const;
  std::optional<domain::WithdrawalRequest> withdrawal(
      domain::WithdrawalId id) const;

  // --- Inserts: assign an id when 0, lock the new row, stage ----------------
  domain::InvestmentPackage insert(domain::InvestmentPackage package);
  domain::Investment insert(domain::Investment investment);
  domain::Payment insert(domain::Payment payment);
  domain::WithdrawalRequest insert(domain::WithdrawalRequest withdrawal);

  // --- Updates: row lock required -------------------------------------------
  void update(const domain::InvestmentPackage& package);
  void update(const domain::Investment& investment);
  void update(const domain::Payment& payment);
  void update(const domain::WithdrawalRequest& withdrawal);

  // Purge. Row lock required.
  void eraseInvestment(domain::InvestmentId id);

  // The only way to write the ledger. Assigns the id.
  domain::LedgerEntry append(domain::LedgerEntry entry);

  // -------------------------------------------------------------------------
  // commit()
  // -------------------------------------------------------------------------
  // Applies all staged writes under the exclusive data lock, then releases
  // the row locks. Throws EngineError(Internal) if called twice or if a
  // staged payment reference collides with another payment; in that case
  // nothing is applied.
  // -------------------------------------------------------------------------
  void commit();

  bool finished() const { return finished_; }

 private:
  friend class Store;

  explicit Transaction(Store& store);

  void lockRow(RowKind kind, std::uint64_t id);
  void requireLock(RowKind kind, std::uint64_t id) const;
  void requireOpen() const;
  void releaseLocks();

  Store& store_;
  bool finished_{false};

  std::map<RowKey, RowMutex> held_;

  std::map<domain::PackageId, domain::InvestmentPackage> packages_;
  // nullopt marks an erased investment.
  std::map<domain::InvestmentId, std::optional<domain::Investment>>
      investments_;
  std::map<domain::PaymentId, domain::Payment> payments_;
  std::map<domain::WithdrawalId, domain::WithdrawalRequest> withdrawals_;
  std::vector<domain::LedgerEntry> ledger_;
};

}  // namespace agrovest
