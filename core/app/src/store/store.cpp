#include "agrovest/store/store.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <algorithm>
#include <utility>

namespace agrovest {

const char* toString(RowKind kind) {
  switch (kind) {
    case RowKind::Package:    return "package";
    case RowKind::Investment: return "investment";
    case RowKind::Payment:    return "payment";
    case RowKind::Withdrawal: return "withdrawal";
  }
  return "row";
}

// =============================================================================
// Store
// =============================================================================

Store::Store(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

Store::Transaction Store::begin() { return Transaction(*this); }

Store::RowMutex Store::rowMutex(const RowKey& key) {
  std::lock_guard lock(lock_table_mutex_);
  auto& slot = lock_table_[key];
  if (!slot) {
    slot = std::make_shared<std::timed_mutex>();
  }
  return slot;
}

std::optional<domain::InvestmentPackage> Store::package(
    domain::PackageId id) const {
  std::shared_lock lock(data_mutex_);
  auto it = packages_.find(id);
  if (it == packages_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::InvestmentPackage> Store::packages() const {
  std::shared_lock lock(data_mutex_);
  std::vector<domain::InvestmentPackage> out;
  out.reserve(packages_.size());
  for (const auto& [id, pkg] : packages_) {
    out.push_back(pkg);
  }
  return out;
}

std::optional<domain::Investment> Store::investment(
    domain::InvestmentId id) const {
  std::shared_lock lock(data_mutex_);
  auto it = investments_.find(id);
  if (it == investments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Investment> Store::investmentsForUser(
    domain::UserId user) const {
  std::shared_lock lock(data_mutex_);
  std::vector<domain::Investment> out;
  for (const auto& [id, inv] : investments_) {
    if (inv.user_id == user) {
      out.push_back(inv);
    }
  }
  return out;
}

std::optional<domain::Payment> Store::payment(domain::PaymentId id) const {
  std::shared_lock lock(data_mutex_);
  auto it = payments_.find(id);
  if (it == payments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Payment> Store::paymentByReference(
    const std::string& reference) const {
  std::shared_lock lock(data_mutex_);
  auto ref = payment_refs_.find(reference);
  if (ref == payment_refs_.end()) {
    return std::nullopt;
  }
  auto it = payments_.find(ref->second);
  if (it == payments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Payment> Store::paymentsForInvestment(
    domain::InvestmentId id) const {
  std::shared_lock lock(data_mutex_);
  std::vector<domain::Payment> out;
  for (const auto& [pid, p] : payments_) {
    if (p.investment_id == id) {
      out.push_back(p);
    }
  }
  return out;
}

std::optional<domain::WithdrawalRequest> Store::withdrawal(
    domain::WithdrawalId id) const {
  std::shared_lock lock(data_mutex_);
  auto it = withdrawals_.find(id);
  if (it == withdrawals_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::WithdrawalRequest> Store::withdrawalsForUser(
    domain::UserId user) const {
  std::shared_lock lock(data_mutex_);
  std::vector<domain::WithdrawalRequest> out;
  for (const auto& [id, w] : withdrawals_) {
    if (w.user_id == user) {
      out.push_back(w);
    }
  }
  return out;
}

std::vector<domain::LedgerEntry> Store::ledger() const {
  std::shared_lock lock(data_mutex_);
  return ledger_;
}

std::vector<domain::LedgerEntry> Store::ledgerForUser(
    domain::UserId user) const {
  std::shared_lock lock(data_mutex_);
  std::vector<domain::LedgerEntry> out;
  for (const auto& entry : ledger_) {
    if (entry.user_id == user) {
      out.push_back(entry);
    }
  }
  return out;
}

// =============================================================================
// Store::Transaction
// =============================================================================

Store::Transaction::Transaction(Store& store) : store_(store) {}

// -----------------------------------------------------------------------------
// Destructor: rollback = drop staged writes, release locks
// -----------------------------------------------------------------------------
Store::Transaction::~Transaction() {
  if (!finished_) {
    finished_ = true;
    releaseLocks();
  }
}

void Store::Transaction::requireOpen() const {
  if (finished_) {
    throw EngineError(ErrorCode::Internal, "Transaction already finished");
  }
}

// -----------------------------------------------------------------------------
// lockRow(): bounded wait, Contention on timeout
// -----------------------------------------------------------------------------
void Store::Transaction::lockRow(RowKind kind, std::uint64_t id) {
  requireOpen();
  const RowKey key{kind, id};
  if (held_.count(key) != 0) {
    return;
  }

  RowMutex mutex = store_.rowMutex(key);
  if (!mutex->try_lock_for(store_.lock_timeout_)) {
    throw EngineError(ErrorCode::Contention,
                      std::string("Timed out waiting for ") + toString(kind) +
                          " " + std::to_string(id) + " lock");
  }
  held_.emplace(key, std::move(mutex));
}

void Store::Transaction::lockPackage(domain::PackageId id) {
  lockRow(RowKind::Package, id);
}

void Store::Transaction::lockInvestment(domain::InvestmentId id) {
  lockRow(RowKind::Investment, id);
}

void Store::Transaction::lockPayment(domain::PaymentId id) {
  lockRow(RowKind::Payment, id);
}

void Store::Transaction::lockWithdrawal(domain::WithdrawalId id) {
  lockRow(RowKind::Withdrawal, id);
}

bool Store::Transaction::holds(RowKind kind, std::uint64_t id) const {
  return held_.count(RowKey{kind, id}) != 0;
}

void Store::Transaction::requireLock(RowKind kind, std::uint64_t id) const {
  requireOpen();
  if (!holds(kind, id)) {
    throw EngineError(ErrorCode::Internal,
                      std::string("Write to ") + toString(kind) + " " +
                          std::to_string(id) + " without holding its lock");
  }
}

void Store::Transaction::releaseLocks() {
  for (auto& [key, mutex] : held_) {
    mutex->unlock();
  }
  held_.clear();
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
std::optional<domain::InvestmentPackage> Store::Transaction::package(
    domain::PackageId id) const {
  auto staged = packages_.find(id);
  if (staged != packages_.end()) {
    return staged->second;
  }
  return store_.package(id);
}

std::optional<domain::Investment> Store::Transaction::investment(
    domain::InvestmentId id) const {
  auto staged = investments_.find(id);
  if (staged != investments_.end()) {
    return staged->second;
  }
  return store_.investment(id);
}

std::vector<domain::Investment> Store::Transaction::investmentsForUser(
    domain::UserId user) const {
  std::map<domain::InvestmentId, domain::Investment> merged;
  for (auto& inv : store_.investmentsForUser(user)) {
    merged.emplace(inv.id, std::move(inv));
  }
  for (const auto& [id, staged] : investments_) {
    if (!staged.has_value()) {
      merged.erase(id);
    } else if (staged->user_id == user) {
      merged[id] = *staged;
    }
  }

  std::vector<domain::Investment> out;
  out.reserve(merged.size());
  for (auto& [id, inv] : merged) {
    out.push_back(std::move(inv));
  }
  return out;
}

std::optional<domain::Payment> Store::Transaction::payment(
    domain::PaymentId id) const {
  auto staged = payments_.find(id);
  if (staged != payments_.end()) {
    return staged->second;
  }
  return store_.payment(id);
}

std::optional<domain::Payment> Store::Transaction::paymentByReference(
    const std::string& reference) const {
  for (const auto& [id, p] : payments_) {
    if (p.reference == reference) {
      return p;
    }
  }
  auto committed = store_.paymentByReference(reference);
  if (committed.has_value() && payments_.count(committed->id) != 0) {
    // Staged copy of the same row changed its reference.
    return std::nullopt;
  }
  return committed;
}

std::vector<domain::Payment> Store::Transaction::paymentsForInvestment(
    domain::InvestmentId id) const {
  std::map<domain::PaymentId, domain::Payment> merged;
  for (auto& p : store_.paymentsForInvestment(id)) {
    merged.emplace(p.id, std::move(p));
  }
  for (const auto& [pid, p] : payments_) {
    if (p.investment_id == id) {
      merged[pid] = p;
    } else {
      merged.erase(pid);
    }
  }

  std::vector<domain::Payment> out;
  out.reserve(merged.size());
  for (auto& [pid, p] : merged) {
    out.push_back(std::move(p));
  }
  return out;
}

std::optional<domain::WithdrawalRequest> Store::Transaction::withdrawal(
    domain::WithdrawalId id) const {
  auto staged = withdrawals_.find(id);
  if (staged != withdrawals_.end()) {
    return staged->second;
  }
  return store_.withdrawal(id);
}

// -----------------------------------------------------------------------------
// Inserts
// -----------------------------------------------------------------------------
domain::InvestmentPackage Store::Transaction::insert(
    domain::InvestmentPackage package) {
  requireOpen();
  if (package.id == 0) {
    package.id = store_.package_ids_.next_id();
  } else {
    if (this->package(package.id).has_value()) {
      throw EngineError(ErrorCode::Validation,
                        "Package " + std::to_string(package.id) +
                            " already exists");
    }
    store_.package_ids_.observe(package.id);
  }
  lockRow(RowKind::Package, package.id);
  packages_[package.id] = package;
  return package;
}

domain::Investment Store::Transaction::insert(domain::Investment investment) {
  requireOpen();
  if (investment.id == 0) {
    investment.id = store_.investment_ids_.next_id();
  } else {
    if (this->investment(investment.id).has_value()) {
      throw EngineError(ErrorCode::Validation,
                        "Investment " + std::to_string(investment.id) +
                            " already exists");
    }
    store_.investment_ids_.observe(investment.id);
  }
  lockRow(RowKind::Investment, investment.id);
  investments_[investment.id] = investment;
  return investment;
}

domain::Payment Store::Transaction::insert(domain::Payment payment) {
  requireOpen();
  if (payment.reference.empty()) {
    throw EngineError(ErrorCode::Validation, "Payment reference is required");
  }
  if (paymentByReference(payment.reference).has_value()) {
    throw EngineError(ErrorCode::Validation,
                      "Duplicate payment reference " + payment.reference);
  }
  if (payment.id == 0) {
    payment.id = store_.payment_ids_.next_id();
  } else {
    store_.payment_ids_.observe(payment.id);
  }
  lockRow(RowKind::Payment, payment.id);
  payments_[payment.id] = payment;
  return payment;
}

domain::WithdrawalRequest Store::Transaction::insert(
    domain::WithdrawalRequest withdrawal) {
  requireOpen();
  if (withdrawal.id == 0) {
    withdrawal.id = store_.withdrawal_ids_.next_id();
  } else {
    store_.withdrawal_ids_.observe(withdrawal.id);
  }
  lockRow(RowKind::Withdrawal, withdrawal.id);
  withdrawals_[withdrawal.id] = withdrawal;
  return withdrawal;
}

// -----------------------------------------------------------------------------
// Updates
// -----------------------------------------------------------------------------
void Store::Transaction::update(const domain::InvestmentPackage& package) {
  requireLock(RowKind::Package, package.id);
  if (package.available_slots < 0 ||
      package.available_slots > package.total_slots) {
    throw EngineError(ErrorCode::Internal,
                      "Package " + std::to_string(package.id) +
                          " slot counters out of bounds");
  }
  packages_[package.id] = package;
}

void Store::Transaction::update(const domain::Investment& investment) {
  requireLock(RowKind::Investment, investment.id);
  investments_[investment.id] = investment;
}

void Store::Transaction::update(const domain::Payment& payment) {
  requireLock(RowKind::Payment, payment.id);
  payments_[payment.id] = payment;
}

void Store::Transaction::update(const domain::WithdrawalRequest& withdrawal) {
  requireLock(RowKind::Withdrawal, withdrawal.id);
  withdrawals_[withdrawal.id] = withdrawal;
}

void Store::Transaction::eraseInvestment(domain::InvestmentId id) {
  requireLock(RowKind::Investment, id);
  investments_[id] = std::nullopt;
}

domain::LedgerEntry Store::Transaction::append(domain::LedgerEntry entry) {
  requireOpen();
  entry.id = store_.ledger_ids_.next_id();
  ledger_.push_back(entry);
  return entry;
}

// -----------------------------------------------------------------------------
// commit(): validate, then apply everything under the exclusive data lock
// -----------------------------------------------------------------------------
void Store::Transaction::commit() {
  requireOpen();

  {
    std::unique_lock lock(store_.data_mutex_);

    // ---  1) Validate before touching anything ------------------------------
    for (const auto& [id, p] : payments_) {
      auto ref = store_.payment_refs_.find(p.reference);
      if (ref != store_.payment_refs_.end() && ref->second != id) {
        throw EngineError(ErrorCode::Internal,
                          "Payment reference " + p.reference +
                              " already belongs to payment " +
                              std::to_string(ref->second));
      }
    }

    // ---  2) Apply ----------------------------------------------------------
    for (const auto& [id, pkg] : packages_) {
      store_.packages_[id] = pkg;
    }

    for (const auto& [id, inv] : investments_) {
      if (inv.has_value()) {
        store_.investments_[id] = *inv;
      } else {
        store_.investments_.erase(id);
      }
    }

    for (const auto& [id, p] : payments_) {
      auto previous = store_.payments_.find(id);
      if (previous != store_.payments_.end() &&
          previous->second.reference != p.reference) {
        store_.payment_refs_.erase(previous->second.reference);
      }
      store_.payments_[id] = p;
      store_.payment_refs_[p.reference] = id;
    }

    for (const auto& [id, w] : withdrawals_) {
      store_.withdrawals_[id] = w;
    }

    store_.ledger_.insert(store_.ledger_.end(), ledger_.begin(),
                          ledger_.end());
  }

  finished_ = true;
  releaseLocks();
}

}  // namespace agrovest
