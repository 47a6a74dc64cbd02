#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/time/i_time_provider.hpp"

#include <cstddef>
#include <vector>

namespace agrovest {

// -----------------------------------------------------------------------------
// Ledger
// -----------------------------------------------------------------------------
//
// @brief  Append-only audit trail of money movement (investment funding,
//         refunds, withdrawal payouts).
//
// @details
// record() stages an entry inside the caller's transaction, so the entry
// becomes visible exactly when the state change it documents commits, and
// disappears with it on rollback. Entries are never updated or deleted;
// the Store exposes no such operation.
//
// Queries read committed state and return newest entries first.
//
// Thread model: Stateless apart from the references it holds. Safe from
// any thread.
// -----------------------------------------------------------------------------
class Ledger {
 public:
  Ledger(const Store& store, const ITimeProvider& clock);

  // Stamps created_at and stages the entry. Negative amounts are rejected
  // with EngineError(Validation); direction is carried by the type.
  domain::LedgerEntry record(Store::Transaction& txn,
                             domain::LedgerEntry entry) const;

  std::vector<domain::LedgerEntry> entriesForUser(domain::UserId user) const;
  std::vector<domain::LedgerEntry> entriesByType(
      domain::UserId user, domain::TransactionType type) const;
  std::vector<domain::LedgerEntry> recent(domain::UserId user,
                                          std::size_t limit) const;
  std::vector<domain::LedgerEntry> entriesForInvestment(
      domain::InvestmentId id) const;

  domain::Money total(domain::UserId user, domain::TransactionType type) const;

 private:
  const Store& store_;
  const ITimeProvider& clock_;
};

}  // namespace agrovest
