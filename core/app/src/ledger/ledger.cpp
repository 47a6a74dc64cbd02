#include "agrovest/ledger/ledger.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <algorithm>
#include <utility>

namespace agrovest {

Ledger::Ledger(const Store& store, const ITimeProvider& clock)
    : store_(store), clock_(clock) {}

domain::LedgerEntry Ledger::record(Store::Transaction& txn,
                                   domain::LedgerEntry entry) const {
  if (entry.amount.isNegative()) {
    throw EngineError(ErrorCode::Validation,
                      "Ledger amounts must not be negative");
  }
  entry.created_at = clock_.now_ms();
  return txn.append(std::move(entry));
}

std::vector<domain::LedgerEntry> Ledger::entriesForUser(
    domain::UserId user) const {
  auto entries = store_.ledgerForUser(user);
  std::reverse(entries.begin(), entries.end());
  return entries;
}

std::vector<domain::LedgerEntry> Ledger::entriesByType(
    domain::UserId user, domain::TransactionType type) const {
  auto entries = entriesForUser(user);
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [type](const domain::LedgerEntry& e) {
                                 return e.type != type;
                               }),
                entries.end());
  return entries;
}

std::vector<domain::LedgerEntry> Ledger::recent(domain::UserId user,
                                                std::size_t limit) const {
  auto entries = entriesForUser(user);
  if (entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

std::vector<domain::LedgerEntry> Ledger::entriesForInvestment(
    domain::InvestmentId id) const {
  std::vector<domain::LedgerEntry> out;
  for (auto& entry : store_.ledger()) {
    if (entry.investment_id == id) {
      out.push_back(std::move(entry));
    }
  }
  std::reverse(out.begin(), out.end());
  return out;
}

domain::Money Ledger::total(domain::UserId user,
                            domain::TransactionType type) const {
  domain::Money sum;
  for (const auto& entry : store_.ledgerForUser(user)) {
    if (entry.type == type && entry.status == domain::TransactionStatus::Completed) {
      sum += entry.amount;
    }
  }
  return sum;
}

}  // namespace agrovest
