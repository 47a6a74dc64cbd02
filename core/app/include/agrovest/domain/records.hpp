#pragma once

#include "agrovest/domain/money.hpp"
#include "agrovest/domain/statuses.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agrovest::domain {

// Identifiers are assigned by the Store, start at 1 and are never reused.
// 0 means "not yet assigned".
using UserId = std::uint64_t;
using PackageId = std::uint64_t;
using InvestmentId = std::uint64_t;
using PaymentId = std::uint64_t;
using LedgerEntryId = std::uint64_t;
using WithdrawalId = std::uint64_t;

// Epoch milliseconds from ITimeProvider.
using EpochMs = std::int64_t;

constexpr EpochMs kMsPerDay = 24LL * 60 * 60 * 1000;

// -----------------------------------------------------------------------------
// ReturnTerms
// -----------------------------------------------------------------------------
// Supplied by package configuration. The engine applies them once at
// completion; it does not compute schedules.
// -----------------------------------------------------------------------------
struct ReturnTerms {
  std::int32_t rate_bps{0};       // 3000 = 30% over the whole duration
  std::int32_t duration_days{0};
};

// -----------------------------------------------------------------------------
// InvestmentPackage
// -----------------------------------------------------------------------------
// available_slots is owned by InventoryAllocator; nothing else writes it.
// Invariant: 0 <= available_slots <= total_slots.
// -----------------------------------------------------------------------------
struct InvestmentPackage {
  PackageId id{0};
  std::string name;
  PackageKind kind{PackageKind::Direct};
  PackageStatus status{PackageStatus::Active};
  std::int64_t total_slots{0};
  std::int64_t available_slots{0};
  ReturnTerms terms;
  Money min_amount;               // zero = no lower bound
  Money max_amount;               // zero = no upper bound
  EpochMs created_at{0};
};

// -----------------------------------------------------------------------------
// Investment
// -----------------------------------------------------------------------------
struct Investment {
  InvestmentId id{0};
  UserId user_id{0};
  PackageId package_id{0};
  Money amount;
  std::int64_t units{1};
  InvestmentStatus status{InvestmentStatus::Pending};
  EpochMs created_at{0};
  std::optional<EpochMs> start_date;
  std::optional<EpochMs> end_date;
  std::optional<EpochMs> completed_date;
  Money actual_return;
  bool slot_held{false};              // units currently taken from inventory
  bool needs_reconciliation{false};   // money received but not applied
  std::optional<WithdrawalId> withdrawal_id;
};

// -----------------------------------------------------------------------------
// Payment
// -----------------------------------------------------------------------------
// One attempt to fund an investment through the gateway. Several attempts
// may exist per investment; at most one of them reaches Success.
// -----------------------------------------------------------------------------
struct Payment {
  PaymentId id{0};
  UserId user_id{0};
  std::optional<InvestmentId> investment_id;
  Money amount;
  PaymentStatus status{PaymentStatus::Pending};
  std::string reference;
  std::string authorization_url;
  std::string access_code;
  std::string payment_method{"paystack"};
  std::optional<EpochMs> paid_at;
  EpochMs created_at{0};
  nlohmann::json metadata = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// LedgerEntry
// -----------------------------------------------------------------------------
// Append-only record of money movement. Ledger entries reference an
// investment id by value; the investment may later be purged.
// -----------------------------------------------------------------------------
struct LedgerEntry {
  LedgerEntryId id{0};
  UserId user_id{0};
  std::optional<InvestmentId> investment_id;
  TransactionType type{TransactionType::Investment};
  Money amount;
  TransactionStatus status{TransactionStatus::Completed};
  std::string description;
  std::string payment_reference;
  EpochMs created_at{0};
};

// -----------------------------------------------------------------------------
// WithdrawalRequest
// -----------------------------------------------------------------------------
struct WithdrawalRequest {
  WithdrawalId id{0};
  UserId user_id{0};
  Money amount;
  WithdrawalType type{WithdrawalType::Interest};
  WithdrawalStatus status{WithdrawalStatus::Pending};
  EpochMs created_at{0};
  std::optional<EpochMs> processed_date;
  std::string admin_notes;
  std::string payment_reference;
  std::vector<InvestmentId> investment_ids;
};

}  // namespace agrovest::domain
