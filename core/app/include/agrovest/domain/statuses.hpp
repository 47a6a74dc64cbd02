#pragma once

#include <optional>
#include <string>

namespace agrovest::domain {

// -----------------------------------------------------------------------------
// Status and kind enumerations
// -----------------------------------------------------------------------------
// Every record status is a closed enum. Strings only appear at the wire
// boundary (JSON commands, telemetry), through toString() / parseXxx().
//
// InvestmentStatus state machine:
//
//   Pending ──► Active ──► Completed
//      │
//      └──► Cancelled
//
// WithdrawalStatus state machine:
//
//   Pending ──► Approved ──► Completed
//      │           │  ▲
//      │           ▼  │
//      │         Failed
//      └──► Rejected
// -----------------------------------------------------------------------------

enum class PackageStatus { Active, Inactive };

// Direct packages are plain investment slots; Storage plans sell units of
// stored commodity (bags). The kind selects the reservation policy.
enum class PackageKind { Direct, Storage };

enum class InvestmentStatus { Pending, Active, Completed, Cancelled };

enum class PaymentStatus { Pending, Success, Failed };

enum class WithdrawalStatus { Pending, Approved, Rejected, Completed, Failed };

enum class WithdrawalType { Interest, Reinvest, Full };

enum class TransactionType { Investment, Refund, ReferralBonus, Withdrawal };

enum class TransactionStatus { Pending, Completed, Failed };

const char* toString(PackageStatus s);
const char* toString(PackageKind k);
const char* toString(InvestmentStatus s);
const char* toString(PaymentStatus s);
const char* toString(WithdrawalStatus s);
const char* toString(WithdrawalType t);
const char* toString(TransactionType t);
const char* toString(TransactionStatus s);

std::optional<PackageStatus> parsePackageStatus(const std::string& text);
std::optional<PackageKind> parsePackageKind(const std::string& text);
std::optional<InvestmentStatus> parseInvestmentStatus(const std::string& text);
std::optional<WithdrawalType> parseWithdrawalType(const std::string& text);
std::optional<TransactionType> parseTransactionType(const std::string& text);

bool isTerminal(InvestmentStatus s);

}  // namespace agrovest::domain
