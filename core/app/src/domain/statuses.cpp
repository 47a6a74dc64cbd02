#include "agrovest/domain/statuses.hpp"

namespace agrovest::domain {

const char* toString(PackageStatus s) {
  switch (s) {
    case PackageStatus::Active:   return "active";
    case PackageStatus::Inactive: return "inactive";
  }
  return "unknown";
}

const char* toString(PackageKind k) {
  switch (k) {
    case PackageKind::Direct:  return "direct";
    case PackageKind::Storage: return "storage";
  }
  return "unknown";
}

const char* toString(InvestmentStatus s) {
  switch (s) {
    case InvestmentStatus::Pending:   return "pending";
    case InvestmentStatus::Active:    return "active";
    case InvestmentStatus::Completed: return "completed";
    case InvestmentStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* toString(PaymentStatus s) {
  switch (s) {
    case PaymentStatus::Pending: return "pending";
    case PaymentStatus::Success: return "success";
    case PaymentStatus::Failed:  return "failed";
  }
  return "unknown";
}

const char* toString(WithdrawalStatus s) {
  switch (s) {
    case WithdrawalStatus::Pending:   return "pending";
    case WithdrawalStatus::Approved:  return "approved";
    case WithdrawalStatus::Rejected:  return "rejected";
    case WithdrawalStatus::Completed: return "completed";
    case WithdrawalStatus::Failed:    return "failed";
  }
  return "unknown";
}

const char* toString(WithdrawalType t) {
  switch (t) {
    case WithdrawalType::Interest: return "interest";
    case WithdrawalType::Reinvest: return "reinvest";
    case WithdrawalType::Full:     return "full";
  }
  return "unknown";
}

const char* toString(TransactionType t) {
  switch (t) {
    case TransactionType::Investment:    return "investment";
    case TransactionType::Refund:        return "refund";
    case TransactionType::ReferralBonus: return "referral_bonus";
    case TransactionType::Withdrawal:    return "withdrawal";
  }
  return "unknown";
}

const char* toString(TransactionStatus s) {
  switch (s) {
    case TransactionStatus::Pending:   return "pending";
    case TransactionStatus::Completed: return "completed";
    case TransactionStatus::Failed:    return "failed";
  }
  return "unknown";
}

std::optional<PackageStatus> parsePackageStatus(const std::string& text) {
  if (text == "active") return PackageStatus::Active;
  if (text == "inactive") return PackageStatus::Inactive;
  return std::nullopt;
}

std::optional<PackageKind> parsePackageKind(const std::string& text) {
  if (text == "direct") return PackageKind::Direct;
  if (text == "storage") return PackageKind::Storage;
  return std::nullopt;
}

std::optional<InvestmentStatus> parseInvestmentStatus(const std::string& text) {
  if (text == "pending") return InvestmentStatus::Pending;
  if (text == "active") return InvestmentStatus::Active;
  if (text == "completed") return InvestmentStatus::Completed;
  if (text == "cancelled") return InvestmentStatus::Cancelled;
  return std::nullopt;
}

std::optional<WithdrawalType> parseWithdrawalType(const std::string& text) {
  if (text == "interest") return WithdrawalType::Interest;
  if (text == "reinvest") return WithdrawalType::Reinvest;
  if (text == "full") return WithdrawalType::Full;
  return std::nullopt;
}

std::optional<TransactionType> parseTransactionType(const std::string& text) {
  if (text == "investment") return TransactionType::Investment;
  if (text == "refund") return TransactionType::Refund;
  if (text == "referral_bonus") return TransactionType::ReferralBonus;
  if (text == "withdrawal") return TransactionType::Withdrawal;
  return std::nullopt;
}

bool isTerminal(InvestmentStatus s) {
  return s == InvestmentStatus::Completed || s == InvestmentStatus::Cancelled;
}

}  // namespace agrovest::domain
