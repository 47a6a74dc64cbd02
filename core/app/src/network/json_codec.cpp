#include "agrovest/network/json_codec.hpp"

#include "agrovest/time/time_utils.hpp"

#include <type_traits>

namespace agrovest {

namespace {

template <typename T>
nlohmann::json optionalJson(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

}  // namespace

nlohmann::json toJson(domain::Money money) { return money.toString(); }

nlohmann::json toJson(const domain::InvestmentPackage& pkg) {
  nlohmann::json j;
  j["id"] = pkg.id;
  j["name"] = pkg.name;
  j["kind"] = domain::toString(pkg.kind);
  j["status"] = domain::toString(pkg.status);
  j["total_slots"] = pkg.total_slots;
  j["available_slots"] = pkg.available_slots;
  j["rate_bps"] = pkg.terms.rate_bps;
  j["duration_days"] = pkg.terms.duration_days;
  j["min_amount"] = toJson(pkg.min_amount);
  j["max_amount"] = toJson(pkg.max_amount);
  j["created_at"] = pkg.created_at;
  return j;
}

nlohmann::json toJson(const domain::Investment& investment) {
  nlohmann::json j;
  j["id"] = investment.id;
  j["user_id"] = investment.user_id;
  j["package_id"] = investment.package_id;
  j["amount"] = toJson(investment.amount);
  j["amount_minor"] = investment.amount.minor();
  j["units"] = investment.units;
  j["status"] = domain::toString(investment.status);
  j["created_at"] = investment.created_at;
  j["start_date"] = optionalJson(investment.start_date);
  j["end_date"] = optionalJson(investment.end_date);
  j["completed_date"] = optionalJson(investment.completed_date);
  j["actual_return"] = toJson(investment.actual_return);
  j["slot_held"] = investment.slot_held;
  j["needs_reconciliation"] = investment.needs_reconciliation;
  j["withdrawal_id"] = optionalJson(investment.withdrawal_id);
  return j;
}

nlohmann::json toJson(const domain::Payment& payment) {
  nlohmann::json j;
  j["id"] = payment.id;
  j["user_id"] = payment.user_id;
  j["investment_id"] = optionalJson(payment.investment_id);
  j["amount"] = toJson(payment.amount);
  j["amount_minor"] = payment.amount.minor();
  j["status"] = domain::toString(payment.status);
  j["reference"] = payment.reference;
  j["authorization_url"] = payment.authorization_url;
  j["access_code"] = payment.access_code;
  j["payment_method"] = payment.payment_method;
  j["paid_at"] = optionalJson(payment.paid_at);
  j["created_at"] = payment.created_at;
  j["metadata"] = payment.metadata;
  return j;
}

nlohmann::json toJson(const domain::LedgerEntry& entry) {
  nlohmann::json j;
  j["id"] = entry.id;
  j["user_id"] = entry.user_id;
  j["investment_id"] = optionalJson(entry.investment_id);
  j["transaction_type"] = domain::toString(entry.type);
  j["amount"] = toJson(entry.amount);
  j["status"] = domain::toString(entry.status);
  j["description"] = entry.description;
  j["payment_reference"] = entry.payment_reference;
  j["created_at"] = entry.created_at;
  return j;
}

nlohmann::json toJson(const domain::WithdrawalRequest& withdrawal) {
  nlohmann::json j;
  j["id"] = withdrawal.id;
  j["user_id"] = withdrawal.user_id;
  j["amount"] = toJson(withdrawal.amount);
  j["amount_minor"] = withdrawal.amount.minor();
  j["type"] = domain::toString(withdrawal.type);
  j["status"] = domain::toString(withdrawal.status);
  j["created_at"] = withdrawal.created_at;
  j["processed_date"] = optionalJson(withdrawal.processed_date);
  j["admin_notes"] = withdrawal.admin_notes;
  j["payment_reference"] = withdrawal.payment_reference;
  j["investment_ids"] = withdrawal.investment_ids;
  return j;
}

// -----------------------------------------------------------------------------
// telemetryJson(): one {"type": ...} object per broadcast event
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> telemetryJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<nlohmann::json> {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;

        if constexpr (std::is_same_v<T, InvestmentUpdateEvent>) {
          j["type"] = e.purged ? "investment_purged" : "investment_update";
          j["investment"] = toJson(e.investment);
          j["previous_status"] =
              e.previous_status.has_value()
                  ? nlohmann::json(domain::toString(*e.previous_status))
                  : nlohmann::json(nullptr);
        } else if constexpr (std::is_same_v<T, PaymentUpdateEvent>) {
          j["type"] = "payment_update";
          j["payment"] = toJson(e.payment);
          j["previous_status"] =
              e.previous_status.has_value()
                  ? nlohmann::json(domain::toString(*e.previous_status))
                  : nlohmann::json(nullptr);
        } else if constexpr (std::is_same_v<T, LedgerEntryEvent>) {
          j["type"] = "ledger_entry";
          j["entry"] = toJson(e.entry);
        } else if constexpr (std::is_same_v<T, InventoryUpdateEvent>) {
          j["type"] = "inventory_update";
          j["package_id"] = e.package_id;
          j["total_slots"] = e.total_slots;
          j["available_slots"] = e.available_slots;
          j["delta"] = e.delta;
        } else if constexpr (std::is_same_v<T, WithdrawalUpdateEvent>) {
          j["type"] = "withdrawal_update";
          j["withdrawal"] = toJson(e.withdrawal);
          j["previous_status"] =
              e.previous_status.has_value()
                  ? nlohmann::json(domain::toString(*e.previous_status))
                  : nlohmann::json(nullptr);
        } else if constexpr (std::is_same_v<T, ReconciliationAlertEvent>) {
          j["type"] = "reconciliation_alert";
          j["reference"] = e.reference;
          j["investment_id"] = optionalJson(e.investment_id);
          j["reason"] = e.reason;
        } else {
          return std::nullopt;
        }

        j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
        return j;
      },
      event);
}

}  // namespace agrovest
