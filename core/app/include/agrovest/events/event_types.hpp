#pragma once

#include "agrovest/domain/money.hpp"
#include "agrovest/domain/records.hpp"
#include "agrovest/domain/statuses.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace agrovest {

// Wall-clock time carried by every event, for ordering and auditing.
using Timestamp = std::chrono::system_clock::time_point;

// Which path produced a payment notification.
enum class ConfirmationSource { Webhook, Verify, AdminOverride };

const char* toString(ConfirmationSource source);

// -----------------------------------------------------------------------------
// PaymentConfirmedEvent
// -----------------------------------------------------------------------------
// Responsibility: The normalized "gateway says this reference was paid"
// notification. Both the webhook path and the verify path build one of
// these, and InvestmentLifecycle::onPaymentConfirmed() is its only consumer.
//
// amount is the gateway-reported amount when the payload carried one; the
// handler rejects a mismatch with the stored Payment.amount.
// -----------------------------------------------------------------------------
struct PaymentConfirmedEvent {
  std::string reference;
  std::string gateway_id;
  std::optional<domain::Money> amount;
  ConfirmationSource source{ConfirmationSource::Webhook};
  nlohmann::json gateway_data = nlohmann::json::object();
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// PaymentFailedEvent
// -----------------------------------------------------------------------------
struct PaymentFailedEvent {
  std::string reference;
  std::string reason;
  ConfirmationSource source{ConfirmationSource::Webhook};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// Post-commit change notifications
// -----------------------------------------------------------------------------
// Published only after the Store transaction that produced them committed.
// They feed the audit log and the IPC telemetry socket; nothing in the
// engine makes decisions based on them.
// -----------------------------------------------------------------------------

struct InvestmentUpdateEvent {
  domain::Investment investment;
  std::optional<domain::InvestmentStatus> previous_status;  // nullopt: created
  bool purged{false};
  Timestamp timestamp{};
};

struct PaymentUpdateEvent {
  domain::Payment payment;
  std::optional<domain::PaymentStatus> previous_status;
  Timestamp timestamp{};
};

struct LedgerEntryEvent {
  domain::LedgerEntry entry;
  Timestamp timestamp{};
};

struct InventoryUpdateEvent {
  domain::PackageId package_id{0};
  std::int64_t total_slots{0};
  std::int64_t available_slots{0};
  std::int64_t delta{0};   // negative when units were taken
  Timestamp timestamp{};
};

struct WithdrawalUpdateEvent {
  domain::WithdrawalRequest withdrawal;
  std::optional<domain::WithdrawalStatus> previous_status;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// ReconciliationAlertEvent
// -----------------------------------------------------------------------------
// Raised when money arrived that could not be applied (sold out, duplicate
// charge, investment already cancelled). Operators settle these by hand.
// -----------------------------------------------------------------------------
struct ReconciliationAlertEvent {
  std::string reference;
  std::optional<domain::InvestmentId> investment_id;
  std::string reason;
  Timestamp timestamp{};
};

}  // namespace agrovest
