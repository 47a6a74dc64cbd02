#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/events/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace agrovest {

// -----------------------------------------------------------------------------
// JSON views of domain records and events
// -----------------------------------------------------------------------------
// Used for IPC command replies and PUB telemetry. Money is rendered as a
// two-decimal string ("185.00") next to its integer minor-unit value.
// Timestamps are epoch milliseconds; absent optionals become null.
// -----------------------------------------------------------------------------

nlohmann::json toJson(domain::Money money);
nlohmann::json toJson(const domain::InvestmentPackage& pkg);
nlohmann::json toJson(const domain::Investment& investment);
nlohmann::json toJson(const domain::Payment& payment);
nlohmann::json toJson(const domain::LedgerEntry& entry);
nlohmann::json toJson(const domain::WithdrawalRequest& withdrawal);

// Telemetry form of a post-commit event ({"type": "...", ...}).
// nullopt for events that are never broadcast (gateway notifications).
std::optional<nlohmann::json> telemetryJson(const Event& event);

}  // namespace agrovest
