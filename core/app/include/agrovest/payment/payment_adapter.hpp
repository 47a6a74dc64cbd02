#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/events/event_types.hpp"
#include "agrovest/payment/i_payment_gateway.hpp"
#include "agrovest/payment/webhook_signer.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace agrovest {

enum class WebhookEventKind { ChargeSuccess, ChargeFailed, Other };

// -----------------------------------------------------------------------------
// WebhookEvent
// -----------------------------------------------------------------------------
// A webhook body that passed signature verification, reduced to the fields
// the engine acts on. data keeps the full gateway payload for metadata.
// -----------------------------------------------------------------------------
struct WebhookEvent {
  WebhookEventKind kind{WebhookEventKind::Other};
  std::string event_name;
  std::string reference;
  std::string gateway_id;
  std::optional<domain::Money> amount;
  std::string gateway_response;
  nlohmann::json data = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// PaymentAdapter
// -----------------------------------------------------------------------------
//
// @brief  Boundary between the engine and the payment gateway.
//
// @details
// Outbound: opens checkout sessions and polls reference status through the
// injected IPaymentGateway.
//
// Inbound: handleWebhook() authenticates the raw body (HMAC-SHA512 via
// WebhookSigner) before parsing it. A missing or wrong signature throws
// EngineError(InvalidSignature) and nothing downstream runs. A signed body
// that is not valid JSON or lacks event / data.reference throws
// EngineError(Validation).
//
// The adapter never touches the Store. Its outputs are converted into
// PaymentConfirmedEvent / PaymentFailedEvent for InvestmentLifecycle.
//
// Ownership: Borrows the gateway; owns its signer.
// -----------------------------------------------------------------------------
class PaymentAdapter {
 public:
  PaymentAdapter(IPaymentGateway& gateway, WebhookSigner signer);

  // "INV_<payment_id>_<epoch seconds>"
  static std::string makeReference(domain::PaymentId payment_id,
                                   domain::EpochMs now_ms);

  GatewaySession initialize(const std::string& reference,
                            const domain::Investment& investment,
                            domain::Money amount, const PayerProfile& payer);

  GatewayVerification verify(const std::string& reference);

  WebhookEvent handleWebhook(const std::string& raw_body,
                             const std::string& signature) const;

  static PaymentConfirmedEvent confirmationFrom(const WebhookEvent& event);
  static PaymentConfirmedEvent confirmationFrom(
      const std::string& reference, const GatewayVerification& verification);

  static PaymentFailedEvent failureFrom(const WebhookEvent& event);
  static PaymentFailedEvent failureFrom(
      const std::string& reference, const GatewayVerification& verification);

 private:
  IPaymentGateway& gateway_;
  WebhookSigner signer_;
};

}  // namespace agrovest
