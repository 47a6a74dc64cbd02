#include "agrovest/payment/payment_adapter.hpp"

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace agrovest {

const char* toString(GatewayStatus status) {
  switch (status) {
    case GatewayStatus::Success: return "success";
    case GatewayStatus::Failed:  return "failed";
    case GatewayStatus::Pending: return "pending";
  }
  return "unknown";
}

PaymentAdapter::PaymentAdapter(IPaymentGateway& gateway, WebhookSigner signer)
    : gateway_(gateway), signer_(std::move(signer)) {}

std::string PaymentAdapter::makeReference(domain::PaymentId payment_id,
                                          domain::EpochMs now_ms) {
  return "INV_" + std::to_string(payment_id) + "_" +
         std::to_string(ms_to_epoch_seconds(now_ms));
}

GatewaySession PaymentAdapter::initialize(const std::string& reference,
                                          const domain::Investment& investment,
                                          domain::Money amount,
                                          const PayerProfile& payer) {
  if (payer.email.empty()) {
    throw EngineError(ErrorCode::Validation, "Payer email is required");
  }
  if (!amount.isPositive()) {
    throw EngineError(ErrorCode::Validation, "Amount must be positive");
  }

  nlohmann::json metadata;
  metadata["investment_id"] = investment.id;
  metadata["package_id"] = investment.package_id;
  metadata["user_id"] = investment.user_id;
  metadata["full_name"] = payer.full_name;

  return gateway_.initialize(reference, amount, payer, metadata);
}

GatewayVerification PaymentAdapter::verify(const std::string& reference) {
  return gateway_.verify(reference);
}

// -----------------------------------------------------------------------------
// handleWebhook(): authenticate, then normalize
// -----------------------------------------------------------------------------
WebhookEvent PaymentAdapter::handleWebhook(const std::string& raw_body,
                                           const std::string& signature) const {
  // ---  1) Signature over the exact received bytes --------------------------
  if (!signer_.verify(raw_body, signature)) {
    std::cerr << "[PaymentAdapter] WARNING: rejected webhook with invalid "
                 "signature.\n";
    throw EngineError(ErrorCode::InvalidSignature, "Invalid signature");
  }

  // ---  2) Parse ------------------------------------------------------------
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(raw_body);
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::Validation,
                      std::string("Malformed webhook body: ") + e.what());
  }

  WebhookEvent event;
  try {
    event.event_name = payload.at("event").get<std::string>();
    const nlohmann::json& data = payload.at("data");
    event.reference = data.at("reference").get<std::string>();

    if (data.contains("id") && !data["id"].is_null()) {
      event.gateway_id = data["id"].is_string() ? data["id"].get<std::string>()
                                                : data["id"].dump();
    }
    if (data.contains("amount") && data["amount"].is_number_integer()) {
      event.amount =
          domain::Money::fromMinor(data["amount"].get<std::int64_t>());
    }
    if (data.contains("gateway_response") &&
        data["gateway_response"].is_string()) {
      event.gateway_response = data["gateway_response"].get<std::string>();
    }
    event.data = data;
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::Validation,
                      std::string("Webhook missing required field: ") +
                          e.what());
  }

  if (event.reference.empty()) {
    throw EngineError(ErrorCode::Validation, "Webhook reference is empty");
  }

  // ---  3) Classify ---------------------------------------------------------
  if (event.event_name == "charge.success") {
    event.kind = WebhookEventKind::ChargeSuccess;
  } else if (event.event_name == "charge.failed") {
    event.kind = WebhookEventKind::ChargeFailed;
  } else {
    event.kind = WebhookEventKind::Other;
  }
  return event;
}

// -----------------------------------------------------------------------------
// Normalization into the lifecycle's input events
// -----------------------------------------------------------------------------
PaymentConfirmedEvent PaymentAdapter::confirmationFrom(
    const WebhookEvent& event) {
  PaymentConfirmedEvent confirmed;
  confirmed.reference = event.reference;
  confirmed.gateway_id = event.gateway_id;
  confirmed.amount = event.amount;
  confirmed.source = ConfirmationSource::Webhook;
  confirmed.gateway_data = event.data;
  return confirmed;
}

PaymentConfirmedEvent PaymentAdapter::confirmationFrom(
    const std::string& reference, const GatewayVerification& verification) {
  PaymentConfirmedEvent confirmed;
  confirmed.reference = reference;
  confirmed.gateway_id = verification.gateway_id;
  if (verification.amount.isPositive()) {
    confirmed.amount = verification.amount;
  }
  confirmed.source = ConfirmationSource::Verify;
  confirmed.gateway_data = verification.raw;
  return confirmed;
}

PaymentFailedEvent PaymentAdapter::failureFrom(const WebhookEvent& event) {
  PaymentFailedEvent failed;
  failed.reference = event.reference;
  failed.reason = event.gateway_response.empty() ? event.event_name
                                                 : event.gateway_response;
  failed.source = ConfirmationSource::Webhook;
  return failed;
}

PaymentFailedEvent PaymentAdapter::failureFrom(
    const std::string& reference, const GatewayVerification& verification) {
  PaymentFailedEvent failed;
  failed.reference = reference;
  failed.reason = verification.gateway_response.empty()
                      ? "Payment verification failed"
                      : verification.gateway_response;
  failed.source = ConfirmationSource::Verify;
  return failed;
}

}  // namespace agrovest
