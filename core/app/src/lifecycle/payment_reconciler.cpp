#include "agrovest/lifecycle/payment_reconciler.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <iostream>

namespace agrovest {

const char* toString(WebhookDisposition disposition) {
  switch (disposition) {
    case WebhookDisposition::Processed:        return "processed";
    case WebhookDisposition::AlreadyProcessed: return "already_processed";
    case WebhookDisposition::Ignored:          return "ignored";
  }
  return "unknown";
}

PaymentReconciler::PaymentReconciler(const Store& store,
                                     PaymentAdapter& adapter,
                                     InvestmentLifecycle& lifecycle)
    : store_(store), adapter_(adapter), lifecycle_(lifecycle) {}

// -----------------------------------------------------------------------------
// handleWebhook()
// -----------------------------------------------------------------------------
WebhookResult PaymentReconciler::handleWebhook(const std::string& raw_body,
                                               const std::string& signature) {
  // Throws InvalidSignature before the body is even parsed.
  const WebhookEvent event = adapter_.handleWebhook(raw_body, signature);

  WebhookResult result;
  result.event_name = event.event_name;
  result.reference = event.reference;

  if (event.kind == WebhookEventKind::Other) {
    std::cout << "[PaymentReconciler] ignoring webhook event "
              << event.event_name << " for " << event.reference << "\n";
    result.disposition = WebhookDisposition::Ignored;
    return result;
  }

  const ConfirmationResult applied =
      event.kind == WebhookEventKind::ChargeSuccess
          ? lifecycle_.onPaymentConfirmed(PaymentAdapter::confirmationFrom(event))
          : lifecycle_.onPaymentFailed(PaymentAdapter::failureFrom(event));

  result.payment = applied.payment;
  result.disposition = applied.outcome == ConfirmationOutcome::Applied
                           ? WebhookDisposition::Processed
                           : WebhookDisposition::AlreadyProcessed;
  return result;
}

// -----------------------------------------------------------------------------
// verify()
// -----------------------------------------------------------------------------
VerifyResult PaymentReconciler::verify(domain::UserId user,
                                       const std::string& reference) {
  if (reference.empty()) {
    throw EngineError(ErrorCode::Validation, "Payment reference is required");
  }

  auto payment = store_.paymentByReference(reference);
  if (!payment.has_value() || (user != 0 && payment->user_id != user)) {
    throw EngineError(ErrorCode::NotFound, "Payment not found");
  }

  VerifyResult result;

  // ---  1) Already settled: answer from the record -------------------------
  if (payment->status == domain::PaymentStatus::Success) {
    result.status = GatewayStatus::Success;
    result.payment = *payment;
    result.already_processed = true;
    result.message = "Payment already verified";
    return result;
  }

  // ---  2) Ask the gateway (outside any transaction) -----------------------
  const GatewayVerification verification = adapter_.verify(reference);
  result.status = verification.status;

  // ---  3) Apply ------------------------------------------------------------
  switch (verification.status) {
    case GatewayStatus::Success: {
      const ConfirmationResult applied = lifecycle_.onPaymentConfirmed(
          PaymentAdapter::confirmationFrom(reference, verification));
      result.payment = applied.payment;
      result.already_processed =
          applied.outcome == ConfirmationOutcome::AlreadyProcessed;
      result.message = "Payment verified successfully";
      break;
    }
    case GatewayStatus::Failed: {
      const ConfirmationResult applied = lifecycle_.onPaymentFailed(
          PaymentAdapter::failureFrom(reference, verification));
      result.payment = applied.payment;
      result.already_processed =
          applied.outcome == ConfirmationOutcome::AlreadyProcessed;
      result.message = verification.gateway_response.empty()
                           ? "Payment verification failed"
                           : verification.gateway_response;
      break;
    }
    case GatewayStatus::Pending:
      result.payment = *payment;
      result.message = "Payment is still pending";
      break;
  }

  std::cout << "[PaymentReconciler] verify " << reference << " -> "
            << toString(result.status)
            << (result.already_processed ? " (already processed)" : "")
            << "\n";
  return result;
}

}  // namespace agrovest
