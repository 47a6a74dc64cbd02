#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/lifecycle/investment_lifecycle.hpp"
#include "agrovest/payment/payment_adapter.hpp"
#include "agrovest/store/store.hpp"

#include <optional>
#include <string>

namespace agrovest {

enum class WebhookDisposition { Processed, AlreadyProcessed, Ignored };

const char* toString(WebhookDisposition disposition);

struct WebhookResult {
  WebhookDisposition disposition{WebhookDisposition::Ignored};
  std::string event_name;
  std::string reference;
  std::optional<domain::Payment> payment;
};

struct VerifyResult {
  GatewayStatus status{GatewayStatus::Pending};
  domain::Payment payment;
  bool already_processed{false};
  std::string message;
};

// -----------------------------------------------------------------------------
// PaymentReconciler
// -----------------------------------------------------------------------------
//
// @brief  Turns gateway notifications (webhook pushes and client-triggered
//         verifies) into lifecycle calls.
//
// @details
// Both paths end in the same two handlers:
//
//   webhook body --PaymentAdapter::handleWebhook--+
//                                                 +--> onPaymentConfirmed()
//   verify(ref)  --PaymentAdapter::verify---------+     onPaymentFailed()
//
// so a reference confirmed by both a webhook and a verify, in either order
// or concurrently, is applied once.
//
// Thread model: Stateless; safe from any request thread.
// Ownership:    Borrows everything.
// -----------------------------------------------------------------------------
class PaymentReconciler {
 public:
  PaymentReconciler(const Store& store, PaymentAdapter& adapter,
                    InvestmentLifecycle& lifecycle);

  // -------------------------------------------------------------------------
  // handleWebhook(raw_body, signature)
  // -------------------------------------------------------------------------
  // @throws EngineError  InvalidSignature before anything is parsed;
  //                      Validation for a malformed signed body; NotFound
  //                      for a charge event with an unknown reference; and
  //                      whatever the lifecycle raises.
  // Events other than charge.success / charge.failed are Ignored.
  // -------------------------------------------------------------------------
  WebhookResult handleWebhook(const std::string& raw_body,
                              const std::string& signature);

  // -------------------------------------------------------------------------
  // verify(user, reference)
  // -------------------------------------------------------------------------
  // Client-triggered status check. A payment that is already Success is
  // reported without calling the gateway. Otherwise the gateway answer is
  // applied: Success confirms, Failed fails, Pending changes nothing.
  //
  // @throws EngineError  Validation (empty reference), NotFound (unknown
  //                      reference or owned by another user),
  //                      GatewayUnavailable.
  // -------------------------------------------------------------------------
  VerifyResult verify(domain::UserId user, const std::string& reference);

 private:
  const Store& store_;
  PaymentAdapter& adapter_;
  InvestmentLifecycle& lifecycle_;
};

}  // namespace agrovest
