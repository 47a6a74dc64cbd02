#pragma once

#include "agrovest/payment/i_payment_gateway.hpp"

#include <string>

namespace agrovest {

struct PaystackSettings {
  std::string base_url{"https://api.paystack.co"};
  std::string secret_key;
  std::string callback_url;
  long timeout_ms{10000};
};

// -----------------------------------------------------------------------------
// PaystackGateway: REST client for the Paystack transaction API
// -----------------------------------------------------------------------------
//
// @brief  initialize():  POST /transaction/initialize
//         verify():      GET  /transaction/verify/<reference>
//
// @details
// Authenticates with "Authorization: Bearer <secret_key>". Amounts travel as
// integer kobo. Each call builds its own curl easy handle, so concurrent
// calls do not share state. CURLOPT_TIMEOUT_MS bounds the whole exchange.
//
// Any transport failure, timeout, non-2xx status, unparsable body or
// {"status": false} answer throws EngineError(GatewayUnavailable).
//
// Gateway statuses map as: success -> Success; failed, reversed,
// abandoned -> Failed; anything else (ongoing, pending, queued) -> Pending.
// -----------------------------------------------------------------------------
class PaystackGateway final : public IPaymentGateway {
 public:
  explicit PaystackGateway(PaystackSettings settings);

  GatewaySession initialize(const std::string& reference, domain::Money amount,
                            const PayerProfile& payer,
                            const nlohmann::json& metadata) override;

  GatewayVerification verify(const std::string& reference) override;

  static GatewayStatus mapStatus(const std::string& gateway_status);

 private:
  // Returns the parsed "data" object of a successful answer.
  nlohmann::json perform(const std::string& method, const std::string& path,
                         const std::string& body) const;

  PaystackSettings settings_;
};

}  // namespace agrovest
