#pragma once

#include "agrovest/domain/money.hpp"
#include "agrovest/domain/records.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace agrovest {

// Who is paying. Passed through to the gateway checkout page.
struct PayerProfile {
  domain::UserId user_id{0};
  std::string email;
  std::string full_name;
};

// A checkout session opened at the gateway.
struct GatewaySession {
  std::string reference;
  std::string authorization_url;
  std::string access_code;
};

enum class GatewayStatus { Success, Failed, Pending };

const char* toString(GatewayStatus status);

// The gateway's view of one reference.
struct GatewayVerification {
  GatewayStatus status{GatewayStatus::Pending};
  std::string gateway_id;
  domain::Money amount;
  std::string gateway_response;   // e.g. "Approved", "Declined"
  nlohmann::json raw = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// IPaymentGateway: abstract payment gateway client
// -----------------------------------------------------------------------------
//
// @brief  Outbound calls to the hosted payment gateway.
//
// @details
// Implementations:
//   - PaystackGateway:     REST over libcurl.
//   - MockPaymentGateway:  scripted answers for tests and offline runs.
//
// Both calls are bounded by a timeout. A timeout, transport error or non-2xx
// answer throws EngineError(GatewayUnavailable). Callers invoke the gateway
// outside any Store transaction and write nothing when it throws.
//
// Thread-safety: Implementations must tolerate concurrent calls.
// -----------------------------------------------------------------------------
class IPaymentGateway {
 public:
  virtual ~IPaymentGateway() = default;

  virtual GatewaySession initialize(const std::string& reference,
                                    domain::Money amount,
                                    const PayerProfile& payer,
                                    const nlohmann::json& metadata) = 0;

  virtual GatewayVerification verify(const std::string& reference) = 0;
};

}  // namespace agrovest
