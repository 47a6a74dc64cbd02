#include "agrovest/payment/mock_payment_gateway.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <utility>

namespace agrovest {

GatewaySession MockPaymentGateway::initialize(const std::string& reference,
                                              domain::Money amount,
                                              const PayerProfile& payer,
                                              const nlohmann::json& /*metadata*/) {
  std::lock_guard lock(mutex_);
  ++initialize_calls_;
  if (unavailable_) {
    throw EngineError(ErrorCode::GatewayUnavailable,
                      "Payment gateway timed out");
  }

  Session session;
  session.amount = amount;
  session.email = payer.email;
  session.gateway_id = std::to_string(next_gateway_id_++);
  sessions_[reference] = session;

  GatewaySession out;
  out.reference = reference;
  out.authorization_url = "https://checkout.mock.local/" + reference;
  out.access_code = "mock_" + session.gateway_id;
  return out;
}

GatewayVerification MockPaymentGateway::verify(const std::string& reference) {
  std::lock_guard lock(mutex_);
  ++verify_calls_;
  if (unavailable_) {
    throw EngineError(ErrorCode::GatewayUnavailable,
                      "Payment gateway timed out");
  }

  GatewayVerification result;
  auto it = sessions_.find(reference);
  if (it == sessions_.end()) {
    result.status = GatewayStatus::Failed;
    result.gateway_response = "Transaction reference not found";
    return result;
  }

  const Session& session = it->second;
  result.status = session.status;
  result.gateway_id = session.gateway_id;
  result.amount = session.amount;
  result.gateway_response = session.gateway_response;
  result.raw = {{"reference", reference},
                {"status", toString(session.status)},
                {"amount", session.amount.minor()},
                {"id", session.gateway_id},
                {"gateway_response", session.gateway_response}};
  return result;
}

void MockPaymentGateway::setOutcome(const std::string& reference,
                                    GatewayStatus status,
                                    std::string gateway_response) {
  std::lock_guard lock(mutex_);
  Session& session = sessions_[reference];
  if (session.gateway_id.empty()) {
    session.gateway_id = std::to_string(next_gateway_id_++);
  }
  session.status = status;
  session.gateway_response =
      gateway_response.empty() ? toString(status) : std::move(gateway_response);
}

void MockPaymentGateway::setUnavailable(bool unavailable) {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

int MockPaymentGateway::initializeCalls() const {
  std::lock_guard lock(mutex_);
  return initialize_calls_;
}

int MockPaymentGateway::verifyCalls() const {
  std::lock_guard lock(mutex_);
  return verify_calls_;
}

}  // namespace agrovest
