#pragma once

#include "agrovest/payment/i_payment_gateway.hpp"

#include <map>
#include <mutex>
#include <string>

namespace agrovest {

// -----------------------------------------------------------------------------
// MockPaymentGateway: scripted IPaymentGateway
// -----------------------------------------------------------------------------
//
// @brief  In-memory gateway for tests and for running the engine without
//         network access (gateway.mode = "mock").
//
// @details
// initialize() opens a session whose verify() answer is Pending until a
// test scripts it with setOutcome(). verify() of a reference that was never
// initialized answers Failed ("Transaction reference not found").
// setUnavailable(true) makes both calls throw
// EngineError(GatewayUnavailable), simulating a timeout.
//
// Thread-safety: All methods lock an internal mutex.
// -----------------------------------------------------------------------------
class MockPaymentGateway final : public IPaymentGateway {
 public:
  MockPaymentGateway() = default;

  GatewaySession initialize(const std::string& reference, domain::Money amount,
                            const PayerProfile& payer,
                            const nlohmann::json& metadata) override;

  GatewayVerification verify(const std::string& reference) override;

  // Scripts the answer verify() gives for reference. The reported amount
  // defaults to the initialized amount.
  void setOutcome(const std::string& reference, GatewayStatus status,
                  std::string gateway_response = "");

  void setUnavailable(bool unavailable);

  int initializeCalls() const;
  int verifyCalls() const;

 private:
  struct Session {
    domain::Money amount;
    std::string email;
    GatewayStatus status{GatewayStatus::Pending};
    std::string gateway_response{"Pending"};
    std::string gateway_id;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Session> sessions_;
  bool unavailable_{false};
  int initialize_calls_{0};
  int verify_calls_{0};
  std::uint64_t next_gateway_id_{1000};
};

}  // namespace agrovest
