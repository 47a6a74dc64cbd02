#include "agrovest/errors/engine_error.hpp"

#include <utility>

namespace agrovest {

EngineError::EngineError(ErrorCode code, const std::string& message,
                         std::string current_state)
    : std::runtime_error(message),
      code_(code),
      current_state_(std::move(current_state)) {}

const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation:            return "validation_error";
    case ErrorCode::NotFound:              return "not_found";
    case ErrorCode::InvalidTransition:     return "invalid_transition";
    case ErrorCode::OutOfStock:            return "out_of_stock";
    case ErrorCode::Contention:            return "contention";
    case ErrorCode::GatewayUnavailable:    return "gateway_unavailable";
    case ErrorCode::InvalidSignature:      return "invalid_signature";
    case ErrorCode::NoEligibleInvestments: return "no_eligible_investments";
    case ErrorCode::Internal:              return "internal";
  }
  return "internal";
}

int httpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation:
    case ErrorCode::InvalidTransition:
    case ErrorCode::InvalidSignature:
    case ErrorCode::NoEligibleInvestments:
      return 400;
    case ErrorCode::NotFound:
      return 404;
    case ErrorCode::OutOfStock:
    case ErrorCode::Contention:
      return 409;
    case ErrorCode::GatewayUnavailable:
      return 503;
    case ErrorCode::Internal:
      return 500;
  }
  return 500;
}

}  // namespace agrovest
