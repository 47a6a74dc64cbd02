#pragma once

#include <stdexcept>
#include <string>

namespace agrovest {

// -----------------------------------------------------------------------------
// ErrorCode
// -----------------------------------------------------------------------------
// Closed set of failure kinds an engine operation can report. The command
// layer maps each kind to an HTTP-style status code (see httpStatusFor()).
// -----------------------------------------------------------------------------
enum class ErrorCode {
  Validation,
  NotFound,
  InvalidTransition,
  OutOfStock,
  Contention,
  GatewayUnavailable,
  InvalidSignature,
  NoEligibleInvestments,
  Internal
};

const char* errorCodeToString(ErrorCode code);

// 400 / 404 / 409 / 503 / 500 depending on the kind.
int httpStatusFor(ErrorCode code);

// -----------------------------------------------------------------------------
// EngineError
// -----------------------------------------------------------------------------
//
// @brief  The single exception type thrown by engine components.
//
// @details
// Carries an ErrorCode next to the human-readable message. Transition
// rejections also carry the state the record was in when the request was
// refused, so the caller can report it back ("Withdrawal is already
// rejected").
//
// Throwing an EngineError inside a Store::Transaction scope unwinds the
// transaction, which discards every staged write.
// -----------------------------------------------------------------------------
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorCode code, const std::string& message,
              std::string current_state = {});

  ErrorCode code() const { return code_; }

  // Empty unless code() == ErrorCode::InvalidTransition.
  const std::string& currentState() const { return current_state_; }

  // The engine retries a unit of work once on these.
  bool retryable() const { return code_ == ErrorCode::Contention; }

  // Worth retrying later from the caller's side: inventory or locks may
  // free up, the gateway may come back.
  bool callerRetryable() const {
    return code_ == ErrorCode::Contention || code_ == ErrorCode::OutOfStock ||
           code_ == ErrorCode::GatewayUnavailable;
  }

 private:
  ErrorCode code_;
  std::string current_state_;
};

}  // namespace agrovest
