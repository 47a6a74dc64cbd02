#include "agrovest/lifecycle/transitions.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <utility>

namespace agrovest {

namespace {

TransitionRejection reject(const char* current, std::string reason) {
  return TransitionRejection{current, std::move(reason)};
}

template <typename State>
State unwrapOrThrow(const std::variant<State, TransitionRejection>& result) {
  if (const auto* rejection = std::get_if<TransitionRejection>(&result)) {
    throw EngineError(ErrorCode::InvalidTransition, rejection->reason,
                      rejection->current_state);
  }
  return std::get<State>(result);
}

}  // namespace

// -----------------------------------------------------------------------------
// nextInvestmentStatus
// -----------------------------------------------------------------------------
InvestmentTransition nextInvestmentStatus(
    domain::InvestmentStatus current, InvestmentTrigger trigger,
    const InvestmentTransitionContext& context) {
  using S = domain::InvestmentStatus;
  const char* name = domain::toString(current);

  switch (trigger) {
    case InvestmentTrigger::PaymentConfirmed:
      if (current != S::Pending) {
        return reject(name, std::string("Investment is already ") + name);
      }
      if (context.has_successful_payment) {
        return reject(name, "Investment already has a successful payment");
      }
      return S::Active;

    case InvestmentTrigger::Complete:
      if (current != S::Active) {
        return reject(name, "Only active investments can be completed");
      }
      if (!context.end_date.has_value() || context.now < *context.end_date) {
        return reject(name, "Investment is not yet due for completion");
      }
      return S::Completed;

    case InvestmentTrigger::Cancel:
      if (current != S::Pending) {
        return reject(name, "Only pending investments can be cancelled");
      }
      return S::Cancelled;

    case InvestmentTrigger::Reject:
      if (current != S::Pending) {
        return reject(name, "Only pending investments can be rejected");
      }
      return S::Cancelled;
  }

  return reject(name, "Unknown investment trigger");
}

// -----------------------------------------------------------------------------
// WithdrawalAction names
// -----------------------------------------------------------------------------
const char* toString(WithdrawalAction action) {
  switch (action) {
    case WithdrawalAction::Approve:    return "approve";
    case WithdrawalAction::Reject:     return "reject";
    case WithdrawalAction::MarkPaid:   return "mark_paid";
    case WithdrawalAction::MarkFailed: return "mark_failed";
  }
  return "unknown";
}

std::optional<WithdrawalAction> parseWithdrawalAction(const std::string& text) {
  if (text == "approve") return WithdrawalAction::Approve;
  if (text == "reject") return WithdrawalAction::Reject;
  if (text == "mark_paid") return WithdrawalAction::MarkPaid;
  if (text == "mark_failed") return WithdrawalAction::MarkFailed;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// nextWithdrawalStatus
// -----------------------------------------------------------------------------
WithdrawalTransition nextWithdrawalStatus(domain::WithdrawalStatus current,
                                          WithdrawalAction action) {
  using S = domain::WithdrawalStatus;
  const char* name = domain::toString(current);

  switch (action) {
    case WithdrawalAction::Approve:
      if (current == S::Pending || current == S::Failed) {
        return S::Approved;
      }
      return reject(name, std::string("Withdrawal is already ") + name);

    case WithdrawalAction::Reject:
      if (current == S::Pending) {
        return S::Rejected;
      }
      return reject(name, std::string("Withdrawal is already ") + name);

    case WithdrawalAction::MarkPaid:
      if (current == S::Approved) {
        return S::Completed;
      }
      return reject(name, "Only approved withdrawals can be marked as paid.");

    case WithdrawalAction::MarkFailed:
      if (current == S::Approved) {
        return S::Failed;
      }
      return reject(name,
                    "Only approved withdrawals can be marked as failed.");
  }

  return reject(name, "Unknown withdrawal action");
}

domain::InvestmentStatus requireTransition(const InvestmentTransition& result) {
  return unwrapOrThrow(result);
}

domain::WithdrawalStatus requireTransition(const WithdrawalTransition& result) {
  return unwrapOrThrow(result);
}

}  // namespace agrovest
