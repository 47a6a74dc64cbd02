#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/domain/statuses.hpp"

#include <optional>
#include <string>
#include <variant>

namespace agrovest {

// -----------------------------------------------------------------------------
// TransitionRejection
// -----------------------------------------------------------------------------
// Returned instead of a next state when a trigger is not allowed. Carries
// the state the record was in, so callers can report it unchanged.
// -----------------------------------------------------------------------------
struct TransitionRejection {
  std::string current_state;
  std::string reason;
};

// =============================================================================
// Investment state machine
// =============================================================================

enum class InvestmentTrigger { PaymentConfirmed, Complete, Cancel, Reject };

// Everything the transition decision depends on, gathered by the caller
// under the relevant row locks.
struct InvestmentTransitionContext {
  // True if some Payment of this investment is already Success.
  bool has_successful_payment{false};
  domain::EpochMs now{0};
  std::optional<domain::EpochMs> end_date;
};

using InvestmentTransition =
    std::variant<domain::InvestmentStatus, TransitionRejection>;

// -----------------------------------------------------------------------------
// nextInvestmentStatus(current, trigger, context)
// -----------------------------------------------------------------------------
//
// @brief  Pure transition function for Investment.status.
//
// @details
//   PaymentConfirmed: Pending -> Active, unless a payment already succeeded.
//   Complete:         Active -> Completed, only once now >= end_date.
//   Cancel:           Pending -> Cancelled (owner).
//   Reject:           Pending -> Cancelled (admin).
// Completed and Cancelled accept no trigger.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------
InvestmentTransition nextInvestmentStatus(
    domain::InvestmentStatus current, InvestmentTrigger trigger,
    const InvestmentTransitionContext& context);

// =============================================================================
// Withdrawal state machine
// =============================================================================

enum class WithdrawalAction { Approve, Reject, MarkPaid, MarkFailed };

const char* toString(WithdrawalAction action);

// Accepts the wire names "approve", "reject", "mark_paid", "mark_failed".
std::optional<WithdrawalAction> parseWithdrawalAction(const std::string& text);

using WithdrawalTransition =
    std::variant<domain::WithdrawalStatus, TransitionRejection>;

// -----------------------------------------------------------------------------
// nextWithdrawalStatus(current, action)
// -----------------------------------------------------------------------------
//   Approve:    Pending | Failed -> Approved
//   Reject:     Pending -> Rejected
//   MarkPaid:   Approved -> Completed
//   MarkFailed: Approved -> Failed
// -----------------------------------------------------------------------------
WithdrawalTransition nextWithdrawalStatus(domain::WithdrawalStatus current,
                                          WithdrawalAction action);

// -----------------------------------------------------------------------------
// requireTransition(result)
// -----------------------------------------------------------------------------
// Unwraps the next state or throws EngineError(InvalidTransition) carrying
// the rejection's reason and current state.
// -----------------------------------------------------------------------------
domain::InvestmentStatus requireTransition(const InvestmentTransition& result);
domain::WithdrawalStatus requireTransition(const WithdrawalTransition& result);

}  // namespace agrovest
