#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/events/event.hpp"
#include "agrovest/ledger/ledger.hpp"
#include "agrovest/lifecycle/transitions.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/store/unit_of_work.hpp"
#include "agrovest/time/i_time_provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace agrovest {

// -----------------------------------------------------------------------------
// WithdrawalProcessor
// -----------------------------------------------------------------------------
//
// @brief  Aggregates completed investments into WithdrawalRequests and
//         drives them through admin settlement.
//
// @details
// createWithdrawal() runs as one unit:
//   1. pick candidates from committed state (completed, unlinked, owned,
//      optionally restricted to the requested ids),
//   2. lock them in ascending id order and re-check eligibility under the
//      locks,
//   3. insert the Pending request and link every remaining investment.
// Two overlapping requests serialize on the investment locks; the second
// one sees the links written by the first and leaves those investments out.
//
// Amount:
//   interest, reinvest:  sum(actual_return) - sum(amount)
//   full:                sum(actual_return)
//
// Admin actions go through nextWithdrawalStatus(). A rejected action throws
// EngineError(InvalidTransition) before anything is staged.
//
// Thread model: Stateless; safe from any request thread.
// -----------------------------------------------------------------------------
class WithdrawalProcessor {
 public:
  WithdrawalProcessor(Store& store, const Ledger& ledger,
                      const ITimeProvider& clock, EventSink sink);

  WithdrawalProcessor(const WithdrawalProcessor&) = delete;
  WithdrawalProcessor& operator=(const WithdrawalProcessor&) = delete;

  // @throws EngineError  NoEligibleInvestments, Validation (negative amount).
  domain::WithdrawalRequest createWithdrawal(
      domain::UserId user, domain::WithdrawalType type,
      const std::optional<std::vector<domain::InvestmentId>>& investment_ids =
          std::nullopt);

  // approve / reject / mark_paid / mark_failed. Each appends a line to
  // admin_notes. mark_paid also records a "withdrawal" ledger entry.
  domain::WithdrawalRequest applyAction(domain::WithdrawalId id,
                                        WithdrawalAction action);

  // Replaces admin_notes. Empty notes are a Validation error.
  domain::WithdrawalRequest updateNotes(domain::WithdrawalId id,
                                        const std::string& notes);

  // Completed investments of the user not yet linked to a request.
  std::vector<domain::Investment> withdrawable(domain::UserId user) const;

  std::optional<domain::WithdrawalRequest> withdrawal(
      domain::WithdrawalId id) const;
  std::vector<domain::WithdrawalRequest> withdrawalsForUser(
      domain::UserId user) const;

  static domain::Money computeAmount(
      domain::WithdrawalType type,
      const std::vector<domain::Investment>& investments);

 private:
  static bool eligible(const domain::Investment& investment,
                       domain::UserId user);

  Store& store_;
  const Ledger& ledger_;
  const ITimeProvider& clock_;
  EventSink sink_;
};

}  // namespace agrovest
