#include "agrovest/withdrawal/withdrawal_processor.hpp"

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <utility>

namespace agrovest {

namespace {

constexpr const char* kComponent = "WithdrawalProcessor";

const char* noteFor(WithdrawalAction action) {
  switch (action) {
    case WithdrawalAction::Approve:    return "Approved by admin.";
    case WithdrawalAction::Reject:     return "Rejected by admin.";
    case WithdrawalAction::MarkPaid:   return "Marked as paid manually by admin.";
    case WithdrawalAction::MarkFailed: return "Marked as failed by admin.";
  }
  return "";
}

void appendNote(std::string& notes, const std::string& line) {
  if (!notes.empty()) {
    notes += "\n";
  }
  notes += line;
}

WithdrawalUpdateEvent withdrawalUpdate(
    const domain::WithdrawalRequest& withdrawal,
    std::optional<domain::WithdrawalStatus> previous) {
  WithdrawalUpdateEvent event;
  event.withdrawal = withdrawal;
  event.previous_status = previous;
  return event;
}

}  // namespace

WithdrawalProcessor::WithdrawalProcessor(Store& store, const Ledger& ledger,
                                         const ITimeProvider& clock,
                                         EventSink sink)
    : store_(store), ledger_(ledger), clock_(clock), sink_(std::move(sink)) {}

bool WithdrawalProcessor::eligible(const domain::Investment& investment,
                                   domain::UserId user) {
  return investment.user_id == user &&
         investment.status == domain::InvestmentStatus::Completed &&
         !investment.withdrawal_id.has_value();
}

domain::Money WithdrawalProcessor::computeAmount(
    domain::WithdrawalType type,
    const std::vector<domain::Investment>& investments) {
  domain::Money returns;
  domain::Money principal;
  for (const auto& inv : investments) {
    returns += inv.actual_return;
    principal += inv.amount;
  }

  switch (type) {
    case domain::WithdrawalType::Interest:
    case domain::WithdrawalType::Reinvest:
      return returns - principal;
    case domain::WithdrawalType::Full:
      return returns;
  }
  return returns;
}

// -----------------------------------------------------------------------------
// createWithdrawal()
// -----------------------------------------------------------------------------
domain::WithdrawalRequest WithdrawalProcessor::createWithdrawal(
    domain::UserId user, domain::WithdrawalType type,
    const std::optional<std::vector<domain::InvestmentId>>& investment_ids) {
  // An empty selection means every eligible investment.
  const bool selecting =
      investment_ids.has_value() && !investment_ids->empty();
  const char* none_message =
      selecting
          ? "No valid investments selected"
          : "No completed investments available for withdrawal";

  return withContentionRetry(kComponent, [&] {
    // ---  1) Candidates from committed state --------------------------------
    std::set<domain::InvestmentId> wanted;
    if (selecting) {
      wanted.insert(investment_ids->begin(), investment_ids->end());
    }

    std::vector<domain::InvestmentId> candidates;
    for (const auto& inv : store_.investmentsForUser(user)) {
      if (!eligible(inv, user)) {
        continue;
      }
      if (selecting && wanted.count(inv.id) == 0) {
        continue;
      }
      candidates.push_back(inv.id);
    }
    std::sort(candidates.begin(), candidates.end());

    if (candidates.empty()) {
      throw EngineError(ErrorCode::NoEligibleInvestments, none_message);
    }

    UnitOfWork unit(store_, clock_, sink_);
    auto& txn = unit.txn();

    // ---  2) Lock ascending, re-check under the locks ------------------------
    std::vector<domain::Investment> selected;
    for (domain::InvestmentId id : candidates) {
      txn.lockInvestment(id);
      auto inv = txn.investment(id);
      if (inv.has_value() && eligible(*inv, user)) {
        selected.push_back(*inv);
      }
    }
    if (selected.empty()) {
      throw EngineError(ErrorCode::NoEligibleInvestments, none_message);
    }

    // ---  3) Amount ------------------------------------------------------------
    const domain::Money amount = computeAmount(type, selected);
    if (amount.isNegative()) {
      throw EngineError(ErrorCode::Validation,
                        "Withdrawal amount would be negative (" +
                            amount.toString() + ")");
    }

    // ---  4) Request + links ---------------------------------------------------
    domain::WithdrawalRequest draft;
    draft.user_id = user;
    draft.amount = amount;
    draft.type = type;
    draft.status = domain::WithdrawalStatus::Pending;
    draft.created_at = clock_.now_ms();
    for (const auto& inv : selected) {
      draft.investment_ids.push_back(inv.id);
    }
    domain::WithdrawalRequest request = txn.insert(draft);

    for (auto& inv : selected) {
      if (inv.withdrawal_id.has_value()) {
        throw EngineError(ErrorCode::Internal,
                          "Investment " + std::to_string(inv.id) +
                              " is already linked to a withdrawal");
      }
      inv.withdrawal_id = request.id;
      txn.update(inv);
      unit.emit(InvestmentUpdateEvent{inv, inv.status, false, {}});
    }

    unit.emit(withdrawalUpdate(request, std::nullopt));
    unit.commit();

    std::cout << "[WithdrawalProcessor] withdrawal " << request.id
              << " created. user=" << user << " type=" << domain::toString(type)
              << " amount=" << amount.toString()
              << " investments=" << request.investment_ids.size() << "\n";
    return request;
  });
}

// -----------------------------------------------------------------------------
// applyAction()
// -----------------------------------------------------------------------------
domain::WithdrawalRequest WithdrawalProcessor::applyAction(
    domain::WithdrawalId id, WithdrawalAction action) {
  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    auto& txn = unit.txn();
    txn.lockWithdrawal(id);
    auto request = txn.withdrawal(id);
    if (!request.has_value()) {
      throw EngineError(ErrorCode::NotFound,
                        "Withdrawal " + std::to_string(id) + " not found");
    }

    const domain::WithdrawalStatus previous = request->status;
    request->status =
        requireTransition(nextWithdrawalStatus(request->status, action));

    const domain::EpochMs now = clock_.now_ms();
    switch (action) {
      case WithdrawalAction::Approve:
        request->processed_date = now;
        request->payment_reference =
            "PAY-" + std::to_string(ms_to_epoch_seconds(now));
        break;
      case WithdrawalAction::MarkPaid: {
        request->processed_date = now;
        domain::LedgerEntry entry;
        entry.user_id = request->user_id;
        entry.type = domain::TransactionType::Withdrawal;
        entry.amount = request->amount;
        entry.status = domain::TransactionStatus::Completed;
        entry.description = std::string("Withdrawal payout (") +
                            domain::toString(request->type) + ")";
        entry.payment_reference = request->payment_reference;
        entry = ledger_.record(txn, entry);
        unit.emit(LedgerEntryEvent{entry, {}});
        break;
      }
      case WithdrawalAction::Reject:
        request->processed_date = now;
        break;
      case WithdrawalAction::MarkFailed:
        break;
    }
    appendNote(request->admin_notes, noteFor(action));

    txn.update(*request);
    unit.emit(withdrawalUpdate(*request, previous));
    unit.commit();

    std::cout << "[WithdrawalProcessor] withdrawal " << id << " "
              << domain::toString(previous) << " -> "
              << domain::toString(request->status) << " (" << toString(action)
              << ")\n";
    return *request;
  });
}

// -----------------------------------------------------------------------------
// updateNotes()
// -----------------------------------------------------------------------------
domain::WithdrawalRequest WithdrawalProcessor::updateNotes(
    domain::WithdrawalId id, const std::string& notes) {
  if (notes.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw EngineError(ErrorCode::Validation, "Notes cannot be empty");
  }

  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    unit.txn().lockWithdrawal(id);
    auto request = unit.txn().withdrawal(id);
    if (!request.has_value()) {
      throw EngineError(ErrorCode::NotFound,
                        "Withdrawal " + std::to_string(id) + " not found");
    }
    request->admin_notes = notes;
    unit.txn().update(*request);
    unit.emit(withdrawalUpdate(*request, request->status));
    unit.commit();
    return *request;
  });
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<domain::Investment> WithdrawalProcessor::withdrawable(
    domain::UserId user) const {
  std::vector<domain::Investment> out;
  for (const auto& inv : store_.investmentsForUser(user)) {
    if (eligible(inv, user)) {
      out.push_back(inv);
    }
  }
  return out;
}

std::optional<domain::WithdrawalRequest> WithdrawalProcessor::withdrawal(
    domain::WithdrawalId id) const {
  return store_.withdrawal(id);
}

std::vector<domain::WithdrawalRequest> WithdrawalProcessor::withdrawalsForUser(
    domain::UserId user) const {
  return store_.withdrawalsForUser(user);
}

}  // namespace agrovest
