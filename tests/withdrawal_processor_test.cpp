// =============================================================================
// withdrawal_processor_test.cpp
// =============================================================================
// Tests for agrovest::WithdrawalProcessor.
//
// Validates:
//   - Amount rules per withdrawal type
//   - An investment is linked to at most one request, even under races
//   - Admin actions follow the withdrawal state machine and append notes
//   - mark_paid records the payout in the ledger
// =============================================================================

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/withdrawal/withdrawal_processor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <future>
#include <optional>
#include <set>
#include <vector>

using agrovest::EngineError;
using agrovest::ErrorCode;
using agrovest::WithdrawalAction;
using agrovest::WithdrawalProcessor;
namespace domain = agrovest::domain;
namespace ts = agrovest::test_support;

class WithdrawalProcessorTest : public ::testing::Test {
 protected:
  ts::LifecycleHarness h;
  WithdrawalProcessor withdrawals{h.store, h.ledger, h.clock,
                                  h.recorder.sink()};

  // Active at "now", completed after the package duration.
  domain::Investment completed(domain::UserId user, std::int32_t rate_bps,
                               domain::Money amount) {
    auto pkg = h.makePackage(domain::PackageKind::Direct, 10, rate_bps, 30);
    auto inv = h.activeInvestment(user, pkg.id, amount);
    h.clock.advance_by(30 * domain::kMsPerDay);
    return h.lifecycle.complete(user, inv.id);
  }

  // 100 -> 130 and 50 -> 55.
  std::vector<domain::Investment> twoCompleted(domain::UserId user = 1) {
    return {completed(user, 3000, ts::naira(100)),
            completed(user, 1000, ts::naira(50))};
  }

  ErrorCode codeOf(const std::function<void()>& fn) {
    try {
      fn();
    } catch (const EngineError& e) {
      return e.code();
    }
    ADD_FAILURE() << "expected EngineError";
    return ErrorCode::Internal;
  }
};

// --- 1) Amounts ---
TEST_F(WithdrawalProcessorTest, AmountPerType) {
  auto invs = twoCompleted();
  ASSERT_EQ(invs[0].actual_return, ts::naira(130));
  ASSERT_EQ(invs[1].actual_return, ts::naira(55));

  EXPECT_EQ(WithdrawalProcessor::computeAmount(domain::WithdrawalType::Full,
                                               invs),
            ts::naira(185));
  EXPECT_EQ(WithdrawalProcessor::computeAmount(
                domain::WithdrawalType::Interest, invs),
            ts::naira(35));
  EXPECT_EQ(WithdrawalProcessor::computeAmount(
                domain::WithdrawalType::Reinvest, invs),
            ts::naira(35));
}

TEST_F(WithdrawalProcessorTest, FullWithdrawalLinksAllCompleted) {
  auto invs = twoCompleted();
  ASSERT_EQ(withdrawals.withdrawable(1).size(), 2u);

  auto request = withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);

  EXPECT_EQ(request.status, domain::WithdrawalStatus::Pending);
  EXPECT_EQ(request.amount, ts::naira(185));
  EXPECT_EQ(request.investment_ids.size(), 2u);
  for (const auto& inv : invs) {
    EXPECT_EQ(h.store.investment(inv.id)->withdrawal_id, request.id);
  }
  EXPECT_TRUE(withdrawals.withdrawable(1).empty());
  EXPECT_EQ(withdrawals.withdrawalsForUser(1).size(), 1u);
}

TEST_F(WithdrawalProcessorTest, SelectedSubsetOnly) {
  auto invs = twoCompleted();
  auto request = withdrawals.createWithdrawal(
      1, domain::WithdrawalType::Interest,
      std::vector<domain::InvestmentId>{invs[1].id});

  EXPECT_EQ(request.amount, ts::naira(5));
  EXPECT_EQ(request.investment_ids,
            std::vector<domain::InvestmentId>{invs[1].id});
  EXPECT_FALSE(h.store.investment(invs[0].id)->withdrawal_id.has_value());
}

TEST_F(WithdrawalProcessorTest, EmptySelectionMeansAllCompleted) {
  auto invs = twoCompleted();
  auto request = withdrawals.createWithdrawal(
      1, domain::WithdrawalType::Full, std::vector<domain::InvestmentId>{});

  EXPECT_EQ(request.amount, ts::naira(185));
  EXPECT_EQ(request.investment_ids.size(), 2u);
  for (const auto& inv : invs) {
    EXPECT_EQ(h.store.investment(inv.id)->withdrawal_id, request.id);
  }
}

TEST_F(WithdrawalProcessorTest, NothingEligible) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 3);
  auto active = h.activeInvestment(1, pkg.id, ts::naira(100));

  try {
    withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);
    FAIL() << "expected NoEligibleInvestments";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NoEligibleInvestments);
    EXPECT_STREQ(e.what(), "No completed investments available for withdrawal");
  }

  try {
    withdrawals.createWithdrawal(
        1, domain::WithdrawalType::Full,
        std::vector<domain::InvestmentId>{active.id});
    FAIL() << "expected NoEligibleInvestments";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NoEligibleInvestments);
    EXPECT_STREQ(e.what(), "No valid investments selected");
  }
}

TEST_F(WithdrawalProcessorTest, OtherUsersInvestmentsAreNotEligible) {
  auto invs = twoCompleted(1);
  EXPECT_EQ(codeOf([&] {
              withdrawals.createWithdrawal(
                  2, domain::WithdrawalType::Full,
                  std::vector<domain::InvestmentId>{invs[0].id});
            }),
            ErrorCode::NoEligibleInvestments);
}

TEST_F(WithdrawalProcessorTest, NegativeInterestIsRejected) {
  auto loss = completed(1, -1000, ts::naira(100));
  ASSERT_EQ(loss.actual_return, ts::naira(90));

  EXPECT_EQ(codeOf([&] {
              withdrawals.createWithdrawal(1, domain::WithdrawalType::Interest);
            }),
            ErrorCode::Validation);
  EXPECT_FALSE(h.store.investment(loss.id)->withdrawal_id.has_value());
}

// --- 2) Races ---
// Why: two requests over the same completed investments must never pay
// the same investment twice.
TEST_F(WithdrawalProcessorTest, ConcurrentRequestsLinkEachInvestmentOnce) {
  auto invs = twoCompleted();

  auto attempt = [&]() -> std::optional<domain::WithdrawalRequest> {
    try {
      return withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);
    } catch (const EngineError& e) {
      EXPECT_EQ(e.code(), ErrorCode::NoEligibleInvestments);
      return std::nullopt;
    }
  };
  auto fa = std::async(std::launch::async, attempt);
  auto fb = std::async(std::launch::async, attempt);
  auto ra = fa.get();
  auto rb = fb.get();

  std::multiset<domain::InvestmentId> linked;
  domain::Money total;
  for (const auto& r : {ra, rb}) {
    if (r.has_value()) {
      linked.insert(r->investment_ids.begin(), r->investment_ids.end());
      total += r->amount;
    }
  }
  EXPECT_EQ(linked.size(), 2u);
  EXPECT_EQ(linked.count(invs[0].id), 1u);
  EXPECT_EQ(linked.count(invs[1].id), 1u);
  EXPECT_EQ(total, ts::naira(185));
}

// --- 3) Admin actions ---
TEST_F(WithdrawalProcessorTest, ApproveThenMarkPaidRecordsPayout) {
  twoCompleted();
  auto request = withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);

  auto approved = withdrawals.applyAction(request.id, WithdrawalAction::Approve);
  EXPECT_EQ(approved.status, domain::WithdrawalStatus::Approved);
  EXPECT_EQ(approved.payment_reference.rfind("PAY-", 0), 0u);
  EXPECT_TRUE(approved.processed_date.has_value());

  auto paid = withdrawals.applyAction(request.id, WithdrawalAction::MarkPaid);
  EXPECT_EQ(paid.status, domain::WithdrawalStatus::Completed);
  EXPECT_EQ(paid.admin_notes,
            "Approved by admin.\nMarked as paid manually by admin.");

  auto payouts =
      h.ledger.entriesByType(1, domain::TransactionType::Withdrawal);
  ASSERT_EQ(payouts.size(), 1u);
  EXPECT_EQ(payouts[0].amount, ts::naira(185));
  EXPECT_EQ(payouts[0].description, "Withdrawal payout (full)");
}

TEST_F(WithdrawalProcessorTest, MarkPaidRequiresApproval) {
  twoCompleted();
  auto request = withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);

  try {
    withdrawals.applyAction(request.id, WithdrawalAction::MarkPaid);
    FAIL() << "expected InvalidTransition";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidTransition);
    EXPECT_EQ(e.currentState(), "pending");
  }

  auto unchanged = withdrawals.withdrawal(request.id);
  EXPECT_EQ(unchanged->status, domain::WithdrawalStatus::Pending);
  EXPECT_TRUE(unchanged->admin_notes.empty());
  EXPECT_TRUE(
      h.ledger.entriesByType(1, domain::TransactionType::Withdrawal).empty());
}

TEST_F(WithdrawalProcessorTest, FailedPayoutCanBeApprovedAgain) {
  twoCompleted();
  auto request = withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);
  withdrawals.applyAction(request.id, WithdrawalAction::Approve);
  auto failed = withdrawals.applyAction(request.id, WithdrawalAction::MarkFailed);
  EXPECT_EQ(failed.status, domain::WithdrawalStatus::Failed);

  auto again = withdrawals.applyAction(request.id, WithdrawalAction::Approve);
  EXPECT_EQ(again.status, domain::WithdrawalStatus::Approved);

  EXPECT_EQ(codeOf([&] {
              withdrawals.applyAction(request.id, WithdrawalAction::Reject);
            }),
            ErrorCode::InvalidTransition);
}

TEST_F(WithdrawalProcessorTest, RejectStampsProcessedDate) {
  twoCompleted();
  auto request = withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);
  EXPECT_FALSE(request.processed_date.has_value());

  h.clock.advance_by(domain::kMsPerDay);
  auto rejected = withdrawals.applyAction(request.id, WithdrawalAction::Reject);
  EXPECT_EQ(rejected.status, domain::WithdrawalStatus::Rejected);
  EXPECT_EQ(rejected.processed_date, h.clock.now_ms());
  EXPECT_TRUE(rejected.payment_reference.empty());
}

TEST_F(WithdrawalProcessorTest, NotesReplaceAndRejectBlank) {
  twoCompleted();
  auto request = withdrawals.createWithdrawal(1, domain::WithdrawalType::Full);

  auto noted = withdrawals.updateNotes(request.id, "Called the bank");
  EXPECT_EQ(noted.admin_notes, "Called the bank");

  EXPECT_EQ(codeOf([&] { withdrawals.updateNotes(request.id, "  \n"); }),
            ErrorCode::Validation);
  EXPECT_EQ(codeOf([&] { withdrawals.updateNotes(999, "x"); }),
            ErrorCode::NotFound);
  EXPECT_EQ(withdrawals.withdrawal(request.id)->admin_notes,
            "Called the bank");
}
