// =============================================================================
// investment_lifecycle_test.cpp
// =============================================================================
// Tests for agrovest::InvestmentLifecycle against a real Store, allocator,
// ledger and the scripted gateway.
//
// Validates:
//   - Confirmation applies exactly once per reference
//   - Last direct slot: one activation, the other flagged for reconciliation
//   - Failure keeps the investment pending and payable
//   - Cancel refunds, releases and (optionally) purges in one unit
//   - Completion gated on end_date, return from the package rate
//   - Admin approval, duplicate charges, amount mismatch
//   - Gateway outage at payment start writes nothing
// =============================================================================

#include "agrovest/errors/engine_error.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <future>
#include <string>
#include <vector>

using agrovest::ConfirmationOutcome;
using agrovest::EngineError;
using agrovest::ErrorCode;
using agrovest::InvestmentUpdateEvent;
using agrovest::LedgerEntryEvent;
using agrovest::ReconciliationAlertEvent;
namespace domain = agrovest::domain;
namespace ts = agrovest::test_support;

class InvestmentLifecycleTest : public ::testing::Test {
 protected:
  ts::LifecycleHarness h;

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

// --- 1) Creation ---
TEST_F(InvestmentLifecycleTest, CreateStartsPendingAndHoldsStorageSlot) {
  auto direct = h.makePackage(domain::PackageKind::Direct, 3);
  auto storage = h.makePackage(domain::PackageKind::Storage, 3);

  auto a = h.lifecycle.createInvestment(1, direct.id, ts::naira(100));
  auto b = h.lifecycle.createInvestment(1, storage.id, ts::naira(100));

  EXPECT_EQ(a.status, domain::InvestmentStatus::Pending);
  EXPECT_FALSE(a.slot_held);
  EXPECT_TRUE(b.slot_held);
  EXPECT_EQ(h.store.package(direct.id)->available_slots, 3);
  EXPECT_EQ(h.store.package(storage.id)->available_slots, 2);
}

TEST_F(InvestmentLifecycleTest, CreateRejectsAmountOutsidePackageBounds) {
  domain::InvestmentPackage draft;
  draft.name = "Rice";
  draft.kind = domain::PackageKind::Direct;
  draft.total_slots = 5;
  draft.available_slots = 5;
  draft.min_amount = ts::naira(50);
  draft.max_amount = ts::naira(500);
  agrovest::UnitOfWork unit(h.store, h.clock, h.recorder_sink);
  auto pkg = h.allocator.createPackage(unit, draft);
  unit.commit();

  EXPECT_EQ(codeOf([&] {
              h.lifecycle.createInvestment(1, pkg.id, ts::naira(10));
            }),
            ErrorCode::Validation);
  EXPECT_EQ(codeOf([&] {
              h.lifecycle.createInvestment(1, pkg.id, ts::naira(1000));
            }),
            ErrorCode::Validation);
  EXPECT_EQ(codeOf([&] { h.lifecycle.createInvestment(1, 999, ts::naira(100)); }),
            ErrorCode::NotFound);
  EXPECT_TRUE(h.lifecycle.investmentsForUser(1).empty());
}

// --- 2) Exactly-once confirmation ---
// Why: webhook and verify can both deliver the same reference.
TEST_F(InvestmentLifecycleTest, ReplayedConfirmationAppliesOnce) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 5);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  const std::string ref = h.openPayment(1, inv.id);

  auto first = h.lifecycle.onPaymentConfirmed(h.confirmation(ref));
  auto second = h.lifecycle.onPaymentConfirmed(h.confirmation(ref));

  EXPECT_EQ(first.outcome, ConfirmationOutcome::Applied);
  EXPECT_EQ(second.outcome, ConfirmationOutcome::AlreadyProcessed);

  auto active = h.lifecycle.investment(inv.id);
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->status, domain::InvestmentStatus::Active);
  ASSERT_TRUE(active->start_date.has_value());
  ASSERT_TRUE(active->end_date.has_value());
  EXPECT_EQ(*active->end_date - *active->start_date, 90 * domain::kMsPerDay);

  EXPECT_EQ(h.ledger.entriesForUser(1).size(), 1u);
  EXPECT_EQ(h.ledger.entriesForUser(1)[0].description,
            "Investment in Maize Farm");
  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 4);

  auto payment = h.store.paymentByReference(ref);
  ASSERT_TRUE(payment.has_value());
  EXPECT_EQ(payment->status, domain::PaymentStatus::Success);
  EXPECT_EQ(payment->metadata["confirmed_via"], "webhook");
}

TEST_F(InvestmentLifecycleTest, ConcurrentReplaysApplyOnce) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 5);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  const std::string ref = h.openPayment(1, inv.id);

  std::vector<std::future<ConfirmationOutcome>> results;
  for (int i = 0; i < 4; ++i) {
    results.push_back(std::async(std::launch::async, [&] {
      return h.lifecycle.onPaymentConfirmed(h.confirmation(ref)).outcome;
    }));
  }
  int applied = 0;
  for (auto& f : results) {
    if (f.get() == ConfirmationOutcome::Applied) {
      ++applied;
    }
  }

  EXPECT_EQ(applied, 1);
  EXPECT_EQ(h.ledger.entriesForUser(1).size(), 1u);
  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 4);
}

// --- 3) Last direct slot ---
TEST_F(InvestmentLifecycleTest, LastDirectSlotGoesToOneBuyer) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 1);
  auto a = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  auto b = h.lifecycle.createInvestment(2, pkg.id, ts::naira(100));
  const std::string ref_a = h.openPayment(1, a.id);
  const std::string ref_b = h.openPayment(2, b.id);

  auto confirm = [&](const std::string& ref) {
    try {
      h.lifecycle.onPaymentConfirmed(h.confirmation(ref));
      return ErrorCode::Internal;  // sentinel: applied
    } catch (const EngineError& e) {
      return e.code();
    }
  };
  auto fa = std::async(std::launch::async, confirm, ref_a);
  auto fb = std::async(std::launch::async, confirm, ref_b);
  const ErrorCode ra = fa.get();
  const ErrorCode rb = fb.get();

  const bool a_won = ra == ErrorCode::Internal;
  ASSERT_NE(a_won, rb == ErrorCode::Internal);
  EXPECT_EQ(a_won ? rb : ra, ErrorCode::OutOfStock);

  const domain::InvestmentId loser = a_won ? b.id : a.id;
  const std::string loser_ref = a_won ? ref_b : ref_a;

  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 0);
  auto lost = h.lifecycle.investment(loser);
  ASSERT_TRUE(lost.has_value());
  EXPECT_EQ(lost->status, domain::InvestmentStatus::Pending);
  EXPECT_TRUE(lost->needs_reconciliation);

  auto payment = h.store.paymentByReference(loser_ref);
  EXPECT_EQ(payment->status, domain::PaymentStatus::Pending);
  EXPECT_EQ(payment->metadata["reconciliation"], "out_of_stock");

  auto alerts = h.recorder.of<ReconciliationAlertEvent>();
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].reason, "out_of_stock");
}

// --- 4) Failure ---
TEST_F(InvestmentLifecycleTest, FailureKeepsInvestmentPayable) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 2);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  const std::string ref = h.openPayment(1, inv.id);

  agrovest::PaymentFailedEvent failed;
  failed.reference = ref;
  failed.reason = "Declined";
  auto result = h.lifecycle.onPaymentFailed(failed);

  EXPECT_EQ(result.outcome, ConfirmationOutcome::Applied);
  EXPECT_EQ(result.payment.status, domain::PaymentStatus::Failed);
  EXPECT_EQ(result.payment.metadata["failure_reason"], "Declined");
  EXPECT_EQ(h.lifecycle.investment(inv.id)->status,
            domain::InvestmentStatus::Pending);
  EXPECT_TRUE(h.ledger.entriesForUser(1).empty());

  // A second attempt goes through.
  const std::string retry = h.openPayment(1, inv.id);
  EXPECT_NE(retry, ref);
  h.lifecycle.onPaymentConfirmed(h.confirmation(retry));
  EXPECT_EQ(h.lifecycle.investment(inv.id)->status,
            domain::InvestmentStatus::Active);
}

TEST_F(InvestmentLifecycleTest, LateSuccessAfterFailureStillActivates) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 2);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  const std::string ref = h.openPayment(1, inv.id);

  agrovest::PaymentFailedEvent failed;
  failed.reference = ref;
  failed.reason = "Timeout";
  h.lifecycle.onPaymentFailed(failed);

  auto result = h.lifecycle.onPaymentConfirmed(h.confirmation(ref));
  EXPECT_EQ(result.outcome, ConfirmationOutcome::Applied);
  EXPECT_EQ(result.investment->status, domain::InvestmentStatus::Active);

  // A failure after success changes nothing.
  auto again = h.lifecycle.onPaymentFailed(failed);
  EXPECT_EQ(again.outcome, ConfirmationOutcome::AlreadyProcessed);
  EXPECT_EQ(again.payment.status, domain::PaymentStatus::Success);
}

// --- 5) Cancel ---
TEST_F(InvestmentLifecycleTest, CancelStoragePlanRefundsReleasesAndPurges) {
  auto pkg = h.makePackage(domain::PackageKind::Storage, 4, 3000, 90,
                           "Grain Storage");
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(200));
  ASSERT_EQ(h.store.package(pkg.id)->available_slots, 3);

  auto cancelled = h.lifecycle.cancel(1, inv.id);

  EXPECT_EQ(cancelled.status, domain::InvestmentStatus::Cancelled);
  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 4);
  EXPECT_FALSE(h.lifecycle.investment(inv.id).has_value());

  auto refunds =
      h.ledger.entriesByType(1, domain::TransactionType::Refund);
  ASSERT_EQ(refunds.size(), 1u);
  EXPECT_EQ(refunds[0].amount, ts::naira(200));
  EXPECT_EQ(refunds[0].description,
            "Refund for cancelled investment in Grain Storage");
  EXPECT_EQ(refunds[0].investment_id, inv.id);

  auto updates = h.recorder.of<InvestmentUpdateEvent>();
  ASSERT_FALSE(updates.empty());
  EXPECT_TRUE(updates.back().purged);
}

TEST_F(InvestmentLifecycleTest, CancelWithoutPurgeKeepsRecordUntilPurged) {
  agrovest::LifecycleOptions options;
  options.purge_cancelled_on_cancel = false;
  ts::LifecycleHarness keep(options);

  auto pkg = keep.makePackage(domain::PackageKind::Direct, 2);
  auto inv = keep.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  keep.lifecycle.cancel(1, inv.id);

  auto kept = keep.lifecycle.investment(inv.id);
  ASSERT_TRUE(kept.has_value());
  EXPECT_EQ(kept->status, domain::InvestmentStatus::Cancelled);
  EXPECT_EQ(keep.store.package(pkg.id)->available_slots, 2);

  keep.lifecycle.purge(inv.id);
  EXPECT_FALSE(keep.lifecycle.investment(inv.id).has_value());
}

TEST_F(InvestmentLifecycleTest, OnlyPendingCanBeCancelledAndOnlyCancelledPurged) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 2);
  auto active = h.activeInvestment(1, pkg.id, ts::naira(100));

  try {
    h.lifecycle.cancel(1, active.id);
    FAIL() << "expected InvalidTransition";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidTransition);
    EXPECT_EQ(e.currentState(), "active");
  }
  EXPECT_EQ(codeOf([&] { h.lifecycle.purge(active.id); }),
            ErrorCode::InvalidTransition);
  EXPECT_EQ(codeOf([&] { h.lifecycle.cancel(2, active.id); }),
            ErrorCode::NotFound);
}

TEST_F(InvestmentLifecycleTest, AdminRejectReleasesSlotAndKeepsRecord) {
  auto pkg = h.makePackage(domain::PackageKind::Storage, 4, 3000, 90,
                           "Grain Storage");
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(200));
  const std::string ref = h.openPayment(1, inv.id);
  ASSERT_EQ(h.store.package(pkg.id)->available_slots, 3);

  auto rejected = h.lifecycle.reject(inv.id);

  EXPECT_EQ(rejected.status, domain::InvestmentStatus::Cancelled);
  EXPECT_FALSE(rejected.slot_held);
  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 4);
  ASSERT_TRUE(h.lifecycle.investment(inv.id).has_value());
  // Nothing was paid, so nothing is refunded.
  EXPECT_TRUE(h.ledger.entriesForInvestment(inv.id).empty());

  // The gateway settles after the rejection: flagged, never activated.
  try {
    h.lifecycle.onPaymentConfirmed(h.confirmation(ref));
    FAIL() << "expected InvalidTransition";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidTransition);
    EXPECT_EQ(e.currentState(), "cancelled");
  }
  EXPECT_EQ(h.store.paymentByReference(ref)->metadata["reconciliation"],
            "investment_cancelled");
  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 4);

  EXPECT_EQ(codeOf([&] { h.lifecycle.reject(inv.id); }),
            ErrorCode::InvalidTransition);
  EXPECT_EQ(codeOf([&] { h.lifecycle.reject(999); }), ErrorCode::NotFound);
}

// --- 6) Completion ---
TEST_F(InvestmentLifecycleTest, CompleteWaitsForEndDateAndAppliesRate) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 2, 3000, 90);
  auto inv = h.activeInvestment(1, pkg.id, ts::naira(100));

  EXPECT_EQ(codeOf([&] { h.lifecycle.complete(1, inv.id); }),
            ErrorCode::InvalidTransition);

  h.clock.advance_by(90 * domain::kMsPerDay);
  auto done = h.lifecycle.complete(1, inv.id);

  EXPECT_EQ(done.status, domain::InvestmentStatus::Completed);
  EXPECT_EQ(done.actual_return, ts::naira(130));
  ASSERT_TRUE(done.completed_date.has_value());
  EXPECT_EQ(*done.completed_date, h.clock.now_ms());
}

// --- 7) Admin approval ---
TEST_F(InvestmentLifecycleTest, ForceApproveActivatesWithOverridePayment) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 2);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));

  auto result = h.lifecycle.forceApprove(inv.id);

  EXPECT_EQ(result.outcome, ConfirmationOutcome::Applied);
  EXPECT_EQ(result.investment->status, domain::InvestmentStatus::Active);
  EXPECT_EQ(result.payment.payment_method, "admin_override");
  EXPECT_EQ(result.payment.reference.rfind("ADMIN-APPROVAL-", 0), 0u);
  EXPECT_EQ(result.payment.metadata["confirmed_via"], "admin_override");
  EXPECT_EQ(h.gateway.initializeCalls(), 0);

  EXPECT_EQ(codeOf([&] { h.lifecycle.forceApprove(inv.id); }),
            ErrorCode::InvalidTransition);
}

// --- 8) Money that cannot be applied ---
TEST_F(InvestmentLifecycleTest, SecondChargeIsTaggedDuplicate) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 3);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  const std::string first = h.openPayment(1, inv.id);
  const std::string second = h.openPayment(1, inv.id);

  h.lifecycle.onPaymentConfirmed(h.confirmation(first));
  auto dup = h.lifecycle.onPaymentConfirmed(h.confirmation(second));

  EXPECT_EQ(dup.outcome, ConfirmationOutcome::AlreadyProcessed);
  EXPECT_EQ(h.store.paymentByReference(second)->metadata["reconciliation"],
            "duplicate_charge");
  EXPECT_EQ(h.ledger.entriesForUser(1).size(), 1u);
  EXPECT_EQ(h.store.package(pkg.id)->available_slots, 2);
}

TEST_F(InvestmentLifecycleTest, AmountMismatchIsRejected) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 3);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  const std::string ref = h.openPayment(1, inv.id);

  auto event = h.confirmation(ref);
  event.amount = ts::naira(10);
  EXPECT_EQ(codeOf([&] { h.lifecycle.onPaymentConfirmed(event); }),
            ErrorCode::Validation);
  EXPECT_EQ(h.lifecycle.investment(inv.id)->status,
            domain::InvestmentStatus::Pending);
  EXPECT_EQ(h.store.paymentByReference(ref)->status,
            domain::PaymentStatus::Pending);
}

TEST_F(InvestmentLifecycleTest, UnknownReferenceIsNotFound) {
  EXPECT_EQ(codeOf([&] {
              h.lifecycle.onPaymentConfirmed(h.confirmation("INV_404_1"));
            }),
            ErrorCode::NotFound);
}

TEST_F(InvestmentLifecycleTest, GatewayOutageAtStartWritesNothing) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 3);
  auto inv = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100));
  h.gateway.setUnavailable(true);

  EXPECT_EQ(codeOf([&] { h.openPayment(1, inv.id); }),
            ErrorCode::GatewayUnavailable);
  EXPECT_TRUE(h.lifecycle.paymentsForInvestment(inv.id).empty());
  EXPECT_EQ(h.lifecycle.investment(inv.id)->status,
            domain::InvestmentStatus::Pending);
}

TEST_F(InvestmentLifecycleTest, EventsAreEmittedOnlyForCommittedUnits) {
  auto pkg = h.makePackage(domain::PackageKind::Direct, 3);
  h.recorder.clear();

  EXPECT_THROW(h.lifecycle.createInvestment(1, pkg.id, ts::naira(0)),
               EngineError);
  EXPECT_EQ(h.recorder.size(), 0u);

  auto inv = h.activeInvestment(1, pkg.id, ts::naira(100));
  EXPECT_EQ(h.recorder.of<LedgerEntryEvent>().size(), 1u);
  EXPECT_EQ(h.recorder.of<InvestmentUpdateEvent>().back().investment.id,
            inv.id);
}
