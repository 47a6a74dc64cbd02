// =============================================================================
// payment_reconciler_test.cpp
// =============================================================================
// Tests for agrovest::PaymentReconciler: the webhook and verify paths that
// feed confirmed payments into the lifecycle.
// =============================================================================

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/lifecycle/payment_reconciler.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>

using agrovest::EngineError;
using agrovest::ErrorCode;
using agrovest::GatewayStatus;
using agrovest::WebhookDisposition;
namespace domain = agrovest::domain;
namespace ts = agrovest::test_support;

class PaymentReconcilerTest : public ::testing::Test {
 protected:
  ts::LifecycleHarness h;
  agrovest::PaymentReconciler reconciler{h.store, h.adapter, h.lifecycle};
  agrovest::WebhookSigner signer{ts::kWebhookSecret};

  domain::InvestmentId investment_id{0};
  std::string reference;

  void SetUp() override {
    auto pkg = h.makePackage(domain::PackageKind::Direct, 5);
    investment_id = h.lifecycle.createInvestment(1, pkg.id, ts::naira(100)).id;
    reference = h.openPayment(1, investment_id);
  }

  std::string webhookBody(const std::string& event) const {
    return R"({"event":")" + event + R"(","data":{"id":5001,"reference":")" +
           reference + R"(","amount":10000,"gateway_response":"Approved"}})";
  }

  domain::InvestmentStatus status() const {
    return h.lifecycle.investment(investment_id)->status;
  }
};

// --- 1) Webhook delivered twice ---
TEST_F(PaymentReconcilerTest, WebhookReplayIsAlreadyProcessed) {
  const std::string body = webhookBody("charge.success");

  auto first = reconciler.handleWebhook(body, signer.sign(body));
  auto second = reconciler.handleWebhook(body, signer.sign(body));

  EXPECT_EQ(first.disposition, WebhookDisposition::Processed);
  EXPECT_EQ(second.disposition, WebhookDisposition::AlreadyProcessed);
  EXPECT_EQ(status(), domain::InvestmentStatus::Active);
  EXPECT_EQ(h.ledger.entriesForUser(1).size(), 1u);
}

TEST_F(PaymentReconcilerTest, ForgedWebhookChangesNothing) {
  const std::string body = webhookBody("charge.success");
  try {
    reconciler.handleWebhook(body, signer.sign(body + " "));
    FAIL() << "expected InvalidSignature";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidSignature);
  }
  EXPECT_EQ(status(), domain::InvestmentStatus::Pending);
}

TEST_F(PaymentReconcilerTest, UnrelatedEventIsIgnored) {
  const std::string body = webhookBody("subscription.create");
  auto result = reconciler.handleWebhook(body, signer.sign(body));

  EXPECT_EQ(result.disposition, WebhookDisposition::Ignored);
  EXPECT_STREQ(agrovest::toString(result.disposition), "ignored");
  EXPECT_FALSE(result.payment.has_value());
  EXPECT_EQ(status(), domain::InvestmentStatus::Pending);
}

TEST_F(PaymentReconcilerTest, FailedChargeWebhookMarksPaymentFailed) {
  const std::string body = webhookBody("charge.failed");
  auto result = reconciler.handleWebhook(body, signer.sign(body));

  EXPECT_EQ(result.disposition, WebhookDisposition::Processed);
  ASSERT_TRUE(result.payment.has_value());
  EXPECT_EQ(result.payment->status, domain::PaymentStatus::Failed);
  EXPECT_EQ(status(), domain::InvestmentStatus::Pending);
}

// --- 2) Client verify ---
TEST_F(PaymentReconcilerTest, VerifySuccessActivates) {
  h.gateway.setOutcome(reference, GatewayStatus::Success, "Approved");

  auto result = reconciler.verify(1, reference);

  EXPECT_EQ(result.status, GatewayStatus::Success);
  EXPECT_FALSE(result.already_processed);
  EXPECT_EQ(result.message, "Payment verified successfully");
  EXPECT_EQ(result.payment.metadata["confirmed_via"], "verify");
  EXPECT_EQ(status(), domain::InvestmentStatus::Active);
}

// Why: once the webhook has settled a payment, verify must not cost a
// gateway round trip.
TEST_F(PaymentReconcilerTest, VerifyAfterSuccessSkipsGateway) {
  const std::string body = webhookBody("charge.success");
  reconciler.handleWebhook(body, signer.sign(body));
  const int calls = h.gateway.verifyCalls();

  auto result = reconciler.verify(1, reference);

  EXPECT_TRUE(result.already_processed);
  EXPECT_EQ(result.message, "Payment already verified");
  EXPECT_EQ(h.gateway.verifyCalls(), calls);
}

TEST_F(PaymentReconcilerTest, VerifyFailedAndPending) {
  auto pending = reconciler.verify(1, reference);
  EXPECT_EQ(pending.status, GatewayStatus::Pending);
  EXPECT_EQ(pending.message, "Payment is still pending");
  EXPECT_EQ(pending.payment.status, domain::PaymentStatus::Pending);

  h.gateway.setOutcome(reference, GatewayStatus::Failed, "Declined");
  auto failed = reconciler.verify(1, reference);
  EXPECT_EQ(failed.status, GatewayStatus::Failed);
  EXPECT_EQ(failed.message, "Declined");
  EXPECT_EQ(failed.payment.status, domain::PaymentStatus::Failed);
  EXPECT_EQ(status(), domain::InvestmentStatus::Pending);
}

TEST_F(PaymentReconcilerTest, VerifyChecksReferenceAndOwner) {
  auto codeOf = [&](domain::UserId user, const std::string& ref) {
    try {
      reconciler.verify(user, ref);
    } catch (const EngineError& e) {
      return e.code();
    }
    return ErrorCode::Internal;
  };

  EXPECT_EQ(codeOf(1, ""), ErrorCode::Validation);
  EXPECT_EQ(codeOf(1, "INV_999_1"), ErrorCode::NotFound);
  EXPECT_EQ(codeOf(2, reference), ErrorCode::NotFound);
  EXPECT_EQ(h.gateway.verifyCalls(), 0);
}

TEST_F(PaymentReconcilerTest, VerifyPropagatesGatewayOutage) {
  h.gateway.setUnavailable(true);
  try {
    reconciler.verify(1, reference);
    FAIL() << "expected GatewayUnavailable";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::GatewayUnavailable);
  }
  EXPECT_EQ(status(), domain::InvestmentStatus::Pending);
}
