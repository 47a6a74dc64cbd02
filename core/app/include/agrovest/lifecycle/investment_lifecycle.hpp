#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/events/event.hpp"
#include "agrovest/inventory/inventory_allocator.hpp"
#include "agrovest/ledger/ledger.hpp"
#include "agrovest/payment/payment_adapter.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/store/unit_of_work.hpp"
#include "agrovest/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agrovest {

struct LifecycleOptions {
  // Remove cancelled investments in the same unit that cancels them. When
  // off, they stay in the Cancelled state until purge() is called.
  bool purge_cancelled_on_cancel{true};
};

enum class ConfirmationOutcome { Applied, AlreadyProcessed };

// Result of applying a payment notification.
struct ConfirmationResult {
  ConfirmationOutcome outcome{ConfirmationOutcome::Applied};
  domain::Payment payment;
  std::optional<domain::Investment> investment;
};

struct PaymentStart {
  domain::Payment payment;
  GatewaySession session;
};

// -----------------------------------------------------------------------------
// InvestmentLifecycle
// -----------------------------------------------------------------------------
//
// @brief  Drives Investment records through
//         pending -> active -> completed and pending -> cancelled.
//
// @details
// Every public operation is one UnitOfWork: it takes the row locks it
// needs, asks nextInvestmentStatus() whether the trigger is allowed, stages
// the record, inventory and ledger changes, and commits them together.
// Notifications reach the EventSink only after the commit.
//
// onPaymentConfirmed() is the single consumer of confirmed payments, whether
// they came from a webhook, a client verify or an admin override. It is
// idempotent per reference: the Payment row is locked and inspected before
// anything changes, so a replay finds it already Success and returns
// AlreadyProcessed.
//
// Lock order inside a unit: payment -> investment -> package.
//
// Contention (a lock wait past the Store timeout) is retried once per
// operation. OutOfStock at activation rolls the unit back; the investment
// and payment are then tagged for manual reconciliation in a second unit.
//
// Thread model: Stateless apart from injected references. Any request
// thread may call any method concurrently.
// -----------------------------------------------------------------------------
class InvestmentLifecycle {
 public:
  InvestmentLifecycle(Store& store, const InventoryAllocator& allocator,
                      const Ledger& ledger, PaymentAdapter& adapter,
                      const ITimeProvider& clock, EventSink sink,
                      LifecycleOptions options = {});

  InvestmentLifecycle(const InvestmentLifecycle&) = delete;
  InvestmentLifecycle& operator=(const InvestmentLifecycle&) = delete;

  // -------------------------------------------------------------------------
  // createInvestment(user, package_id, amount, units)
  // -------------------------------------------------------------------------
  // @brief  Creates a Pending investment after reserving inventory.
  //
  // @throws EngineError  NotFound (package), InvalidTransition (package
  //                      inactive), OutOfStock, Validation (amount outside
  //                      the package bounds or not positive).
  // -------------------------------------------------------------------------
  domain::Investment createInvestment(domain::UserId user,
                                      domain::PackageId package_id,
                                      domain::Money amount,
                                      std::int64_t units = 1);

  // -------------------------------------------------------------------------
  // startPayment(user, investment_id, payer)
  // -------------------------------------------------------------------------
  // @brief  Opens a gateway checkout and records a Pending Payment.
  //
  // @details
  // The gateway is called first, outside any transaction. If it throws
  // GatewayUnavailable nothing has been written.
  // -------------------------------------------------------------------------
  PaymentStart startPayment(domain::UserId user,
                            domain::InvestmentId investment_id,
                            const PayerProfile& payer);

  // -------------------------------------------------------------------------
  // onPaymentConfirmed(event)
  // -------------------------------------------------------------------------
  // @brief  Applies a confirmed payment exactly once.
  //
  // @details
  // In one unit: Payment -> Success (paid_at, gateway data in metadata),
  // Investment -> Active (start/end dates), inventory commit, ledger
  // "investment" entry.
  //
  // Returns AlreadyProcessed, with nothing changed, when the Payment is
  // already Success, or when another Payment already funded the
  // investment (the extra charge is tagged "duplicate_charge").
  //
  // @throws EngineError  NotFound (unknown reference), Validation (amount
  //                      mismatch), OutOfStock, InvalidTransition
  //                      (investment cancelled or removed).
  // -------------------------------------------------------------------------
  ConfirmationResult onPaymentConfirmed(const PaymentConfirmedEvent& event);

  // Payment -> Failed. The investment stays Pending and can be paid again.
  ConfirmationResult onPaymentFailed(const PaymentFailedEvent& event);

  // Active -> Completed once now >= end_date. Sets actual_return from the
  // package terms unless it was already set.
  domain::Investment complete(domain::UserId user, domain::InvestmentId id);

  // -------------------------------------------------------------------------
  // cancel(user, id)
  // -------------------------------------------------------------------------
  // Pending -> Cancelled. In one unit: refund ledger entry for the full
  // amount, release of any held inventory, status change, and (with
  // purge_cancelled_on_cancel) removal of the record. Returns the
  // investment as it was at cancellation.
  // -------------------------------------------------------------------------
  domain::Investment cancel(domain::UserId user, domain::InvestmentId id);

  // Admin close of a stale Pending order. Releases held inventory and
  // keeps the record as Cancelled; no refund is written since nothing was
  // paid. A late success for it is flagged for reconciliation.
  domain::Investment reject(domain::InvestmentId id);

  // Removes a Cancelled investment. Ledger entries keep its id.
  void purge(domain::InvestmentId id);

  // Admin approval without a gateway payment. Records an admin_override
  // Payment and runs it through onPaymentConfirmed().
  ConfirmationResult forceApprove(domain::InvestmentId id);

  // --- Queries (committed state) ------------------------------------------
  std::optional<domain::Investment> investment(domain::InvestmentId id) const;
  std::vector<domain::Investment> investmentsForUser(domain::UserId user) const;
  std::vector<domain::Payment> paymentsForInvestment(
      domain::InvestmentId id) const;

  const LifecycleOptions& options() const { return options_; }

 private:
  ConfirmationResult applyConfirmation(const PaymentConfirmedEvent& event);
  ConfirmationResult applyFailure(const PaymentFailedEvent& event);

  // Tags the payment (and investment, if present) in a separate unit after
  // a confirmation had to be rolled back.
  void flagForReconciliation(const std::string& reference,
                             const std::string& reason);

  // Loads an investment under its row lock and checks ownership.
  // user == 0 skips the ownership check (admin / system callers).
  domain::Investment lockOwned(UnitOfWork& unit, domain::UserId user,
                               domain::InvestmentId id) const;

  std::string packageName(UnitOfWork& unit, domain::PackageId id) const;

  Store& store_;
  const InventoryAllocator& allocator_;
  const Ledger& ledger_;
  PaymentAdapter& adapter_;
  const ITimeProvider& clock_;
  EventSink sink_;
  LifecycleOptions options_;
};

}  // namespace agrovest
