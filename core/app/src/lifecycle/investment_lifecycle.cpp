#include "agrovest/lifecycle/investment_lifecycle.hpp"

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/lifecycle/transitions.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace agrovest {

namespace {

constexpr const char* kComponent = "InvestmentLifecycle";

InvestmentUpdateEvent investmentUpdate(
    const domain::Investment& investment,
    std::optional<domain::InvestmentStatus> previous, bool purged = false) {
  InvestmentUpdateEvent event;
  event.investment = investment;
  event.previous_status = previous;
  event.purged = purged;
  return event;
}

PaymentUpdateEvent paymentUpdate(const domain::Payment& payment,
                                 std::optional<domain::PaymentStatus> previous) {
  PaymentUpdateEvent event;
  event.payment = payment;
  event.previous_status = previous;
  return event;
}

}  // namespace

InvestmentLifecycle::InvestmentLifecycle(Store& store,
                                         const InventoryAllocator& allocator,
                                         const Ledger& ledger,
                                         PaymentAdapter& adapter,
                                         const ITimeProvider& clock,
                                         EventSink sink,
                                         LifecycleOptions options)
    : store_(store),
      allocator_(allocator),
      ledger_(ledger),
      adapter_(adapter),
      clock_(clock),
      sink_(std::move(sink)),
      options_(options) {}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
domain::Investment InvestmentLifecycle::lockOwned(UnitOfWork& unit,
                                                  domain::UserId user,
                                                  domain::InvestmentId id) const {
  unit.txn().lockInvestment(id);
  auto investment = unit.txn().investment(id);
  if (!investment.has_value() || (user != 0 && investment->user_id != user)) {
    throw EngineError(ErrorCode::NotFound,
                      "Investment " + std::to_string(id) + " not found");
  }
  return *investment;
}

std::string InvestmentLifecycle::packageName(UnitOfWork& unit,
                                             domain::PackageId id) const {
  auto pkg = unit.txn().package(id);
  return pkg.has_value() ? pkg->name : "package #" + std::to_string(id);
}

// -----------------------------------------------------------------------------
// createInvestment()
// -----------------------------------------------------------------------------
domain::Investment InvestmentLifecycle::createInvestment(
    domain::UserId user, domain::PackageId package_id, domain::Money amount,
    std::int64_t units) {
  if (user == 0) {
    throw EngineError(ErrorCode::Validation, "User is required");
  }
  if (!amount.isPositive()) {
    throw EngineError(ErrorCode::Validation, "Amount must be positive");
  }

  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);

    // ---  1) Inventory: locks the package and checks capacity ---------------
    const ReservationToken token = allocator_.reserve(unit, package_id, units);
    const domain::InvestmentPackage pkg = *unit.txn().package(package_id);

    // ---  2) Amount bounds from the package ---------------------------------
    if (!pkg.min_amount.isZero() && amount < pkg.min_amount) {
      throw EngineError(ErrorCode::Validation,
                        "Minimum amount for " + pkg.name + " is " +
                            pkg.min_amount.toString());
    }
    if (!pkg.max_amount.isZero() && amount > pkg.max_amount) {
      throw EngineError(ErrorCode::Validation,
                        "Maximum amount for " + pkg.name + " is " +
                            pkg.max_amount.toString());
    }

    // ---  3) Pending record -------------------------------------------------
    domain::Investment draft;
    draft.user_id = user;
    draft.package_id = package_id;
    draft.amount = amount;
    draft.units = units;
    draft.status = domain::InvestmentStatus::Pending;
    draft.created_at = clock_.now_ms();
    draft.slot_held = token.held;

    domain::Investment created = unit.txn().insert(draft);
    unit.emit(investmentUpdate(created, std::nullopt));
    unit.commit();

    std::cout << "[InvestmentLifecycle] created investment " << created.id
              << " user=" << user << " package=" << package_id
              << " amount=" << amount.toString() << " units=" << units
              << (created.slot_held ? " (units held)" : "") << "\n";
    return created;
  });
}

// -----------------------------------------------------------------------------
// startPayment()
// -----------------------------------------------------------------------------
PaymentStart InvestmentLifecycle::startPayment(domain::UserId user,
                                               domain::InvestmentId investment_id,
                                               const PayerProfile& payer) {
  auto investment = store_.investment(investment_id);
  if (!investment.has_value() || investment->user_id != user) {
    throw EngineError(ErrorCode::NotFound,
                      "Investment " + std::to_string(investment_id) +
                          " not found");
  }
  if (investment->status != domain::InvestmentStatus::Pending) {
    throw EngineError(ErrorCode::InvalidTransition,
                      "Only pending investments can be paid for",
                      domain::toString(investment->status));
  }

  // ---  1) Gateway first: a failure here leaves no trace -------------------
  const domain::PaymentId payment_id = store_.reservePaymentId();
  const std::string reference =
      PaymentAdapter::makeReference(payment_id, clock_.now_ms());
  GatewaySession session =
      adapter_.initialize(reference, *investment, investment->amount, payer);
  if (session.reference.empty()) {
    session.reference = reference;
  }

  // ---  2) Record the attempt ----------------------------------------------
  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    const domain::Investment current = lockOwned(unit, user, investment_id);
    if (current.status != domain::InvestmentStatus::Pending) {
      throw EngineError(ErrorCode::InvalidTransition,
                        "Only pending investments can be paid for",
                        domain::toString(current.status));
    }

    domain::Payment draft;
    draft.id = payment_id;
    draft.user_id = user;
    draft.investment_id = investment_id;
    draft.amount = current.amount;
    draft.status = domain::PaymentStatus::Pending;
    draft.reference = session.reference;
    draft.authorization_url = session.authorization_url;
    draft.access_code = session.access_code;
    draft.created_at = clock_.now_ms();

    domain::Payment payment = unit.txn().insert(draft);
    unit.emit(paymentUpdate(payment, std::nullopt));
    unit.commit();

    std::cout << "[InvestmentLifecycle] payment " << payment.reference
              << " opened for investment " << investment_id << "\n";
    return PaymentStart{payment, session};
  });
}

// -----------------------------------------------------------------------------
// onPaymentConfirmed()
// -----------------------------------------------------------------------------
ConfirmationResult InvestmentLifecycle::onPaymentConfirmed(
    const PaymentConfirmedEvent& event) {
  try {
    return withContentionRetry(kComponent,
                               [&] { return applyConfirmation(event); });
  } catch (const EngineError& e) {
    if (e.code() != ErrorCode::OutOfStock) {
      throw;
    }
    try {
      flagForReconciliation(event.reference, "out_of_stock");
    } catch (const EngineError& flag_error) {
      std::cerr << "[InvestmentLifecycle] ERROR: could not flag "
                << event.reference << " for reconciliation: "
                << flag_error.what() << "\n";
    }
    throw;
  }
}

ConfirmationResult InvestmentLifecycle::applyConfirmation(
    const PaymentConfirmedEvent& event) {
  auto known = store_.paymentByReference(event.reference);
  if (!known.has_value()) {
    throw EngineError(ErrorCode::NotFound, "Payment not found");
  }

  UnitOfWork unit(store_, clock_, sink_);
  auto& txn = unit.txn();

  // ---  1) Lock and re-read the payment: the idempotency gate ---------------
  txn.lockPayment(known->id);
  domain::Payment payment = *txn.payment(known->id);
  const domain::PaymentStatus previous_payment_status = payment.status;

  if (payment.status == domain::PaymentStatus::Success) {
    std::cout << "[InvestmentLifecycle] payment " << payment.reference
              << " already processed (" << toString(event.source) << ").\n";
    ConfirmationResult result{ConfirmationOutcome::AlreadyProcessed, payment,
                              std::nullopt};
    if (payment.investment_id.has_value()) {
      result.investment = txn.investment(*payment.investment_id);
    }
    return result;
  }

  if (event.amount.has_value() && *event.amount != payment.amount) {
    std::cerr << "[InvestmentLifecycle] WARNING: amount mismatch for "
              << payment.reference << ": gateway=" << event.amount->toString()
              << " expected=" << payment.amount.toString() << "\n";
    throw EngineError(ErrorCode::Validation,
                      "Confirmed amount " + event.amount->toString() +
                          " does not match payment amount " +
                          payment.amount.toString());
  }

  const domain::EpochMs now = clock_.now_ms();
  auto markSuccess = [&](domain::Payment& p) {
    p.status = domain::PaymentStatus::Success;
    p.paid_at = now;
    p.metadata["verification_data"] = event.gateway_data;
    p.metadata["confirmed_via"] = toString(event.source);
    if (!event.gateway_id.empty()) {
      p.metadata["gateway_id"] = event.gateway_id;
    }
  };

  // ---  2) Payments without an investment just settle ----------------------
  if (!payment.investment_id.has_value()) {
    markSuccess(payment);
    txn.update(payment);
    unit.emit(paymentUpdate(payment, previous_payment_status));
    unit.commit();
    return ConfirmationResult{ConfirmationOutcome::Applied, payment,
                              std::nullopt};
  }

  // ---  3) Lock the investment and gather transition context ---------------
  const domain::InvestmentId investment_id = *payment.investment_id;
  txn.lockInvestment(investment_id);
  auto investment = txn.investment(investment_id);

  auto tagAndAlert = [&](const std::string& reason) {
    payment.metadata["reconciliation"] = reason;
    txn.update(payment);
    ReconciliationAlertEvent alert;
    alert.reference = payment.reference;
    alert.investment_id = investment_id;
    alert.reason = reason;
    unit.emit(alert);
    unit.commit();
    std::cerr << "[InvestmentLifecycle] WARNING: payment " << payment.reference
              << " needs reconciliation: " << reason << "\n";
  };

  if (!investment.has_value()) {
    tagAndAlert("investment_removed");
    throw EngineError(ErrorCode::InvalidTransition,
                      "Investment " + std::to_string(investment_id) +
                          " no longer exists",
                      "removed");
  }

  const auto siblings = txn.paymentsForInvestment(investment_id);
  const bool has_successful_payment =
      std::any_of(siblings.begin(), siblings.end(),
                  [&payment](const domain::Payment& p) {
                    return p.id != payment.id &&
                           p.status == domain::PaymentStatus::Success;
                  });

  if (has_successful_payment) {
    tagAndAlert("duplicate_charge");
    return ConfirmationResult{ConfirmationOutcome::AlreadyProcessed, payment,
                              investment};
  }

  InvestmentTransitionContext context;
  context.has_successful_payment = has_successful_payment;
  context.now = now;
  const InvestmentTransition transition = nextInvestmentStatus(
      investment->status, InvestmentTrigger::PaymentConfirmed, context);

  if (const auto* rejection = std::get_if<TransitionRejection>(&transition)) {
    tagAndAlert("investment_" + rejection->current_state);
    throw EngineError(ErrorCode::InvalidTransition, rejection->reason,
                      rejection->current_state);
  }

  // ---  4) Inventory commit (may throw OutOfStock -> whole unit rolls back)
  ReservationToken token{investment->package_id, investment->units,
                         investment->slot_held};
  allocator_.commit(unit, token);
  const domain::InvestmentPackage pkg = *txn.package(investment->package_id);

  // ---  5) Stage payment, investment and ledger ----------------------------
  markSuccess(payment);
  txn.update(payment);

  const domain::InvestmentStatus previous_status = investment->status;
  investment->status = std::get<domain::InvestmentStatus>(transition);
  investment->start_date = now;
  investment->end_date = now + pkg.terms.duration_days * domain::kMsPerDay;
  investment->slot_held = true;
  investment->needs_reconciliation = false;
  txn.update(*investment);

  domain::LedgerEntry entry;
  entry.user_id = investment->user_id;
  entry.investment_id = investment->id;
  entry.type = domain::TransactionType::Investment;
  entry.amount = payment.amount;
  entry.status = domain::TransactionStatus::Completed;
  entry.description = "Investment in " + pkg.name;
  entry.payment_reference = payment.reference;
  entry = ledger_.record(txn, entry);

  unit.emit(paymentUpdate(payment, previous_payment_status));
  unit.emit(investmentUpdate(*investment, previous_status));
  unit.emit(LedgerEntryEvent{entry, {}});

  // ---  6) Commit ------------------------------------------------------------
  unit.commit();

  std::cout << "[InvestmentLifecycle] investment " << investment->id
            << " activated by " << payment.reference << " via "
            << toString(event.source) << "\n";
  return ConfirmationResult{ConfirmationOutcome::Applied, payment, investment};
}

// -----------------------------------------------------------------------------
// flagForReconciliation()
// -----------------------------------------------------------------------------
void InvestmentLifecycle::flagForReconciliation(const std::string& reference,
                                                const std::string& reason) {
  withContentionRetry(kComponent, [&] {
    auto known = store_.paymentByReference(reference);
    if (!known.has_value()) {
      return;
    }

    UnitOfWork unit(store_, clock_, sink_);
    auto& txn = unit.txn();
    txn.lockPayment(known->id);
    domain::Payment payment = *txn.payment(known->id);
    payment.metadata["reconciliation"] = reason;
    txn.update(payment);

    ReconciliationAlertEvent alert;
    alert.reference = reference;
    alert.reason = reason;

    if (payment.investment_id.has_value()) {
      alert.investment_id = payment.investment_id;
      txn.lockInvestment(*payment.investment_id);
      auto investment = txn.investment(*payment.investment_id);
      if (investment.has_value()) {
        investment->needs_reconciliation = true;
        txn.update(*investment);
        unit.emit(investmentUpdate(*investment, investment->status));
      }
    }

    unit.emit(alert);
    unit.commit();
    std::cerr << "[InvestmentLifecycle] WARNING: payment " << reference
              << " flagged for reconciliation: " << reason << "\n";
  });
}

// -----------------------------------------------------------------------------
// onPaymentFailed()
// -----------------------------------------------------------------------------
ConfirmationResult InvestmentLifecycle::onPaymentFailed(
    const PaymentFailedEvent& event) {
  return withContentionRetry(kComponent, [&] { return applyFailure(event); });
}

ConfirmationResult InvestmentLifecycle::applyFailure(
    const PaymentFailedEvent& event) {
  auto known = store_.paymentByReference(event.reference);
  if (!known.has_value()) {
    throw EngineError(ErrorCode::NotFound, "Payment not found");
  }

  UnitOfWork unit(store_, clock_, sink_);
  auto& txn = unit.txn();
  txn.lockPayment(known->id);
  domain::Payment payment = *txn.payment(known->id);

  std::optional<domain::Investment> investment;
  if (payment.investment_id.has_value()) {
    investment = txn.investment(*payment.investment_id);
  }

  // A late failure never undoes a success; a repeated failure is a no-op.
  if (payment.status != domain::PaymentStatus::Pending) {
    return ConfirmationResult{ConfirmationOutcome::AlreadyProcessed, payment,
                              investment};
  }

  const domain::PaymentStatus previous = payment.status;
  payment.status = domain::PaymentStatus::Failed;
  payment.metadata["failure_reason"] = event.reason;
  payment.metadata["failed_via"] = toString(event.source);
  txn.update(payment);
  unit.emit(paymentUpdate(payment, previous));
  unit.commit();

  std::cout << "[InvestmentLifecycle] payment " << payment.reference
            << " failed: " << event.reason << "\n";
  return ConfirmationResult{ConfirmationOutcome::Applied, payment, investment};
}

// -----------------------------------------------------------------------------
// complete()
// -----------------------------------------------------------------------------
domain::Investment InvestmentLifecycle::complete(domain::UserId user,
                                                 domain::InvestmentId id) {
  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    domain::Investment investment = lockOwned(unit, user, id);

    InvestmentTransitionContext context;
    context.now = clock_.now_ms();
    context.end_date = investment.end_date;
    const domain::InvestmentStatus next = requireTransition(
        nextInvestmentStatus(investment.status, InvestmentTrigger::Complete,
                             context));

    const domain::InvestmentStatus previous = investment.status;
    investment.status = next;
    investment.completed_date = context.now;
    if (investment.actual_return.isZero()) {
      auto pkg = unit.txn().package(investment.package_id);
      const std::int32_t rate = pkg.has_value() ? pkg->terms.rate_bps : 0;
      investment.actual_return =
          domain::applyReturnRate(investment.amount, rate);
    }

    unit.txn().update(investment);
    unit.emit(investmentUpdate(investment, previous));
    unit.commit();

    std::cout << "[InvestmentLifecycle] investment " << id
              << " completed. return=" << investment.actual_return.toString()
              << "\n";
    return investment;
  });
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
domain::Investment InvestmentLifecycle::cancel(domain::UserId user,
                                               domain::InvestmentId id) {
  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    auto& txn = unit.txn();
    domain::Investment investment = lockOwned(unit, user, id);

    const domain::InvestmentStatus next = requireTransition(
        nextInvestmentStatus(investment.status, InvestmentTrigger::Cancel, {}));

    // ---  1) Refund entry -----------------------------------------------------
    domain::LedgerEntry refund;
    refund.user_id = investment.user_id;
    refund.investment_id = investment.id;
    refund.type = domain::TransactionType::Refund;
    refund.amount = investment.amount;
    refund.status = domain::TransactionStatus::Completed;
    refund.description = "Refund for cancelled investment in " +
                         packageName(unit, investment.package_id);
    refund = ledger_.record(txn, refund);
    unit.emit(LedgerEntryEvent{refund, {}});

    // ---  2) Give back held inventory ----------------------------------------
    if (investment.slot_held) {
      allocator_.release(unit, investment.package_id, investment.units);
      investment.slot_held = false;
    }

    // ---  3) Terminal state, then optional purge ------------------------------
    const domain::InvestmentStatus previous = investment.status;
    investment.status = next;
    txn.update(investment);
    unit.emit(investmentUpdate(investment, previous));

    if (options_.purge_cancelled_on_cancel) {
      txn.eraseInvestment(id);
      unit.emit(investmentUpdate(investment, next, true));
    }

    unit.commit();

    std::cout << "[InvestmentLifecycle] investment " << id
              << " cancelled. refund=" << refund.amount.toString()
              << (options_.purge_cancelled_on_cancel ? " (purged)" : "")
              << "\n";
    return investment;
  });
}

// -----------------------------------------------------------------------------
// reject()
// -----------------------------------------------------------------------------
domain::Investment InvestmentLifecycle::reject(domain::InvestmentId id) {
  return withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    domain::Investment investment = lockOwned(unit, 0, id);

    const domain::InvestmentStatus next = requireTransition(
        nextInvestmentStatus(investment.status, InvestmentTrigger::Reject, {}));

    if (investment.slot_held) {
      allocator_.release(unit, investment.package_id, investment.units);
      investment.slot_held = false;
    }

    const domain::InvestmentStatus previous = investment.status;
    investment.status = next;
    unit.txn().update(investment);
    unit.emit(investmentUpdate(investment, previous));
    unit.commit();

    std::cout << "[InvestmentLifecycle] investment " << id
              << " rejected by admin\n";
    return investment;
  });
}

// -----------------------------------------------------------------------------
// purge()
// -----------------------------------------------------------------------------
void InvestmentLifecycle::purge(domain::InvestmentId id) {
  withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    domain::Investment investment = lockOwned(unit, 0, id);
    if (investment.status != domain::InvestmentStatus::Cancelled) {
      throw EngineError(ErrorCode::InvalidTransition,
                        "Only cancelled investments can be purged",
                        domain::toString(investment.status));
    }
    unit.txn().eraseInvestment(id);
    unit.emit(investmentUpdate(investment, investment.status, true));
    unit.commit();
  });
}

// -----------------------------------------------------------------------------
// forceApprove()
// -----------------------------------------------------------------------------
ConfirmationResult InvestmentLifecycle::forceApprove(domain::InvestmentId id) {
  auto investment = store_.investment(id);
  if (!investment.has_value()) {
    throw EngineError(ErrorCode::NotFound,
                      "Investment " + std::to_string(id) + " not found");
  }
  if (investment->status != domain::InvestmentStatus::Pending) {
    throw EngineError(ErrorCode::InvalidTransition,
                      "Only pending investments can be approved",
                      domain::toString(investment->status));
  }

  // ---  1) Record the override payment --------------------------------------
  const domain::Payment payment = withContentionRetry(kComponent, [&] {
    UnitOfWork unit(store_, clock_, sink_);
    const domain::Investment current = lockOwned(unit, 0, id);

    domain::Payment draft;
    draft.user_id = current.user_id;
    draft.investment_id = id;
    draft.amount = current.amount;
    draft.status = domain::PaymentStatus::Pending;
    draft.reference = "ADMIN-APPROVAL-" + std::to_string(id) + "-" +
                      std::to_string(clock_.now_ms());
    draft.payment_method = "admin_override";
    draft.created_at = clock_.now_ms();
    draft.metadata["approved_by"] = "admin";

    domain::Payment inserted = unit.txn().insert(draft);
    unit.emit(paymentUpdate(inserted, std::nullopt));
    unit.commit();
    return inserted;
  });

  // ---  2) Same activation path as a gateway confirmation --------------------
  PaymentConfirmedEvent confirmed;
  confirmed.reference = payment.reference;
  confirmed.source = ConfirmationSource::AdminOverride;
  confirmed.gateway_data = {{"approved_by", "admin"}};
  return onPaymentConfirmed(confirmed);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Investment> InvestmentLifecycle::investment(
    domain::InvestmentId id) const {
  return store_.investment(id);
}

std::vector<domain::Investment> InvestmentLifecycle::investmentsForUser(
    domain::UserId user) const {
  return store_.investmentsForUser(user);
}

std::vector<domain::Payment> InvestmentLifecycle::paymentsForInvestment(
    domain::InvestmentId id) const {
  return store_.paymentsForInvestment(id);
}

}  // namespace agrovest
