#pragma once

// Shared wiring for component tests: a Store, the allocator and ledger, a
// scripted gateway, and a lifecycle whose EventSink records what was
// published.

#include "agrovest/domain/money.hpp"
#include "agrovest/events/event.hpp"
#include "agrovest/inventory/inventory_allocator.hpp"
#include "agrovest/ledger/ledger.hpp"
#include "agrovest/lifecycle/investment_lifecycle.hpp"
#include "agrovest/payment/mock_payment_gateway.hpp"
#include "agrovest/payment/payment_adapter.hpp"
#include "agrovest/payment/webhook_signer.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/store/unit_of_work.hpp"
#include "agrovest/time/simulation_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace agrovest::test_support {

// 2023-11-14T22:13:20Z
constexpr std::int64_t kStartMs = 1700000000000LL;

constexpr const char* kWebhookSecret = "sk_test_secret";

inline domain::Money naira(std::int64_t units) {
  return domain::Money::fromUnits(units);
}

// Thread-safe record of everything a unit published.
class RecordingSink {
 public:
  EventSink sink() {
    return [this](Event event) {
      std::lock_guard lock(mutex_);
      events_.push_back(std::move(event));
    };
  }

  template <typename T>
  std::vector<T> of() const {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    for (const auto& e : events_) {
      if (const auto* typed = std::get_if<T>(&e)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
  }

  void clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

// -----------------------------------------------------------------------------
// LifecycleHarness
// -----------------------------------------------------------------------------
struct LifecycleHarness {
  explicit LifecycleHarness(LifecycleOptions options = {})
      : clock(kStartMs),
        store(std::chrono::milliseconds(250)),
        ledger(store, clock),
        adapter(gateway, WebhookSigner(kWebhookSecret)),
        lifecycle(store, allocator, ledger, adapter, clock, recorder.sink(),
                  options) {}

  domain::InvestmentPackage makePackage(
      domain::PackageKind kind, std::int64_t slots, std::int32_t rate_bps = 3000,
      std::int32_t duration_days = 90, const std::string& name = "Maize Farm") {
    domain::InvestmentPackage draft;
    draft.name = name;
    draft.kind = kind;
    draft.total_slots = slots;
    draft.available_slots = slots;
    draft.terms.rate_bps = rate_bps;
    draft.terms.duration_days = duration_days;

    UnitOfWork unit(store, clock, recorder_sink);
    auto pkg = allocator.createPackage(unit, draft);
    unit.commit();
    return pkg;
  }

  PayerProfile payer(domain::UserId user) const {
    PayerProfile p;
    p.user_id = user;
    p.email = "user" + std::to_string(user) + "@example.com";
    p.full_name = "Test User " + std::to_string(user);
    return p;
  }

  // Pending investment with an open payment; returns the payment reference.
  std::string openPayment(domain::UserId user, domain::InvestmentId id) {
    return lifecycle.startPayment(user, id, payer(user)).payment.reference;
  }

  PaymentConfirmedEvent confirmation(const std::string& reference) const {
    PaymentConfirmedEvent event;
    event.reference = reference;
    event.gateway_id = "gw-" + reference;
    event.source = ConfirmationSource::Webhook;
    event.gateway_data = {{"reference", reference}, {"status", "success"}};
    return event;
  }

  // Active investment of `amount`, funded through the normal path.
  domain::Investment activeInvestment(domain::UserId user,
                                      domain::PackageId package,
                                      domain::Money amount) {
    auto inv = lifecycle.createInvestment(user, package, amount);
    const std::string ref = openPayment(user, inv.id);
    return *lifecycle.onPaymentConfirmed(confirmation(ref)).investment;
  }

  SimulationTimeProvider clock;
  Store store;
  InventoryAllocator allocator;
  Ledger ledger;
  MockPaymentGateway gateway;
  PaymentAdapter adapter;
  RecordingSink recorder;
  EventSink recorder_sink{recorder.sink()};
  InvestmentLifecycle lifecycle;
};

}  // namespace agrovest::test_support
