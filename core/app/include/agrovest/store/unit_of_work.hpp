#pragma once

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/events/event.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/time/i_time_provider.hpp"

#include <iostream>
#include <vector>

namespace agrovest {

// -----------------------------------------------------------------------------
// UnitOfWork
// -----------------------------------------------------------------------------
//
// @brief  A Store::Transaction plus the notifications it will produce.
//
// @details
// Components call emit() while they stage writes. The events are held back
// until commit() succeeds and are then handed to the EventSink in emission
// order, stamped with the commit time. A unit that unwinds without
// committing drops its events together with its writes, so subscribers
// never observe a change that did not happen.
// -----------------------------------------------------------------------------
class UnitOfWork {
 public:
  UnitOfWork(Store& store, const ITimeProvider& clock, const EventSink& sink);

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  Store::Transaction& txn() { return txn_; }
  const ITimeProvider& clock() const { return clock_; }

  void emit(Event event) { events_.push_back(std::move(event)); }

  // Commits the transaction, then publishes the held events.
  void commit();

 private:
  Store::Transaction txn_;
  const ITimeProvider& clock_;
  const EventSink& sink_;
  std::vector<Event> events_;
};

// -----------------------------------------------------------------------------
// withContentionRetry(component, fn)
// -----------------------------------------------------------------------------
// Runs fn; if it fails with EngineError(Contention) runs it exactly once
// more. fn must build its own UnitOfWork so the retry starts from fresh
// committed state.
// -----------------------------------------------------------------------------
template <typename Fn>
auto withContentionRetry(const char* component, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const EngineError& e) {
    if (!e.retryable()) {
      throw;
    }
    std::cerr << "[" << component << "] WARNING: " << e.what()
              << ". Retrying once.\n";
  }
  return fn();
}

}  // namespace agrovest
