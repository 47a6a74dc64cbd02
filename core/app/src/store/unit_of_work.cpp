#include "agrovest/store/unit_of_work.hpp"

#include "agrovest/time/time_utils.hpp"

#include <variant>

namespace agrovest {

UnitOfWork::UnitOfWork(Store& store, const ITimeProvider& clock,
                       const EventSink& sink)
    : txn_(store.begin()), clock_(clock), sink_(sink) {}

void UnitOfWork::commit() {
  txn_.commit();

  if (!sink_) {
    events_.clear();
    return;
  }

  const Timestamp committed_at = ms_to_timestamp(clock_.now_ms());
  for (auto& event : events_) {
    std::visit([committed_at](auto& e) { e.timestamp = committed_at; }, event);
    sink_(std::move(event));
  }
  events_.clear();
}

}  // namespace agrovest
