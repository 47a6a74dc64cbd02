#pragma once

#include <cstdint>

namespace agrovest {

// -----------------------------------------------------------------------------
// ITimeProvider: injected clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every timestamp the engine writes: created_at,
//         paid_at, start/end dates, processed dates, payment references.
//
// @details
// Components hold a `const ITimeProvider&` and never read the system clock
// themselves. Production injects LiveTimeProvider; tests inject
// SimulationTimeProvider so maturity rules ("not yet due") can be exercised
// by moving the clock instead of sleeping for days.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently. Writers of a settable clock
//   synchronize internally.
//
// Ownership:
//   Borrowed. The provider must outlive every component referencing it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace agrovest
