#pragma once

#include "agrovest/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace agrovest {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Settable clock for tests and offline replays.
//
// @details
// now_ms() returns whatever advance_time() stored last (0 initially).
// advance_by() moves the clock forward relative to its current value, which
// is how tests step across an investment's duration.
//
// Thread-safety: All methods are safe from any thread (std::atomic).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace agrovest
