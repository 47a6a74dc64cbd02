#pragma once

#include "agrovest/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace agrovest {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Records store epoch milliseconds (from ITimeProvider); events carry a
// Timestamp. These bridge the two.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Whole seconds, as used in gateway and payout references.
inline std::int64_t ms_to_epoch_seconds(std::int64_t ms) { return ms / 1000; }

}  // namespace agrovest
