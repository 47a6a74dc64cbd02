#pragma once

#include "agrovest/time/i_time_provider.hpp"

namespace agrovest {

// -----------------------------------------------------------------------------
// LiveTimeProvider
// -----------------------------------------------------------------------------
// Wall-clock time from std::chrono::system_clock. Stateless; safe from any
// thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace agrovest
