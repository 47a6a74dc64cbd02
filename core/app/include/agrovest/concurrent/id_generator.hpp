#pragma once

#include <atomic>
#include <cstdint>

namespace agrovest {

// -----------------------------------------------------------------------------
// IdGenerator: monotonically increasing record id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids for one record table. The Store owns one
//         generator per table (packages, investments, payments, ledger
//         entries, withdrawals).
//
// @details
// Starts at 1; 0 is the "unassigned" sentinel used by the domain records.
// Ids taken by a transaction that later rolls back are not reused. Gaps are
// acceptable; reuse is not.
//
// Thread model: next_id() is safe from any thread. Relaxed ordering is
// enough because only uniqueness of the returned values matters.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  // Two copies would hand out the same ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Moves the counter past an id that was assigned elsewhere (seed data).
  void observe(std::uint64_t used_id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= used_id &&
           !next_id_.compare_exchange_weak(current, used_id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace agrovest
