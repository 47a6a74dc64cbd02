#pragma once

#include "agrovest/domain/records.hpp"
#include "agrovest/store/unit_of_work.hpp"

#include <cstdint>

namespace agrovest {

// -----------------------------------------------------------------------------
// ReservationPolicy
// -----------------------------------------------------------------------------
// When a purchase takes units out of available_slots.
//
//   OnPayment  (direct packages): reserve() only checks capacity; commit()
//              decrements after payment success. A pending investment holds
//              nothing.
//   OnCreation (storage plans):   reserve() decrements at purchase;
//              commit() is bookkeeping; cancelling releases the units.
// -----------------------------------------------------------------------------
enum class ReservationPolicy { OnPayment, OnCreation };

ReservationPolicy reservationPolicyFor(domain::PackageKind kind);

// Result of reserve(). held tells whether units were already taken; the
// caller copies it into Investment::slot_held.
struct ReservationToken {
  domain::PackageId package_id{0};
  std::int64_t units{0};
  bool held{false};
};

// -----------------------------------------------------------------------------
// InventoryAllocator
// -----------------------------------------------------------------------------
//
// @brief  Sole writer of InvestmentPackage::available_slots.
//
// @details
// Every method locks the package row inside the caller's unit before
// reading the counters, so concurrent buyers of the last slot serialize on
// that lock and exactly one of them sees available_slots > 0.
//
// Guarantees, for every package at every commit:
//     0 <= available_slots <= total_slots
// reserve()/commit() raise EngineError(OutOfStock) rather than going
// negative; release() raises EngineError(Internal) rather than exceeding
// total_slots. A lock wait past the Store timeout raises
// EngineError(Contention).
//
// Thread model: Stateless; all state lives in the Store. Safe from any
// request thread.
// -----------------------------------------------------------------------------
class InventoryAllocator {
 public:
  InventoryAllocator() = default;

  // Validates counters and terms, inserts the package.
  domain::InvestmentPackage createPackage(
      UnitOfWork& unit, domain::InvestmentPackage draft) const;

  // Active <-> inactive. Inactive packages refuse new reservations.
  domain::InvestmentPackage setStatus(UnitOfWork& unit, domain::PackageId id,
                                      domain::PackageStatus status) const;

  ReservationToken reserve(UnitOfWork& unit, domain::PackageId id,
                           std::int64_t units) const;

  // Makes the reservation permanent. Returns the token with held == true.
  ReservationToken commit(UnitOfWork& unit,
                          const ReservationToken& token) const;

  // Returns units taken earlier. Callers only release what they hold.
  void release(UnitOfWork& unit, domain::PackageId id,
               std::int64_t units) const;

 private:
  static domain::InvestmentPackage lockAndLoad(UnitOfWork& unit,
                                               domain::PackageId id);
  static void store(UnitOfWork& unit, const domain::InvestmentPackage& pkg,
                    std::int64_t delta);
};

}  // namespace agrovest
