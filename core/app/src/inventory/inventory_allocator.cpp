#include "agrovest/inventory/inventory_allocator.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <iostream>
#include <string>

namespace agrovest {

ReservationPolicy reservationPolicyFor(domain::PackageKind kind) {
  switch (kind) {
    case domain::PackageKind::Direct:  return ReservationPolicy::OnPayment;
    case domain::PackageKind::Storage: return ReservationPolicy::OnCreation;
  }
  return ReservationPolicy::OnPayment;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
domain::InvestmentPackage InventoryAllocator::lockAndLoad(UnitOfWork& unit,
                                                          domain::PackageId id) {
  unit.txn().lockPackage(id);
  auto pkg = unit.txn().package(id);
  if (!pkg.has_value()) {
    throw EngineError(ErrorCode::NotFound,
                      "Package " + std::to_string(id) + " not found");
  }
  return *pkg;
}

void InventoryAllocator::store(UnitOfWork& unit,
                               const domain::InvestmentPackage& pkg,
                               std::int64_t delta) {
  unit.txn().update(pkg);

  InventoryUpdateEvent event;
  event.package_id = pkg.id;
  event.total_slots = pkg.total_slots;
  event.available_slots = pkg.available_slots;
  event.delta = delta;
  unit.emit(event);
}

// -----------------------------------------------------------------------------
// createPackage()
// -----------------------------------------------------------------------------
domain::InvestmentPackage InventoryAllocator::createPackage(
    UnitOfWork& unit, domain::InvestmentPackage draft) const {
  if (draft.name.empty()) {
    throw EngineError(ErrorCode::Validation, "Package name is required");
  }
  if (draft.total_slots < 0 || draft.available_slots < 0 ||
      draft.available_slots > draft.total_slots) {
    throw EngineError(ErrorCode::Validation,
                      "Package slots must satisfy 0 <= available <= total");
  }
  if (draft.terms.duration_days <= 0) {
    throw EngineError(ErrorCode::Validation,
                      "Package duration must be positive");
  }
  if (draft.min_amount.isNegative() || draft.max_amount.isNegative() ||
      (!draft.max_amount.isZero() && draft.max_amount < draft.min_amount)) {
    throw EngineError(ErrorCode::Validation, "Invalid package amount bounds");
  }

  draft.created_at = unit.clock().now_ms();
  auto pkg = unit.txn().insert(draft);

  InventoryUpdateEvent event;
  event.package_id = pkg.id;
  event.total_slots = pkg.total_slots;
  event.available_slots = pkg.available_slots;
  unit.emit(event);
  return pkg;
}

domain::InvestmentPackage InventoryAllocator::setStatus(
    UnitOfWork& unit, domain::PackageId id,
    domain::PackageStatus status) const {
  auto pkg = lockAndLoad(unit, id);
  pkg.status = status;
  store(unit, pkg, 0);
  return pkg;
}

// -----------------------------------------------------------------------------
// reserve()
// -----------------------------------------------------------------------------
ReservationToken InventoryAllocator::reserve(UnitOfWork& unit,
                                             domain::PackageId id,
                                             std::int64_t units) const {
  if (units < 1) {
    throw EngineError(ErrorCode::Validation, "Units must be at least 1");
  }

  auto pkg = lockAndLoad(unit, id);
  if (pkg.status != domain::PackageStatus::Active) {
    throw EngineError(ErrorCode::InvalidTransition,
                      "Package " + pkg.name + " is not available",
                      domain::toString(pkg.status));
  }
  if (pkg.available_slots < units) {
    throw EngineError(ErrorCode::OutOfStock,
                      "Only " + std::to_string(pkg.available_slots) +
                          " slot(s) available in " + pkg.name);
  }

  ReservationToken token{pkg.id, units, false};
  if (reservationPolicyFor(pkg.kind) == ReservationPolicy::OnCreation) {
    pkg.available_slots -= units;
    store(unit, pkg, -units);
    token.held = true;
  }
  return token;
}

// -----------------------------------------------------------------------------
// commit()
// -----------------------------------------------------------------------------
ReservationToken InventoryAllocator::commit(
    UnitOfWork& unit, const ReservationToken& token) const {
  if (token.held) {
    return token;
  }

  auto pkg = lockAndLoad(unit, token.package_id);
  if (pkg.available_slots < token.units) {
    std::cerr << "[InventoryAllocator] WARNING: package " << pkg.id
              << " sold out before payment could be applied.\n";
    throw EngineError(ErrorCode::OutOfStock,
                      "No slots left in " + pkg.name);
  }
  pkg.available_slots -= token.units;
  store(unit, pkg, -token.units);

  ReservationToken committed = token;
  committed.held = true;
  return committed;
}

// -----------------------------------------------------------------------------
// release()
// -----------------------------------------------------------------------------
void InventoryAllocator::release(UnitOfWork& unit, domain::PackageId id,
                                 std::int64_t units) const {
  auto pkg = lockAndLoad(unit, id);
  if (units < 1 || pkg.available_slots + units > pkg.total_slots) {
    throw EngineError(ErrorCode::Internal,
                      "Release of " + std::to_string(units) +
                          " unit(s) would exceed capacity of package " +
                          std::to_string(id));
  }
  pkg.available_slots += units;
  store(unit, pkg, units);
}

}  // namespace agrovest
