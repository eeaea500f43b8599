#pragma once

#include <vector>

#include "parking/floor.h"
#include "parking/slotGuard.h"

namespace parking {

/*
 Policy that picks a slot for an arriving vehicle.

 Contract: the returned guard, when non-empty, owns the lock of a slot
 that was FREE when checked under that lock and whose category matches.
 The caller becomes solely responsible for the lock. An empty guard means
 no eligible slot was found; no lock is held in that case.
*/
class SlotAllocationStrategy {
public:
  virtual ~SlotAllocationStrategy() = default;
  virtual SlotGuard allocateSlot(std::vector<ParkingFloor>& floors,
                                 VehicleCategory category) = 0;
};

// First fit: floors in order, slots in order. Contended slots are
// skipped rather than waited on.
class NearestSlotAllocationStrategy : public SlotAllocationStrategy {
public:
  SlotGuard allocateSlot(std::vector<ParkingFloor>& floors,
                         VehicleCategory category) override;
};

} // namespace parking
