#include "parking/allocationStrategy.h"

#include "parking/logger.h"

using namespace std;

namespace parking {

SlotGuard NearestSlotAllocationStrategy::allocateSlot(vector<ParkingFloor>& floors,
                                                      VehicleCategory category) {
  for (auto& floor : floors) {
    for (auto& slot : floor.slots()) {
      if (slot->category() != category) continue;

      // never block during the scan: a held lock means someone else is
      // deciding about this slot right now
      SlotGuard guard = SlotGuard::tryAcquire(*slot);
      if (!guard) {
        Logger::debug("Allocator", "slot %d on floor %d contended, skipping",
                      slot->id(), floor.id());
        continue;
      }

      // status seen before locking may be stale, so check again under the lock
      if (guard->isFree()) {
        Logger::debug("Allocator", "got free slot %d on floor %d", slot->id(), floor.id());
        return guard;   // lock stays held; the caller owns it now
      }
      // occupied: guard goes out of scope and releases the lock
    }
  }
  return SlotGuard();
}

} // namespace parking
