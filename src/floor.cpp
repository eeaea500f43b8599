#include "parking/floor.h"

using namespace std;

namespace parking {

Slot& ParkingFloor::addSlot(int slotId, VehicleCategory category) {
  slots_.push_back(make_unique<Slot>(slotId, category));
  return *slots_.back();
}

Slot* ParkingFloor::findSlot(int slotId) const {
  for (auto& slot : slots_)
    if (slot->id() == slotId) return slot.get();
  return nullptr;
}

} // namespace parking
