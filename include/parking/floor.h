#pragma once

#include <memory>
#include <vector>

#include "parking/slot.h"

namespace parking {

// Ordered slots of one floor. Slots live behind unique_ptr so their
// addresses stay stable when the floor itself is moved.
class ParkingFloor {
public:
  explicit ParkingFloor(int id) : id_(id) {}

  ParkingFloor(ParkingFloor&&) = default;
  ParkingFloor& operator=(ParkingFloor&&) = default;

  int id() const { return id_; }

  Slot& addSlot(int slotId, VehicleCategory category);

  const std::vector<std::unique_ptr<Slot>>& slots() const { return slots_; }

  // nullptr if no slot with that id lives on this floor
  Slot* findSlot(int slotId) const;

private:
  int id_;
  std::vector<std::unique_ptr<Slot>> slots_;
};

} // namespace parking
