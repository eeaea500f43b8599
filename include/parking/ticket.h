#pragma once

#include <string>

#include "parking/clock.h"
#include "parking/slot.h"
#include "parking/vehicle.h"

namespace parking {

// Receipt for one stay. Immutable; the slot is a non-owning back-reference
// that stays valid for the lifetime of the ParkingService that issued it.
class Ticket {
public:
  Ticket(std::string id, Slot& slot, Vehicle vehicle, TimePoint entryTime);

  const std::string& id() const { return id_; }
  Slot& slot() const { return *slot_; }
  int slotId() const { return slot_->id(); }
  const Vehicle& vehicle() const { return vehicle_; }
  const std::string& vehicleId() const { return vehicle_.id; }
  TimePoint entryTime() const { return entryTime_; }

private:
  std::string id_;
  Slot* slot_;
  Vehicle vehicle_;
  TimePoint entryTime_;
};

} // namespace parking
