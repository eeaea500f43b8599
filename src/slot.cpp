#include "parking/slot.h"

#include <string>

#include "parking/errors.h"

using namespace std;

namespace parking {

Slot::Slot(int id, VehicleCategory category)
  : id_(id), category_(category), status_(SlotStatus::FREE) {}

bool Slot::tryLock() {
  return mtx_.try_lock();
}

void Slot::lock() {
  mtx_.lock();
}

void Slot::unlock() {
  mtx_.unlock();
}

bool Slot::isFree() const {
  return status_ == SlotStatus::FREE;
}

void Slot::occupy(const Vehicle& vehicle) {
  if (status_ != SlotStatus::FREE) {
    throw InvariantViolation("occupy on non-free slot " + to_string(id_) +
                             " (occupant " + (occupant_ ? occupant_->id : string("?")) + ")");
  }
  if (vehicle.category != category_) {
    throw InvariantViolation("vehicle " + vehicle.id + " (" + toString(vehicle.category) +
                             ") does not fit " + toString(category_) + " slot " + to_string(id_));
  }
  occupant_ = vehicle;
  status_ = SlotStatus::OCCUPIED;
}

void Slot::vacate() {
  if (status_ != SlotStatus::OCCUPIED) {
    throw InvariantViolation("vacate on free slot " + to_string(id_));
  }
  occupant_.reset();
  status_ = SlotStatus::FREE;
}

} // namespace parking
