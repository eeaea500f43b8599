#pragma once

#include <mutex>
#include <optional>

#include "parking/vehicle.h"

namespace parking {

enum class SlotStatus { FREE, OCCUPIED };

/*
 One physical parking space: the unit of contention.

 The slot's own mutex protects status_ and occupant_. Every read or write
 of either must happen with the lock held by the caller; status observed
 before taking the lock is stale. Invariant: status_ == OCCUPIED iff
 occupant_ has a value.
*/
class Slot {
public:
  Slot(int id, VehicleCategory category);

  Slot(const Slot&) = delete;
  Slot& operator=(const Slot&) = delete;

  int id() const { return id_; }
  VehicleCategory category() const { return category_; }

  // non-blocking; false if another thread holds the lock
  bool tryLock();
  void lock();
  void unlock();

  // --- lock must be held for everything below ---
  bool isFree() const;
  SlotStatus status() const { return status_; }
  const std::optional<Vehicle>& occupant() const { return occupant_; }

  /**
   * FREE -> OCCUPIED.
   * @throws InvariantViolation if the slot is not free or the vehicle's
   *         category does not match the slot's.
   */
  void occupy(const Vehicle& vehicle);

  /**
   * OCCUPIED -> FREE.
   * @throws InvariantViolation if the slot is already free.
   */
  void vacate();

private:
  const int id_;
  const VehicleCategory category_;
  SlotStatus status_;
  std::optional<Vehicle> occupant_;
  std::mutex mtx_;
};

} // namespace parking
