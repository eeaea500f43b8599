#pragma once

#include <mutex>

#include "parking/slot.h"

namespace parking {

/*
 Scoped owner of one Slot's lock.

 A guard either owns a locked slot or owns nothing. Ownership moves with
 std::move and the lock is released exactly once: by release() or by the
 destructor of whichever guard owns it last. This is how a lock taken
 inside an allocation strategy is handed to the caller.

   SlotGuard g = SlotGuard::tryAcquire(slot);
   if (g) {
     // we hold slot's lock
   }
*/
class SlotGuard {
public:
  SlotGuard() noexcept = default;

  // blocking acquire
  explicit SlotGuard(Slot& slot) : slot_(&slot) { slot.lock(); }

  // take over a lock the caller already holds
  SlotGuard(Slot& slot, std::adopt_lock_t) noexcept : slot_(&slot) {}

  SlotGuard(const SlotGuard&) = delete;
  SlotGuard& operator=(const SlotGuard&) = delete;

  SlotGuard(SlotGuard&& rhs) noexcept : slot_(rhs.slot_) { rhs.slot_ = nullptr; }

  SlotGuard& operator=(SlotGuard&& rhs) noexcept {
    if (this != &rhs) {
      release();
      slot_ = rhs.slot_;
      rhs.slot_ = nullptr;
    }
    return *this;
  }

  ~SlotGuard() { release(); }

  // empty guard if the slot is contended
  static SlotGuard tryAcquire(Slot& slot) {
    if (!slot.tryLock()) return SlotGuard();
    return SlotGuard(slot, std::adopt_lock);
  }

  explicit operator bool() const noexcept { return slot_ != nullptr; }

  Slot* get() const noexcept { return slot_; }
  Slot* operator->() const noexcept { return slot_; }
  Slot& operator*() const noexcept { return *slot_; }

  void release() noexcept {
    if (slot_) {
      slot_->unlock();
      slot_ = nullptr;
    }
  }

private:
  Slot* slot_ = nullptr;
};

} // namespace parking
