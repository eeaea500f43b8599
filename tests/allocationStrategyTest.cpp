#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "parking/allocationStrategy.h"
#include "testSupport.h"

using namespace parking;
using namespace parking::test;

namespace {

std::vector<ParkingFloor> stockFloors() {
  return makeFloors({
    {1, {{6, VehicleCategory::BIKE}, {3, VehicleCategory::CAR}, {1, VehicleCategory::CAR}}},
    {2, {{2, VehicleCategory::CAR}, {4, VehicleCategory::BIKE}, {5, VehicleCategory::BIKE}}},
  });
}

void occupy(Slot& slot, const Vehicle& v) {
  SlotGuard g(slot);
  g->occupy(v);
}

} // namespace

TEST(NearestSlotAllocationStrategyTest, PicksFirstMatchingSlotInFloorThenSlotOrder) {
  auto floors = stockFloors();
  NearestSlotAllocationStrategy strategy;

  SlotGuard carSlot = strategy.allocateSlot(floors, VehicleCategory::CAR);
  ASSERT_TRUE(carSlot);
  EXPECT_EQ(carSlot->id(), 3);

  SlotGuard bikeSlot = strategy.allocateSlot(floors, VehicleCategory::BIKE);
  ASSERT_TRUE(bikeSlot);
  EXPECT_EQ(bikeSlot->id(), 6);
}

TEST(NearestSlotAllocationStrategyTest, ReturnedSlotIsStillLocked) {
  auto floors = stockFloors();
  NearestSlotAllocationStrategy strategy;

  SlotGuard slot = strategy.allocateSlot(floors, VehicleCategory::CAR);
  ASSERT_TRUE(slot);

  bool acquired = true;
  std::thread other([&] { acquired = slot->tryLock(); });
  other.join();
  EXPECT_FALSE(acquired);
}

TEST(NearestSlotAllocationStrategyTest, SkipsContendedSlotWithoutBlocking) {
  auto floors = stockFloors();
  NearestSlotAllocationStrategy strategy;

  // slot 3 is being decided on by "another thread"
  SlotGuard held = strategy.allocateSlot(floors, VehicleCategory::CAR);
  ASSERT_EQ(held->id(), 3);

  int picked = -1;
  std::thread other([&] {
    SlotGuard next = strategy.allocateSlot(floors, VehicleCategory::CAR);
    if (next) picked = next->id();
  });
  other.join();
  EXPECT_EQ(picked, 1);
}

TEST(NearestSlotAllocationStrategyTest, SkipsOccupiedSlotsAndReleasesThem) {
  auto floors = stockFloors();
  occupy(*floors[0].findSlot(3), car("A"));
  occupy(*floors[0].findSlot(1), car("B"));

  NearestSlotAllocationStrategy strategy;
  SlotGuard slot = strategy.allocateSlot(floors, VehicleCategory::CAR);
  ASSERT_TRUE(slot);
  EXPECT_EQ(slot->id(), 2);

  // the occupied slots probed on the way were unlocked again
  EXPECT_TRUE(floors[0].findSlot(3)->tryLock());
  floors[0].findSlot(3)->unlock();
  EXPECT_TRUE(floors[0].findSlot(1)->tryLock());
  floors[0].findSlot(1)->unlock();
}

TEST(NearestSlotAllocationStrategyTest, ReturnsEmptyWhenNothingFits) {
  auto floors = stockFloors();
  occupy(*floors[0].findSlot(3), car("A"));
  occupy(*floors[0].findSlot(1), car("B"));
  occupy(*floors[1].findSlot(2), car("C"));

  NearestSlotAllocationStrategy strategy;
  EXPECT_FALSE(strategy.allocateSlot(floors, VehicleCategory::CAR));

  for (auto& floor : floors)
    for (auto& slot : floor.slots()) {
      EXPECT_TRUE(slot->tryLock()) << "slot " << slot->id() << " left locked";
      slot->unlock();
    }
}

TEST(NearestSlotAllocationStrategyTest, EmptyFacilityYieldsNothing) {
  std::vector<ParkingFloor> floors;
  NearestSlotAllocationStrategy strategy;
  EXPECT_FALSE(strategy.allocateSlot(floors, VehicleCategory::BIKE));
}
