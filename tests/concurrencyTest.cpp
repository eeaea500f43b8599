#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "parking/errors.h"
#include "parking/parkingService.h"
#include "testSupport.h"

using namespace parking;
using namespace parking::test;

namespace {

size_t workerCount() {
  const unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) return 8;
  return std::max<size_t>(4, std::min<size_t>(hw * 2, 32));
}

void waitForStart(const std::atomic<bool>& start) {
  while (!start.load(std::memory_order_acquire)) std::this_thread::yield();
}

// every slot of every floor must agree with the ticket store
void expectConsistent(ParkingService& svc) {
  for (auto& floor : svc.floors()) {
    for (auto& slot : floor.slots()) {
      SlotGuard g(*slot);
      if (g->isFree()) continue;
      auto t = svc.findTicketByVehicle(g->occupant()->id);
      ASSERT_TRUE(t) << "slot " << slot->id() << " occupied without a live ticket";
      EXPECT_EQ(t->slotId(), slot->id());
    }
  }
  size_t occupied = 0;
  for (auto& floor : svc.floors())
    for (auto& slot : floor.slots()) {
      SlotGuard g(*slot);
      if (!g->isFree()) ++occupied;
    }
  EXPECT_EQ(occupied, svc.activeTicketCount());
}

} // namespace

TEST(ConcurrencyTest, OneFreeSlotHasExactlyOneWinner) {
  auto clock = std::make_shared<ManualClock>();
  auto svc = makeService(makeFloors({{1, {{1, VehicleCategory::CAR}, {2, VehicleCategory::BIKE}}}}),
                         clock);

  const size_t n = workerCount();
  std::atomic<bool> start{false};
  std::atomic<int> winners{0};
  std::vector<std::thread> workers;

  for (size_t i = 0; i < n; ++i) {
    workers.emplace_back([&, i] {
      waitForStart(start);
      if (svc->parkVehicle(car("CAR-" + std::to_string(i)))) winners.fetch_add(1);
    });
  }
  start.store(true, std::memory_order_release);
  for (auto& w : workers) w.join();

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(svc->activeTicketCount(), 1u);
  expectConsistent(*svc);
}

TEST(ConcurrencyTest, NoSlotIsDoubleBooked) {
  auto clock = std::make_shared<ManualClock>();
  const int slots = 10;
  std::vector<std::pair<int, VehicleCategory>> layout;
  for (int i = 1; i <= slots; ++i) layout.push_back({i, VehicleCategory::CAR});
  auto svc = makeService(makeFloors({{1, layout}}), clock);

  const size_t n = std::max<size_t>(workerCount(), slots + 4);
  std::atomic<bool> start{false};
  std::mutex mtx;
  std::map<int, int> ticketsPerSlot;
  std::vector<std::thread> workers;

  for (size_t i = 0; i < n; ++i) {
    workers.emplace_back([&, i] {
      waitForStart(start);
      auto t = svc->parkVehicle(car("CAR-" + std::to_string(i)));
      if (!t) return;
      std::lock_guard<std::mutex> lock(mtx);
      ++ticketsPerSlot[t->slotId()];
    });
  }
  start.store(true, std::memory_order_release);
  for (auto& w : workers) w.join();

  EXPECT_EQ(ticketsPerSlot.size(), static_cast<size_t>(slots));
  for (auto& [slotId, count] : ticketsPerSlot) EXPECT_EQ(count, 1) << "slot " << slotId;
  expectConsistent(*svc);
}

TEST(ConcurrencyTest, RacingRedeemsOfOneTicketBillOnce) {
  auto clock = std::make_shared<ManualClock>();
  auto svc = makeService(makeFloors({{1, {{1, VehicleCategory::CAR}}}}), clock);

  for (int round = 0; round < 50; ++round) {
    auto t = svc->parkVehicle(car("A"));
    ASSERT_TRUE(t);

    std::atomic<bool> start{false};
    std::atomic<int> paid{0}, rejected{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
      workers.emplace_back([&] {
        waitForStart(start);
        try {
          svc->unparkVehicle(*t);
          paid.fetch_add(1);
        } catch (const InvalidTicket&) {
          rejected.fetch_add(1);
        }
      });
    }
    start.store(true, std::memory_order_release);
    for (auto& w : workers) w.join();

    ASSERT_EQ(paid.load(), 1);
    ASSERT_EQ(rejected.load(), 3);
    ASSERT_EQ(svc->activeTicketCount(), 0u);
  }
}

TEST(ConcurrencyTest, ChurnKeepsSlotsAndTicketsInAgreement) {
  auto clock = std::make_shared<ManualClock>();
  auto svc = makeService(makeFloors({
    {1, {{1, VehicleCategory::CAR}, {2, VehicleCategory::BIKE}, {3, VehicleCategory::CAR}}},
    {2, {{4, VehicleCategory::CAR}, {5, VehicleCategory::BIKE}}},
  }), clock);

  const size_t n = workerCount();
  const int iterations = 200;
  std::atomic<bool> start{false};
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;

  for (size_t i = 0; i < n; ++i) {
    workers.emplace_back([&, i] {
      Vehicle v{"V-" + std::to_string(i), (i % 3 == 0) ? VehicleCategory::BIKE : VehicleCategory::CAR};
      waitForStart(start);
      for (int k = 0; k < iterations; ++k) {
        auto t = svc->parkVehicle(v);
        if (!t) {
          std::this_thread::yield();
          continue;
        }
        try {
          svc->unparkVehicle(*t);
        } catch (const ParkingError&) {
          failures.fetch_add(1);
        }
      }
    });
  }
  start.store(true, std::memory_order_release);
  for (auto& w : workers) w.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(svc->activeTicketCount(), 0u);
  expectConsistent(*svc);
  EXPECT_EQ(svc->getAvailableSlots(VehicleCategory::CAR), (std::vector<int>{1, 3, 4}));
  EXPECT_EQ(svc->getAvailableSlots(VehicleCategory::BIKE), (std::vector<int>{2, 5}));
}
