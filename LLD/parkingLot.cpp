#include <getopt.h>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "parking/config.h"
#include "parking/errors.h"
#include "parking/logger.h"
#include "parking/parkingService.h"
using namespace std;
using namespace parking;

/*
 1) APIs: (thread-safe, call them from any number of threads)
    - parkVehicle(vehicle) -> optional<Ticket>       (nullopt == lot full for that category)
    - unparkVehicle(ticket) -> fee                   (throws InvalidTicket on reuse)
    - getAvailableSlots(category) -> List<SlotId>
    - findTicketByVehicle(vehicleId) -> optional<Ticket>
*/

/*
 2) Flow:
    - provisioning builds the floors once (defaultFacility() or PARKING_LAYOUT)
    - on entry: parkVehicle() -> strategy try-locks slots first-fit, hands back
      the winner still locked -> occupy + ticket -> unlock
    - on exit: unparkVehicle() -> lock the ticket's slot -> fee -> vacate +
      retire ticket -> unlock
*/

namespace {

void usage(const char* program) {
  fprintf(stderr, "Usage: %s [-e envFile] [-t threads]\n", program);
}

void printAvailability(ParkingService& svc) {
  for (auto category : {VehicleCategory::CAR, VehicleCategory::BIKE}) {
    auto free = svc.getAvailableSlots(category);
    string ids;
    for (int id : free) ids += (ids.empty() ? "" : ",") + to_string(id);
    Logger::info("Demo", "free %s slots: [%s]", toString(category), ids.c_str());
  }
}

// four cars into three car slots, then bikes likewise
void runStockScenario(ParkingService& svc) {
  Logger::info("Demo", "--- stock scenario ---");

  vector<Vehicle> cars = {
    {"KA-123-456-89", VehicleCategory::CAR},
    {"UP-92-123-456", VehicleCategory::CAR},
    {"UP-92-123-457", VehicleCategory::CAR},
    {"UP-92-123-458", VehicleCategory::CAR},
  };
  vector<Vehicle> bikes = {
    {"KA-987-65-432", VehicleCategory::BIKE},
    {"UP-92-987-65", VehicleCategory::BIKE},
    {"KA-987-65-431", VehicleCategory::BIKE},
    {"UP-92-987-66", VehicleCategory::BIKE},
  };

  vector<optional<Ticket>> carTickets;
  for (auto& car : cars) carTickets.push_back(svc.parkVehicle(car));
  if (carTickets[0]) {
    double fee = svc.unparkVehicle(*carTickets[0]);
    Logger::info("Demo", "%s paid %.2f", cars[0].id.c_str(), fee);
  }
  svc.parkVehicle(cars[3]);

  vector<optional<Ticket>> bikeTickets;
  for (auto& bike : bikes) bikeTickets.push_back(svc.parkVehicle(bike));
  if (bikeTickets[1]) {
    double fee = svc.unparkVehicle(*bikeTickets[1]);
    Logger::info("Demo", "%s paid %.2f", bikes[1].id.c_str(), fee);
  }
  svc.parkVehicle(bikes[3]);

  // redeeming the same ticket twice must fail
  if (carTickets[0]) {
    try {
      svc.unparkVehicle(*carTickets[0]);
    } catch (const InvalidTicket& e) {
      Logger::info("Demo", "second redeem rejected: %s", e.what());
    }
  }

  printAvailability(svc);

  // leave the lot empty for the rush
  for (auto& vehicle : cars)
    if (auto t = svc.findTicketByVehicle(vehicle.id)) svc.unparkVehicle(*t);
  for (auto& vehicle : bikes)
    if (auto t = svc.findTicketByVehicle(vehicle.id)) svc.unparkVehicle(*t);
}

// every thread tries to park one vehicle at the same moment, then leaves
void runRush(ParkingService& svc, int threads) {
  Logger::info("Demo", "--- rush: %d concurrent arrivals ---", threads);

  atomic<bool> go{false};
  atomic<int> parked{0}, turnedAway{0};
  vector<thread> workers;

  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&, i] {
      Vehicle v{"RUSH-" + to_string(i), (i % 2) ? VehicleCategory::BIKE : VehicleCategory::CAR};
      while (!go.load(memory_order_acquire)) this_thread::yield();

      auto ticket = svc.parkVehicle(v);
      if (!ticket) {
        turnedAway.fetch_add(1);
        return;
      }
      parked.fetch_add(1);
      this_thread::yield();
      svc.unparkVehicle(*ticket);
    });
  }

  go.store(true, memory_order_release);
  for (auto& w : workers) w.join();

  Logger::info("Demo", "rush done: %d parked, %d turned away, %zu tickets live",
               parked.load(), turnedAway.load(), svc.activeTicketCount());
}

} // namespace

int main(int argc, char* argv[]) {
  int threads = 8;
  const char* envFile = nullptr;

  int opt;
  while ((opt = getopt(argc, argv, "e:t:h")) != -1) {
    switch (opt) {
      case 'e':
        envFile = optarg;
        break;
      case 't':
        threads = atoi(optarg);
        if (threads <= 0) {
          usage(argv[0]);
          return 1;
        }
        break;
      case 'h':
        usage(argv[0]);
        return 0;
      default:
        usage(argv[0]);
        return 1;
    }
  }

  try {
    if (envFile) Config::loadEnvFile(envFile);

    FacilityConfig config = defaultFacility();
    applyEnvOverrides(config);
    auto svc = makeParkingService(config);

    runStockScenario(*svc);
    runRush(*svc, threads);
    printAvailability(*svc);
  } catch (const exception& e) {
    Logger::error("Demo", "%s", e.what());
    return 1;
  }
  return 0;
}

/* Thread-safety & scaling notes:
   - One mutex per slot, so two cars can park in different slots concurrently.
   - The scan only try-locks; the winner's lock is handed to the service inside
     a SlotGuard, which releases it on every path.
   - The ticket store uses a shared_mutex and is always locked after a slot
     lock, never before.
*/
