#include "parking/parkingService.h"

#include <set>
#include <stdexcept>
#include <utility>

#include "parking/errors.h"
#include "parking/logger.h"
#include "parking/slotGuard.h"
#include "parking/uuid.h"

using namespace std;

namespace parking {

ParkingService::ParkingService(vector<ParkingFloor> floors,
                               unique_ptr<SlotAllocationStrategy> strategy,
                               unique_ptr<PricingService> pricing,
                               shared_ptr<Clock> clock,
                               TicketIdGenerator newTicketId)
  : floors_(move(floors)),
    strategy_(move(strategy)),
    pricing_(move(pricing)),
    clock_(move(clock)),
    newTicketId_(newTicketId ? move(newTicketId) : TicketIdGenerator(newUUID)) {
  if (!strategy_) throw invalid_argument("allocation strategy is required");
  if (!pricing_) throw invalid_argument("pricing service is required");
  if (!clock_) throw invalid_argument("clock is required");
  if (floors_.empty()) throw invalid_argument("facility needs at least one floor");

  set<int> floorIds, slotIds;
  for (auto& floor : floors_) {
    if (!floorIds.insert(floor.id()).second)
      throw invalid_argument("duplicate floor id " + to_string(floor.id()));
    for (auto& slot : floor.slots())
      if (!slotIds.insert(slot->id()).second)
        throw invalid_argument("duplicate slot id " + to_string(slot->id()));
  }
}

optional<Ticket> ParkingService::parkVehicle(const Vehicle& vehicle) {
  if (tickets_.findByVehicle(vehicle.id)) {
    Logger::warn("ParkingService", "vehicle %s is already parked", vehicle.id.c_str());
    return nullopt;
  }

  // the strategy hands over a held lock; from here the guard releases it
  // on every path out of this function
  SlotGuard slot = strategy_->allocateSlot(floors_, vehicle.category);
  if (!slot) {
    Logger::warn("ParkingService", "no available %s slot for %s",
                 toString(vehicle.category), vehicle.id.c_str());
    return nullopt;
  }

  if (!slot->isFree()) {
    Logger::warn("ParkingService", "strategy handed over occupied slot %d, rejecting",
                 slot->id());
    return nullopt;
  }

  try {
    slot->occupy(vehicle);
  } catch (const InvariantViolation& e) {
    Logger::error("ParkingService", "%s", e.what());
    throw;
  }

  // slot and store must agree on every path: undo occupy if the ticket
  // cannot be minted or stored
  optional<Ticket> ticket;
  bool stored = false;
  try {
    ticket.emplace(newTicketId_(), *slot, vehicle, clock_->now());
    stored = tickets_.save(*ticket);
  } catch (const exception& e) {
    slot->vacate();
    Logger::error("ParkingService", "park of %s rolled back on slot %d: %s",
                  vehicle.id.c_str(), slot->id(), e.what());
    throw;
  }

  if (!stored) {
    slot->vacate();
    Logger::warn("ParkingService", "vehicle %s parked concurrently elsewhere, released slot %d",
                 vehicle.id.c_str(), slot->id());
    return nullopt;
  }

  Logger::info("ParkingService", "%s %s parked on slot %d, ticket %s",
               toString(vehicle.category), vehicle.id.c_str(), slot->id(),
               ticket->id().c_str());
  return ticket;
}

double ParkingService::unparkVehicle(const Ticket& ticket) {
  // use the stored record, not the caller's copy
  optional<Ticket> live = tickets_.findById(ticket.id());
  if (!live) throw InvalidTicket(ticket.id());

  SlotGuard slot(live->slot());

  // a concurrent unpark of the same ticket may have won while we waited;
  // every removal of this ticket happens under this slot's lock
  if (!tickets_.findById(ticket.id())) throw InvalidTicket(ticket.id());

  TimePoint exit = clock_->now();
  if (exit < live->entryTime()) exit = live->entryTime();
  double fee = pricing_->calculatePrice(live->entryTime(), exit);

  slot->vacate();
  if (!tickets_.remove(ticket.id())) {
    Logger::error("ParkingService", "ticket %s vanished under slot %d lock",
                  ticket.id().c_str(), slot->id());
    throw InvariantViolation("ticket " + ticket.id() + " removed outside its slot lock");
  }

  Logger::info("ParkingService", "%s left slot %d, fee %.2f",
               live->vehicleId().c_str(), slot->id(), fee);
  return fee;
}

optional<Ticket> ParkingService::findTicket(const string& ticketId) const {
  return tickets_.findById(ticketId);
}

optional<Ticket> ParkingService::findTicketByVehicle(const string& vehicleId) const {
  return tickets_.findByVehicle(vehicleId);
}

vector<int> ParkingService::getAvailableSlots(VehicleCategory category) {
  vector<int> res;
  for (auto& floor : floors_) {
    for (auto& slot : floor.slots()) {
      if (slot->category() != category) continue;
      SlotGuard guard(*slot);
      if (guard->isFree()) res.push_back(slot->id());
    }
  }
  return res;
}

} // namespace parking
