#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "parking/allocationStrategy.h"
#include "parking/clock.h"
#include "parking/floor.h"
#include "parking/pricingService.h"
#include "parking/ticket.h"
#include "parking/ticketRepository.h"
#include "parking/vehicle.h"

namespace parking {

using TicketIdGenerator = std::function<std::string()>;

/*
 Orchestrates park/unpark over one facility.

 Owns the floors (and through them the slots), the ticket store, the
 allocation policy and the pricing policy. All public member functions are
 thread-safe and may be called concurrently.

 Lock order is always slot lock -> ticket store lock, never the reverse.
*/
class ParkingService {
public:
  /**
   * @throws std::invalid_argument on an empty facility, duplicate floor or
   *         slot ids, or a null collaborator
   */
  ParkingService(std::vector<ParkingFloor> floors,
                 std::unique_ptr<SlotAllocationStrategy> strategy,
                 std::unique_ptr<PricingService> pricing,
                 std::shared_ptr<Clock> clock = std::make_shared<SystemClock>(),
                 TicketIdGenerator newTicketId = nullptr);

  ParkingService(const ParkingService&) = delete;
  ParkingService& operator=(const ParkingService&) = delete;

  /**
   * @brief Assign a free slot of the vehicle's category and issue a ticket.
   * @return the ticket, or nullopt if no slot is available or the vehicle
   *         is already parked
   * @throws InvariantViolation if the slot handed over by the strategy
   *         cannot be occupied; the slot lock is released first
   */
  std::optional<Ticket> parkVehicle(const Vehicle& vehicle);

  /**
   * @brief Redeem a ticket: free its slot and return the fee.
   * @throws InvalidTicket if the ticket is unknown or already redeemed
   */
  double unparkVehicle(const Ticket& ticket);

  std::optional<Ticket> findTicket(const std::string& ticketId) const;
  std::optional<Ticket> findTicketByVehicle(const std::string& vehicleId) const;

  // Snapshot of free slot ids in allocation order. Each slot is locked
  // briefly; the result may be stale as soon as it is returned.
  std::vector<int> getAvailableSlots(VehicleCategory category);

  std::size_t activeTicketCount() const { return tickets_.size(); }

  const std::vector<ParkingFloor>& floors() const { return floors_; }

private:
  std::vector<ParkingFloor> floors_;
  std::unique_ptr<SlotAllocationStrategy> strategy_;
  std::unique_ptr<PricingService> pricing_;
  std::shared_ptr<Clock> clock_;
  TicketIdGenerator newTicketId_;
  TicketRepository tickets_;
};

} // namespace parking
