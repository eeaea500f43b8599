#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "parking/ticket.h"

namespace parking {

/*
 Live tickets keyed by ticket id, with a vehicle id index.
 One shared_mutex for the whole map: writers unique_lock, readers shared_lock.
*/
class TicketRepository {
public:
  /**
   * @return false (nothing stored) if the vehicle already holds a live ticket
   * @throws InvariantViolation if a ticket with the same id is already live
   */
  bool save(const Ticket& ticket);

  std::optional<Ticket> findById(const std::string& ticketId) const;
  std::optional<Ticket> findByVehicle(const std::string& vehicleId) const;

  // true only for the call that actually removed the entry
  bool remove(const std::string& ticketId);

  std::size_t size() const;
  std::vector<Ticket> findAll() const;

private:
  std::map<std::string, Ticket> tickets_;
  std::map<std::string, std::string> vehicleIndex_;
  mutable std::shared_mutex mtx_;
};

} // namespace parking
