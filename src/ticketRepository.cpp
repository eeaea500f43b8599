#include "parking/ticketRepository.h"

#include "parking/errors.h"

using namespace std;

namespace parking {

bool TicketRepository::save(const Ticket& ticket) {
  unique_lock lock(mtx_);
  if (tickets_.count(ticket.id()))
    throw InvariantViolation("duplicate ticket id " + ticket.id());
  if (vehicleIndex_.count(ticket.vehicleId())) return false;

  tickets_.emplace(ticket.id(), ticket);
  vehicleIndex_[ticket.vehicleId()] = ticket.id();
  return true;
}

optional<Ticket> TicketRepository::findById(const string& ticketId) const {
  shared_lock lock(mtx_);
  auto it = tickets_.find(ticketId);
  if (it == tickets_.end()) return nullopt;
  return it->second;
}

optional<Ticket> TicketRepository::findByVehicle(const string& vehicleId) const {
  shared_lock lock(mtx_);
  auto it = vehicleIndex_.find(vehicleId);
  if (it == vehicleIndex_.end()) return nullopt;
  return tickets_.at(it->second);
}

bool TicketRepository::remove(const string& ticketId) {
  unique_lock lock(mtx_);
  auto it = tickets_.find(ticketId);
  if (it == tickets_.end()) return false;
  vehicleIndex_.erase(it->second.vehicleId());
  tickets_.erase(it);
  return true;
}

size_t TicketRepository::size() const {
  shared_lock lock(mtx_);
  return tickets_.size();
}

vector<Ticket> TicketRepository::findAll() const {
  shared_lock lock(mtx_);
  vector<Ticket> res;
  res.reserve(tickets_.size());
  for (auto& [_, t] : tickets_) res.push_back(t);
  return res;
}

} // namespace parking
