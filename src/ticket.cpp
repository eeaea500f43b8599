#include "parking/ticket.h"

#include <utility>

using namespace std;

namespace parking {

Ticket::Ticket(string id, Slot& slot, Vehicle vehicle, TimePoint entryTime)
  : id_(move(id)), slot_(&slot), vehicle_(move(vehicle)), entryTime_(entryTime) {}

} // namespace parking
