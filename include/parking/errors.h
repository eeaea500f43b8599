#pragma once

#include <stdexcept>
#include <string>

namespace parking {

/**
 * @brief Base type for errors raised by the parking core.
 */
class ParkingError : public std::runtime_error {
public:
  explicit ParkingError(const char* message) : std::runtime_error(message) {}
  explicit ParkingError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Unpark was called with an unknown or already redeemed ticket.
 *
 * Retrying with the same ticket can never succeed.
 */
class InvalidTicket : public ParkingError {
public:
  explicit InvalidTicket(const std::string& ticketId)
    : ParkingError("Invalid or expired ticket: " + ticketId), ticketId_(ticketId) {}

  const std::string& ticketId() const { return ticketId_; }

private:
  std::string ticketId_;
};

/**
 * @brief Internal contract breach (e.g. occupying a slot that is not free).
 *
 * Signals a bug in the locking discipline, never a normal outcome.
 */
class InvariantViolation : public ParkingError {
public:
  explicit InvariantViolation(const char* message) : ParkingError(message) {}
  explicit InvariantViolation(const std::string& message) : ParkingError(message) {}
};

} // namespace parking
