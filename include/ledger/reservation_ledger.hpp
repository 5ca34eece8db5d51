#ifndef RESERVATION_LEDGER_HPP_
#define RESERVATION_LEDGER_HPP_

#include "model/booking.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace railway {

/**
 * Per-user bookings in insertion order. A user's entry is created on the
 * first booking and kept even after all of its bookings are cancelled.
 */
class ReservationLedger {
 public:
  ReservationLedger() = default;

  // Non-copyable
  ReservationLedger(const ReservationLedger&) = delete;
  ReservationLedger& operator=(const ReservationLedger&) = delete;

  void append(Booking booking);

  bool hasUser(const std::string& user_id) const;

  // Snapshot of the user's bookings; empty for unknown users.
  std::vector<Booking> bookingsFor(const std::string& user_id) const;

  std::optional<Booking> find(const std::string& user_id, const std::string& booking_id) const;

  /**
   * Removes the whole booking and returns it, or nullopt if absent.
   */
  std::optional<Booking> remove(const std::string& user_id, const std::string& booking_id);

  struct PassengerRemoval {
    std::vector<std::string> released_seats;
    bool booking_removed = false;
  };

  /**
   * Removes the named passengers (first match per name). The booking itself
   * is dropped once no passenger remains. nullopt if the booking is absent.
   */
  std::optional<PassengerRemoval> removePassengers(const std::string& user_id,
                                                   const std::string& booking_id,
                                                   const std::vector<std::string>& names);

  size_t bookingCount() const;

  // Every active booking, grouped by user.
  std::vector<Booking> allBookings() const;

 private:
  std::unordered_map<std::string, std::vector<Booking>> bookings_by_user_;
  mutable std::shared_mutex mutex_;
};

}  // namespace railway

#endif  // RESERVATION_LEDGER_HPP_
