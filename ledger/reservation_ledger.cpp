#include "reservation_ledger.hpp"

#include <algorithm>
#include <mutex>

namespace railway {

namespace {

std::vector<Booking>::iterator findBooking(std::vector<Booking>& bookings,
                                           const std::string& booking_id) {
  return std::find_if(bookings.begin(), bookings.end(),
                      [&booking_id](const Booking& b) { return b.id() == booking_id; });
}

}  // namespace

void ReservationLedger::append(Booking booking) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  bookings_by_user_[booking.userId()].push_back(std::move(booking));
}

bool ReservationLedger::hasUser(const std::string& user_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return bookings_by_user_.count(user_id) > 0;
}

std::vector<Booking> ReservationLedger::bookingsFor(const std::string& user_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = bookings_by_user_.find(user_id);
  if (it == bookings_by_user_.end()) {
    return {};
  }
  return it->second;
}

std::optional<Booking> ReservationLedger::find(const std::string& user_id,
                                               const std::string& booking_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto user_it = bookings_by_user_.find(user_id);
  if (user_it == bookings_by_user_.end()) {
    return std::nullopt;
  }
  for (const auto& booking : user_it->second) {
    if (booking.id() == booking_id) {
      return booking;
    }
  }
  return std::nullopt;
}

std::optional<Booking> ReservationLedger::remove(const std::string& user_id,
                                                 const std::string& booking_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto user_it = bookings_by_user_.find(user_id);
  if (user_it == bookings_by_user_.end()) {
    return std::nullopt;
  }
  auto& bookings = user_it->second;
  auto it = findBooking(bookings, booking_id);
  if (it == bookings.end()) {
    return std::nullopt;
  }
  Booking removed = std::move(*it);
  bookings.erase(it);
  return removed;
}

std::optional<ReservationLedger::PassengerRemoval> ReservationLedger::removePassengers(
    const std::string& user_id, const std::string& booking_id,
    const std::vector<std::string>& names) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto user_it = bookings_by_user_.find(user_id);
  if (user_it == bookings_by_user_.end()) {
    return std::nullopt;
  }
  auto& bookings = user_it->second;
  auto it = findBooking(bookings, booking_id);
  if (it == bookings.end()) {
    return std::nullopt;
  }

  PassengerRemoval removal;
  removal.released_seats = it->removePassengers(names);
  if (it->empty()) {
    bookings.erase(it);
    removal.booking_removed = true;
  }
  return removal;
}

size_t ReservationLedger::bookingCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& entry : bookings_by_user_) {
    count += entry.second.size();
  }
  return count;
}

std::vector<Booking> ReservationLedger::allBookings() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Booking> all;
  for (const auto& entry : bookings_by_user_) {
    all.insert(all.end(), entry.second.begin(), entry.second.end());
  }
  return all;
}

}  // namespace railway
