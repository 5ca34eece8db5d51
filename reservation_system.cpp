#include "reservation_system.hpp"

#include <algorithm>

namespace railway {

std::string toString(BookingStatus status) {
  switch (status) {
    case BookingStatus::CONFIRMED: return "CONFIRMED";
    case BookingStatus::TRAIN_NOT_FOUND: return "TRAIN_NOT_FOUND";
    case BookingStatus::INSUFFICIENT_CAPACITY: return "INSUFFICIENT_CAPACITY";
    case BookingStatus::TATKAL_WINDOW_VIOLATION: return "TATKAL_WINDOW_VIOLATION";
    case BookingStatus::INVALID_ROUTE: return "INVALID_ROUTE";
    case BookingStatus::INVALID_REQUEST: return "INVALID_REQUEST";
    default: return "UNKNOWN";
  }
}

BookingResult BookingResult::confirmed(Booking booking) {
  BookingResult result;
  result.status = BookingStatus::CONFIRMED;
  result.message = "Booking confirmed";
  result.booking = std::move(booking);
  return result;
}

BookingResult BookingResult::rejected(BookingStatus status, const std::string& message) {
  BookingResult result;
  result.status = status;
  result.message = message;
  return result;
}

void ReservationSystem::SortTrainsByDepartureTime(TrainList& trains, bool ascending) const {
  std::stable_sort(trains.begin(), trains.end(),
                   [ascending](const auto& t1, const auto& t2) {
                     const TimeOfDay& time1 = t1->route().firstDeparture();
                     const TimeOfDay& time2 = t2->route().firstDeparture();
                     return ascending ? time1 < time2 : time2 < time1;
                   });
}

void ReservationSystem::SortTrainsByArrivalTime(TrainList& trains, bool ascending) const {
  std::stable_sort(trains.begin(), trains.end(),
                   [ascending](const auto& t1, const auto& t2) {
                     const TimeOfDay& time1 = t1->route().lastArrival();
                     const TimeOfDay& time2 = t2->route().lastArrival();
                     return ascending ? time1 < time2 : time2 < time1;
                   });
}

}  // namespace railway
