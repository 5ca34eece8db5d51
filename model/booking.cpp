#include "booking.hpp"

#include <algorithm>

namespace railway {

Booking::Booking(std::string id, std::string train_id, std::string user_id,
                 std::vector<Passenger> passengers, std::string travel_class,
                 std::string source_code, std::string destination_code, Date travel_date,
                 double fare, bool is_tatkal)
    : id_(std::move(id)),
      train_id_(std::move(train_id)),
      user_id_(std::move(user_id)),
      passengers_(std::move(passengers)),
      travel_class_(std::move(travel_class)),
      source_code_(std::move(source_code)),
      destination_code_(std::move(destination_code)),
      travel_date_(travel_date),
      fare_(fare),
      is_tatkal_(is_tatkal) {
}

std::vector<std::string> Booking::assignedSeats() const {
  std::vector<std::string> seats;
  seats.reserve(passengers_.size());
  for (const auto& passenger : passengers_) {
    seats.push_back(passenger.seat);
  }
  return seats;
}

std::vector<std::string> Booking::removePassengers(const std::vector<std::string>& names) {
  std::vector<std::string> released;
  for (const auto& name : names) {
    auto it = std::find_if(passengers_.begin(), passengers_.end(),
                           [&name](const Passenger& p) { return p.name == name; });
    if (it != passengers_.end()) {
      released.push_back(it->seat);
      passengers_.erase(it);
    }
  }
  return released;
}

}  // namespace railway
