#ifndef BOOKING_HPP_
#define BOOKING_HPP_

#include "calendar.hpp"

#include <string>
#include <vector>

namespace railway {

struct Passenger {
  std::string name;
  std::string seat;  // empty until a seat is assigned

  Passenger() = default;
  explicit Passenger(std::string passenger_name, std::string seat_number = "")
      : name(std::move(passenger_name)), seat(std::move(seat_number)) {}
};

/**
 * A confirmed reservation. Only passenger removal mutates it after creation.
 */
class Booking {
 public:
  Booking(std::string id, std::string train_id, std::string user_id,
          std::vector<Passenger> passengers, std::string travel_class,
          std::string source_code, std::string destination_code, Date travel_date,
          double fare, bool is_tatkal);

  const std::string& id() const { return id_; }
  const std::string& trainId() const { return train_id_; }
  const std::string& userId() const { return user_id_; }
  const std::vector<Passenger>& passengers() const { return passengers_; }
  const std::string& travelClass() const { return travel_class_; }
  const std::string& sourceCode() const { return source_code_; }
  const std::string& destinationCode() const { return destination_code_; }
  const Date& travelDate() const { return travel_date_; }
  double fare() const { return fare_; }
  bool isTatkal() const { return is_tatkal_; }

  // Seats in passenger order.
  std::vector<std::string> assignedSeats() const;

  /**
   * For each name, removes the first remaining passenger carrying it.
   * Unmatched names are ignored. Returns the seats those passengers held.
   */
  std::vector<std::string> removePassengers(const std::vector<std::string>& names);

  bool empty() const { return passengers_.empty(); }

 private:
  std::string id_;
  std::string train_id_;
  std::string user_id_;
  std::vector<Passenger> passengers_;
  std::string travel_class_;
  std::string source_code_;
  std::string destination_code_;
  Date travel_date_;
  double fare_;
  bool is_tatkal_;
};

}  // namespace railway

#endif  // BOOKING_HPP_
