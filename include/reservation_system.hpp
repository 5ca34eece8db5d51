#ifndef RESERVATION_SYSTEM_HPP_
#define RESERVATION_SYSTEM_HPP_

#include "model/booking.hpp"
#include "model/calendar.hpp"
#include "model/route.hpp"
#include "model/train.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace railway {

/**
 * Outcome of a booking request.
 */
enum class BookingStatus {
  CONFIRMED,
  TRAIN_NOT_FOUND,
  INSUFFICIENT_CAPACITY,
  TATKAL_WINDOW_VIOLATION,
  INVALID_ROUTE,
  INVALID_REQUEST
};

std::string toString(BookingStatus status);

struct BookingResult {
  BookingStatus status = BookingStatus::INVALID_REQUEST;
  std::optional<Booking> booking;
  std::string message;

  bool ok() const { return status == BookingStatus::CONFIRMED; }

  static BookingResult confirmed(Booking booking);
  static BookingResult rejected(BookingStatus status, const std::string& message);
};

using TrainList = std::vector<std::shared_ptr<const Train>>;

/**
 * Abstract interface for the reservation engine.
 */
class ReservationSystem {
 public:
  virtual ~ReservationSystem() = default;

  /**
   * Trains that serve `source_code` before `destination_code` and run on
   * the weekday of `date`. Seat availability is not checked.
   */
  virtual TrainList SearchTrains(const std::string& source_code,
                                 const std::string& destination_code, const Date& date,
                                 const std::string& travel_class) const = 0;

  /**
   * Reserves one seat per passenger and records the booking for `user_id`.
   */
  virtual BookingResult BookTickets(const std::string& train_id, const std::string& user_id,
                                    std::vector<Passenger> passengers,
                                    const std::string& travel_class,
                                    const std::string& source_code,
                                    const std::string& destination_code,
                                    const Date& travel_date, bool is_tatkal) = 0;

  /**
   * Cancels the whole booking, or only the named passengers when
   * `passenger_names` is non-empty. False if the booking does not exist.
   */
  virtual bool CancelBooking(const std::string& user_id, const std::string& booking_id,
                             const std::vector<std::string>& passenger_names = {}) = 0;

  virtual std::vector<Booking> GetBookings(const std::string& user_id) const = 0;

  // Empty for an unknown train.
  virtual std::vector<Station> GetTrainSchedule(const std::string& train_id) const = 0;

  /** Stable sort by the first stop's departure time. */
  void SortTrainsByDepartureTime(TrainList& trains, bool ascending) const;

  /** Stable sort by the last stop's arrival time. */
  void SortTrainsByArrivalTime(TrainList& trains, bool ascending) const;
};

}  // namespace railway

#endif  // RESERVATION_SYSTEM_HPP_
