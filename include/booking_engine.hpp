#ifndef BOOKING_ENGINE_HPP_
#define BOOKING_ENGINE_HPP_

#include "reservation_system.hpp"
#include "ledger/reservation_ledger.hpp"
#include "observability/metrics.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace railway {

/**
 * In-memory reservation engine with lock striping per (train, class).
 *
 * Seat assignment, pricing and the ledger write of one booking happen under
 * the mutex of its (train, class) pair, so bookings on unrelated trains or
 * classes proceed in parallel while no seat is ever handed out twice.
 * Searches and schedule reads take no engine lock and may observe stale
 * inventory.
 */
class BookingEngine : public ReservationSystem {
 public:
  using Clock = std::function<TimeOfDay()>;

  explicit BookingEngine(TrainRegistry trains,
                         Clock clock = &TimeOfDay::now,
                         observability::MetricsCollector& metrics =
                             observability::getGlobalMetrics());
  ~BookingEngine() override = default;

  // Non-copyable
  BookingEngine(const BookingEngine&) = delete;
  BookingEngine& operator=(const BookingEngine&) = delete;

  TrainList SearchTrains(const std::string& source_code, const std::string& destination_code,
                         const Date& date, const std::string& travel_class) const override;

  BookingResult BookTickets(const std::string& train_id, const std::string& user_id,
                            std::vector<Passenger> passengers, const std::string& travel_class,
                            const std::string& source_code, const std::string& destination_code,
                            const Date& travel_date, bool is_tatkal) override;

  bool CancelBooking(const std::string& user_id, const std::string& booking_id,
                     const std::vector<std::string>& passenger_names = {}) override;

  std::vector<Booking> GetBookings(const std::string& user_id) const override;

  std::vector<Station> GetTrainSchedule(const std::string& train_id) const override;

  std::shared_ptr<const Train> findTrain(const std::string& train_id) const;
  TrainList trains() const;
  const ReservationLedger& ledger() const { return ledger_; }

  /**
   * Checks free + booked == capacity for every train and class. Returns one
   * message per violation. Only meaningful while no request is in flight.
   */
  std::vector<std::string> auditSeatConservation() const;

  // Tatkal requests are accepted in [10:00, 12:00) and cost 30% more.
  static bool withinTatkalWindow(const TimeOfDay& time);
  static constexpr double kTatkalSurcharge = 1.30;

 private:
  /**
   * Get or create the mutex guarding one train's class inventory.
   */
  std::mutex& getInventoryMutex(const std::string& train_id, const std::string& travel_class);

  BookingResult reject(BookingStatus status, const std::string& message,
                       const std::string& train_id, const std::string& user_id);

  static std::string generateBookingId();

  const TrainRegistry trains_;
  Clock clock_;
  observability::MetricsCollector& metrics_;
  ReservationLedger ledger_;

  std::unordered_map<std::string, std::unique_ptr<std::mutex>> inventory_mutexes_;
  mutable std::shared_mutex mutexes_guard_;
};

}  // namespace railway

#endif  // BOOKING_ENGINE_HPP_
