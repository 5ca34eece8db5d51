#ifndef TRAFFIC_SIMULATOR_HPP_
#define TRAFFIC_SIMULATOR_HPP_

#include "reservation_system.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace railway {
namespace simulator {

/**
 * A trip a simulated user tries to book.
 */
struct Journey {
  std::string source;
  std::string destination;
  std::string travel_class;
  Date date;
  std::vector<std::string> passengers;
};

// Delhi-Mumbai, Bengaluru-Thiruvananthapuram and Puri-Delhi trips on `date`.
std::vector<Journey> defaultJourneys(const Date& date);

/**
 * Drives concurrent booking traffic against a reservation system.
 * Each simulated user runs on its own worker thread and, every round,
 * searches, books on the earliest departing train and then keeps, partially
 * cancels or fully cancels the booking.
 */
class TrafficSimulator {
 public:
  TrafficSimulator(ReservationSystem& system, std::vector<Journey> journeys,
                   size_t num_users = 6, size_t rounds = 3);
  ~TrafficSimulator();

  // Non-copyable
  TrafficSimulator(const TrafficSimulator&) = delete;
  TrafficSimulator& operator=(const TrafficSimulator&) = delete;

  /**
   * Runs every user to completion. Blocks until all workers have joined.
   */
  void run();

  struct Stats {
    size_t searches;
    size_t searches_without_results;
    size_t bookings_confirmed;
    size_t bookings_rejected;
    size_t rejected_for_capacity;
    size_t partial_cancellations;
    size_t full_cancellations;
    double avg_booking_time_ms;
  };
  Stats getStats() const;

 private:
  void userThread(size_t user_index);
  void simulateRound(const std::string& user_id, const Journey& journey, size_t round);

  ReservationSystem& system_;
  std::vector<Journey> journeys_;
  size_t num_users_;
  size_t rounds_;
  std::vector<std::unique_ptr<std::thread>> worker_threads_;

  // Statistics
  std::atomic<size_t> searches_;
  std::atomic<size_t> empty_searches_;
  std::atomic<size_t> confirmed_;
  std::atomic<size_t> rejected_;
  std::atomic<size_t> rejected_capacity_;
  std::atomic<size_t> partial_cancellations_;
  std::atomic<size_t> full_cancellations_;
  std::atomic<size_t> total_booking_time_us_;
};

}  // namespace simulator
}  // namespace railway

#endif  // TRAFFIC_SIMULATOR_HPP_
