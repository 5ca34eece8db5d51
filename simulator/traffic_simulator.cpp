#include "traffic_simulator.hpp"

#include "observability/logger.hpp"

#include <chrono>

namespace railway {
namespace simulator {

std::vector<Journey> defaultJourneys(const Date& date) {
  return {
      {"NDLS", "MMCT", "3A", date, {"Aarav Sharma", "Diya Sharma"}},
      {"SBC", "TVC", "SL", date, {"Karthik Nair", "Meera Nair", "Anil Nair"}},
      {"PURI", "NDLS", "2A", date, {"Subhash Das"}},
  };
}

TrafficSimulator::TrafficSimulator(ReservationSystem& system, std::vector<Journey> journeys,
                                   size_t num_users, size_t rounds)
    : system_(system),
      journeys_(std::move(journeys)),
      num_users_(num_users),
      rounds_(rounds),
      searches_(0),
      empty_searches_(0),
      confirmed_(0),
      rejected_(0),
      rejected_capacity_(0),
      partial_cancellations_(0),
      full_cancellations_(0),
      total_booking_time_us_(0) {
}

TrafficSimulator::~TrafficSimulator() {
  for (auto& thread : worker_threads_) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
}

void TrafficSimulator::run() {
  if (journeys_.empty()) {
    LOG_WARN("No journeys configured; nothing to simulate");
    return;
  }

  for (size_t i = 0; i < num_users_; ++i) {
    worker_threads_.emplace_back(
        std::make_unique<std::thread>(&TrafficSimulator::userThread, this, i));
  }

  for (auto& thread : worker_threads_) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
  worker_threads_.clear();
}

TrafficSimulator::Stats TrafficSimulator::getStats() const {
  Stats stats;
  stats.searches = searches_.load();
  stats.searches_without_results = empty_searches_.load();
  stats.bookings_confirmed = confirmed_.load();
  stats.bookings_rejected = rejected_.load();
  stats.rejected_for_capacity = rejected_capacity_.load();
  stats.partial_cancellations = partial_cancellations_.load();
  stats.full_cancellations = full_cancellations_.load();

  size_t attempts = stats.bookings_confirmed + stats.bookings_rejected;
  stats.avg_booking_time_ms =
      attempts > 0 ? static_cast<double>(total_booking_time_us_.load()) / attempts / 1000.0
                   : 0.0;
  return stats;
}

void TrafficSimulator::userThread(size_t user_index) {
  std::string user_id = "USER" + std::to_string(user_index + 1);
  for (size_t round = 0; round < rounds_; ++round) {
    const Journey& journey = journeys_[(user_index + round) % journeys_.size()];
    simulateRound(user_id, journey, round);
  }
}

void TrafficSimulator::simulateRound(const std::string& user_id, const Journey& journey,
                                     size_t round) {
  TrainList trains = system_.SearchTrains(journey.source, journey.destination, journey.date,
                                          journey.travel_class);
  searches_.fetch_add(1);
  if (trains.empty()) {
    empty_searches_.fetch_add(1);
    return;
  }
  system_.SortTrainsByDepartureTime(trains, true);

  std::vector<Passenger> passengers;
  for (const auto& name : journey.passengers) {
    passengers.emplace_back(name);
  }

  auto start_time = std::chrono::steady_clock::now();
  BookingResult result = system_.BookTickets(trains.front()->id(), user_id,
                                             std::move(passengers), journey.travel_class,
                                             journey.source, journey.destination, journey.date,
                                             false);
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_time);
  total_booking_time_us_.fetch_add(static_cast<size_t>(duration.count()));

  if (!result.ok()) {
    rejected_.fetch_add(1);
    if (result.status == BookingStatus::INSUFFICIENT_CAPACITY) {
      rejected_capacity_.fetch_add(1);
    }
    return;
  }
  confirmed_.fetch_add(1);

  const Booking& booking = *result.booking;
  switch (round % 3) {
    case 1:
      if (system_.CancelBooking(user_id, booking.id(), {booking.passengers().front().name})) {
        partial_cancellations_.fetch_add(1);
      }
      break;
    case 2:
      if (system_.CancelBooking(user_id, booking.id())) {
        full_cancellations_.fetch_add(1);
      }
      break;
    default:
      break;  // keep the booking
  }
}

}  // namespace simulator
}  // namespace railway
