#include "booking_engine.hpp"

#include "observability/logger.hpp"

#include <cstdint>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>

namespace railway {

namespace {

const TimeOfDay kTatkalOpens(10, 0);
const TimeOfDay kTatkalCloses(12, 0);

std::string metricSuffix(BookingStatus status) {
  switch (status) {
    case BookingStatus::TRAIN_NOT_FOUND: return "train_not_found";
    case BookingStatus::INSUFFICIENT_CAPACITY: return "insufficient_capacity";
    case BookingStatus::TATKAL_WINDOW_VIOLATION: return "tatkal_window";
    case BookingStatus::INVALID_ROUTE: return "invalid_route";
    default: return "invalid_request";
  }
}

}  // namespace

BookingEngine::BookingEngine(TrainRegistry trains, Clock clock,
                             observability::MetricsCollector& metrics)
    : trains_(std::move(trains)), clock_(std::move(clock)), metrics_(metrics) {
  metrics_.describe("bookings_confirmed_total", "Bookings confirmed");
  metrics_.describe("bookings_rejected_total", "Booking requests rejected");
  metrics_.describe("seats_assigned_total", "Seats handed out to bookings");
  metrics_.describe("seats_released_total", "Seats returned by cancellations");
  metrics_.describe("cancellations_total", "Successful cancellation requests");
  metrics_.describe("booking_latency_seconds", "Time spent in BookTickets");
}

TrainList BookingEngine::SearchTrains(const std::string& source_code,
                                      const std::string& destination_code, const Date& date,
                                      const std::string& /*travel_class*/) const {
  TrainList matches;
  Weekday day = date.weekday();
  for (const auto& [id, train] : trains_) {
    if (train->serves(source_code, destination_code) && train->runsOn(day)) {
      matches.push_back(train);
    }
  }
  return matches;
}

BookingResult BookingEngine::BookTickets(const std::string& train_id,
                                         const std::string& user_id,
                                         std::vector<Passenger> passengers,
                                         const std::string& travel_class,
                                         const std::string& source_code,
                                         const std::string& destination_code,
                                         const Date& travel_date, bool is_tatkal) {
  observability::MetricsCollector::Timer timer(metrics_, "booking_latency_seconds");

  if (passengers.empty()) {
    return reject(BookingStatus::INVALID_REQUEST, "At least one passenger is required",
                  train_id, user_id);
  }

  auto it = trains_.find(train_id);
  if (it == trains_.end()) {
    return reject(BookingStatus::TRAIN_NOT_FOUND, "Train not found", train_id, user_id);
  }
  Train& train = *it->second;

  if (is_tatkal && !withinTatkalWindow(clock_())) {
    return reject(BookingStatus::TATKAL_WINDOW_VIOLATION,
                  "Tatkal booking is only allowed between 10 AM and 12 PM", train_id, user_id);
  }

  if (!train.serves(source_code, destination_code)) {
    return reject(BookingStatus::INVALID_ROUTE,
                  "Train does not run from " + source_code + " to " + destination_code,
                  train_id, user_id);
  }

  if (!train.hasClass(travel_class)) {
    return reject(BookingStatus::INSUFFICIENT_CAPACITY,
                  "No seats available in class " + travel_class, train_id, user_id);
  }
  if (train.baseFares().count(travel_class) == 0) {
    return reject(BookingStatus::INVALID_REQUEST, "No fare configured for class " + travel_class,
                  train_id, user_id);
  }

  std::string booking_id = generateBookingId();
  std::vector<std::string> seats;
  double fare = 0.0;
  std::optional<Booking> booking;
  {
    std::lock_guard<std::mutex> lock(getInventoryMutex(train_id, travel_class));

    seats = train.assignSeats(travel_class, static_cast<int>(passengers.size()));
    if (seats.empty()) {
      return reject(BookingStatus::INSUFFICIENT_CAPACITY, "No seats available", train_id,
                    user_id);
    }

    fare = train.getFare(travel_class, source_code, destination_code);
    if (is_tatkal) {
      fare *= kTatkalSurcharge;
    }

    for (size_t i = 0; i < passengers.size(); ++i) {
      passengers[i].seat = seats[i];
    }

    booking.emplace(booking_id, train_id, user_id, std::move(passengers), travel_class,
                    source_code, destination_code, travel_date, fare, is_tatkal);
    ledger_.append(*booking);
  }

  metrics_.incrementCounter("bookings_confirmed_total");
  metrics_.incrementCounter("seats_assigned_total", static_cast<double>(seats.size()));

  LOG_BUILDER(observability::LogLevel::INFO, "Booking confirmed")
      .field("booking_id", booking_id)
      .field("train_id", train_id)
      .field("user_id", user_id)
      .field("travel_class", travel_class)
      .field("seats", seats)
      .field("fare", fare)
      .field("tatkal", is_tatkal);

  return BookingResult::confirmed(std::move(*booking));
}

bool BookingEngine::CancelBooking(const std::string& user_id, const std::string& booking_id,
                                  const std::vector<std::string>& passenger_names) {
  if (!ledger_.hasUser(user_id)) {
    return false;
  }

  auto located = ledger_.find(user_id, booking_id);
  if (!located) {
    return false;
  }

  auto train_it = trains_.find(located->trainId());
  if (train_it == trains_.end()) {
    LOG_ERROR("Booking " + booking_id + " references unknown train " + located->trainId());
    return false;
  }
  Train& train = *train_it->second;
  const std::string& travel_class = located->travelClass();

  std::lock_guard<std::mutex> lock(getInventoryMutex(located->trainId(), travel_class));

  std::vector<std::string> released;
  bool booking_removed = false;
  if (passenger_names.empty()) {
    auto removed = ledger_.remove(user_id, booking_id);
    if (!removed) {
      return false;
    }
    released = removed->assignedSeats();
    booking_removed = true;
  } else {
    auto removal = ledger_.removePassengers(user_id, booking_id, passenger_names);
    if (!removal) {
      return false;
    }
    released = std::move(removal->released_seats);
    booking_removed = removal->booking_removed;
  }

  train.releaseSeats(travel_class, released);

  metrics_.incrementCounter("cancellations_total");
  metrics_.incrementCounter("seats_released_total", static_cast<double>(released.size()));

  LOG_BUILDER(observability::LogLevel::INFO, "Booking cancelled")
      .field("booking_id", booking_id)
      .field("user_id", user_id)
      .field("released_seats", released)
      .field("booking_removed", booking_removed);
  return true;
}

std::vector<Booking> BookingEngine::GetBookings(const std::string& user_id) const {
  return ledger_.bookingsFor(user_id);
}

std::vector<Station> BookingEngine::GetTrainSchedule(const std::string& train_id) const {
  auto it = trains_.find(train_id);
  if (it == trains_.end()) {
    return {};
  }
  return it->second->route().stops();
}

std::shared_ptr<const Train> BookingEngine::findTrain(const std::string& train_id) const {
  auto it = trains_.find(train_id);
  if (it == trains_.end()) {
    return nullptr;
  }
  return it->second;
}

TrainList BookingEngine::trains() const {
  TrainList all;
  for (const auto& entry : trains_) {
    all.push_back(entry.second);
  }
  return all;
}

std::vector<std::string> BookingEngine::auditSeatConservation() const {
  std::map<std::string, size_t> held;
  for (const auto& booking : ledger_.allBookings()) {
    held[booking.trainId() + "/" + booking.travelClass()] += booking.passengers().size();
  }

  std::vector<std::string> violations;
  for (const auto& [id, train] : trains_) {
    for (const auto& travel_class : train->travelClasses()) {
      size_t free_seats = train->freeSeats(travel_class);
      size_t booked = held[id + "/" + travel_class];
      if (free_seats + booked != static_cast<size_t>(train->capacity(travel_class))) {
        violations.push_back(id + "/" + travel_class + ": free " + std::to_string(free_seats) +
                             " + booked " + std::to_string(booked) + " != capacity " +
                             std::to_string(train->capacity(travel_class)));
      }
    }
  }
  return violations;
}

bool BookingEngine::withinTatkalWindow(const TimeOfDay& time) {
  return kTatkalOpens <= time && time < kTatkalCloses;
}

std::mutex& BookingEngine::getInventoryMutex(const std::string& train_id,
                                             const std::string& travel_class) {
  std::string key = train_id + "/" + travel_class;
  {
    std::shared_lock<std::shared_mutex> read_lock(mutexes_guard_);
    auto it = inventory_mutexes_.find(key);
    if (it != inventory_mutexes_.end()) {
      return *it->second;
    }
  }

  std::unique_lock<std::shared_mutex> write_lock(mutexes_guard_);
  auto& mutex_ptr = inventory_mutexes_[key];
  if (!mutex_ptr) {
    mutex_ptr = std::make_unique<std::mutex>();
  }
  return *mutex_ptr;
}

BookingResult BookingEngine::reject(BookingStatus status, const std::string& message,
                                    const std::string& train_id, const std::string& user_id) {
  metrics_.incrementCounter("bookings_rejected_total");
  metrics_.incrementCounter("bookings_rejected_" + metricSuffix(status) + "_total");

  LOG_BUILDER(observability::LogLevel::WARN, "Booking rejected")
      .field("reason", toString(status))
      .field("train_id", train_id)
      .field("user_id", user_id)
      .field("detail", message);
  return BookingResult::rejected(status, message);
}

// Random (version 4) UUID.
std::string BookingEngine::generateBookingId() {
  thread_local std::mt19937_64 generator(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;

  uint64_t high = dist(generator);
  uint64_t low = dist(generator);
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::stringstream ss;
  ss << std::hex << std::setfill('0')
     << std::setw(8) << (high >> 32) << "-"
     << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
     << std::setw(4) << (high & 0xFFFF) << "-"
     << std::setw(4) << (low >> 48) << "-"
     << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

}  // namespace railway
