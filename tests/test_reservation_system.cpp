#include "../include/booking_engine.hpp"
#include "../include/observability/logger.hpp"
#include "../include/observability/metrics.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace railway;

namespace {

Station stop(const std::string& code, const std::string& arrival, const std::string& departure,
             int distance) {
  Station station;
  station.code = code;
  station.name = code + " Junction";
  station.arrival_time = TimeOfDay::parse(arrival);
  station.departure_time = TimeOfDay::parse(departure);
  station.distance_from_origin = distance;
  return station;
}

std::shared_ptr<Train> makeTrain(const std::string& id, const std::string& departure,
                                 const std::string& arrival, int capacity,
                                 std::set<Weekday> days = {Weekday::MONDAY, Weekday::WEDNESDAY}) {
  Route route({stop("AAA", "00:00", departure, 0),
               stop("BBB", "10:00", "10:05", 100),
               stop("CCC", arrival, arrival, 200)});
  return std::make_shared<Train>(id, "Express " + id, std::move(route),
                                 std::map<std::string, double>{{"SL", 500.0}, {"3A", 1200.0}},
                                 std::map<std::string, int>{{"SL", capacity}, {"3A", 2}},
                                 std::move(days));
}

std::vector<Passenger> passengers(std::initializer_list<const char*> names) {
  std::vector<Passenger> result;
  for (const char* name : names) {
    result.emplace_back(name);
  }
  return result;
}

const Date kMonday(2026, 11, 2);
const Date kTuesday(2026, 11, 3);

}  // namespace

// Test fixture for the booking engine
class BookingEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TrainRegistry trains;
    trains["T1"] = makeTrain("T1", "08:00", "14:00", 5);
    trains["T2"] = makeTrain("T2", "06:00", "16:00", 5);
    trains["T3"] = makeTrain("T3", "08:00", "12:00", 5, {Weekday::TUESDAY});
    engine_ = std::make_unique<BookingEngine>(
        std::move(trains), [this]() { return now_; }, metrics_);
  }

  BookingResult book(const std::string& user, std::vector<Passenger> people,
                     bool tatkal = false, const std::string& train = "T1",
                     const std::string& travel_class = "SL") {
    return engine_->BookTickets(train, user, std::move(people), travel_class, "AAA", "CCC",
                                kMonday, tatkal);
  }

  size_t freeSeats(const std::string& train = "T1", const std::string& travel_class = "SL") {
    return engine_->findTrain(train)->freeSeats(travel_class);
  }

  TimeOfDay now_{9, 0};
  observability::MetricsCollector metrics_;
  std::unique_ptr<BookingEngine> engine_;
};

TEST_F(BookingEngineTest, AssignsLowestSeatsFirst) {
  auto result = book("u1", passengers({"Asha", "Ravi"}));
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(result.booking.has_value());

  EXPECT_EQ(result.booking->assignedSeats(), (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(result.booking->passengers()[0].name, "Asha");
  EXPECT_EQ(result.booking->passengers()[0].seat, "1");
  EXPECT_EQ(result.booking->passengers()[1].seat, "2");
  EXPECT_EQ(freeSeats(), 3u);
  EXPECT_TRUE(engine_->auditSeatConservation().empty());
}

TEST_F(BookingEngineTest, RejectsWhenCapacityIsExhausted) {
  ASSERT_TRUE(book("u1", passengers({"Asha", "Ravi"})).ok());

  auto result = book("u2", passengers({"A", "B", "C", "D"}));
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.status, BookingStatus::INSUFFICIENT_CAPACITY);
  EXPECT_FALSE(result.booking.has_value());
  EXPECT_EQ(freeSeats(), 3u);
  EXPECT_TRUE(engine_->GetBookings("u2").empty());
  EXPECT_EQ(metrics_.counterValue("bookings_rejected_insufficient_capacity_total"), 1.0);
}

TEST_F(BookingEngineTest, TatkalOutsideWindowIsRejected) {
  now_ = TimeOfDay(14, 0);

  auto result = book("u1", passengers({"Asha"}), true);
  EXPECT_EQ(result.status, BookingStatus::TATKAL_WINDOW_VIOLATION);
  EXPECT_EQ(freeSeats(), 5u);
}

TEST_F(BookingEngineTest, TatkalWindowIsHalfOpen) {
  EXPECT_FALSE(BookingEngine::withinTatkalWindow(TimeOfDay(9, 59)));
  EXPECT_TRUE(BookingEngine::withinTatkalWindow(TimeOfDay(10, 0)));
  EXPECT_TRUE(BookingEngine::withinTatkalWindow(TimeOfDay(11, 59)));
  EXPECT_FALSE(BookingEngine::withinTatkalWindow(TimeOfDay(12, 0)));
}

TEST_F(BookingEngineTest, FareFollowsDistanceAndTatkalSurcharge) {
  auto regular = book("u1", passengers({"Asha"}));
  ASSERT_TRUE(regular.ok());
  EXPECT_DOUBLE_EQ(regular.booking->fare(), 1000.0);
  EXPECT_FALSE(regular.booking->isTatkal());

  now_ = TimeOfDay(10, 30);
  auto tatkal = book("u1", passengers({"Ravi"}), true);
  ASSERT_TRUE(tatkal.ok());
  EXPECT_DOUBLE_EQ(tatkal.booking->fare(), 1300.0);
  EXPECT_TRUE(tatkal.booking->isTatkal());

  auto partial = engine_->BookTickets("T1", "u1", passengers({"Meena"}), "SL", "BBB", "CCC",
                                      kMonday, false);
  ASSERT_TRUE(partial.ok());
  EXPECT_DOUBLE_EQ(partial.booking->fare(), 500.0);
}

TEST_F(BookingEngineTest, FullCancellationReturnsAllSeats) {
  auto result = book("u1", passengers({"Asha", "Ravi"}));
  ASSERT_TRUE(result.ok());

  EXPECT_TRUE(engine_->CancelBooking("u1", result.booking->id()));
  EXPECT_EQ(freeSeats(), 5u);
  EXPECT_TRUE(engine_->GetBookings("u1").empty());
  EXPECT_TRUE(engine_->auditSeatConservation().empty());

  // Freed seats are handed out again, lowest first
  auto again = book("u2", passengers({"Meena"}));
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.booking->assignedSeats(), (std::vector<std::string>{"1"}));
}

TEST_F(BookingEngineTest, PartialCancellationReleasesOnlyNamedPassengers) {
  auto result = book("u1", passengers({"Asha", "Ravi", "Meena"}));
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(freeSeats(), 2u);

  EXPECT_TRUE(engine_->CancelBooking("u1", result.booking->id(), {"Ravi"}));
  EXPECT_EQ(freeSeats(), 3u);

  auto bookings = engine_->GetBookings("u1");
  ASSERT_EQ(bookings.size(), 1u);
  ASSERT_EQ(bookings[0].passengers().size(), 2u);
  EXPECT_EQ(bookings[0].passengers()[0].name, "Asha");
  EXPECT_EQ(bookings[0].passengers()[1].name, "Meena");
  EXPECT_EQ(bookings[0].assignedSeats(), (std::vector<std::string>{"1", "3"}));
  EXPECT_EQ(engine_->findTrain("T1")->freeSeats("SL"), 3u);
  EXPECT_TRUE(engine_->auditSeatConservation().empty());
}

TEST_F(BookingEngineTest, CancellingEveryPassengerMatchesFullCancellation) {
  auto one_by_one = book("u1", passengers({"Asha", "Ravi"}));
  ASSERT_TRUE(one_by_one.ok());
  EXPECT_TRUE(engine_->CancelBooking("u1", one_by_one.booking->id(), {"Asha"}));
  EXPECT_TRUE(engine_->CancelBooking("u1", one_by_one.booking->id(), {"Ravi"}));

  EXPECT_TRUE(engine_->GetBookings("u1").empty());
  EXPECT_EQ(freeSeats(), 5u);

  // The booking is gone, so a further attempt finds nothing
  EXPECT_FALSE(engine_->CancelBooking("u1", one_by_one.booking->id(), {"Asha"}));
}

TEST_F(BookingEngineTest, DuplicateNamesCancelFirstMatch) {
  auto result = book("u1", passengers({"Sam", "Sam", "Lee"}));
  ASSERT_TRUE(result.ok());

  EXPECT_TRUE(engine_->CancelBooking("u1", result.booking->id(), {"Sam"}));
  auto remaining = engine_->GetBookings("u1")[0];
  EXPECT_EQ(remaining.assignedSeats(), (std::vector<std::string>{"2", "3"}));

  // Unknown names release nothing but still locate the booking
  EXPECT_TRUE(engine_->CancelBooking("u1", result.booking->id(), {"Nobody"}));
  EXPECT_EQ(freeSeats(), 3u);
}

TEST_F(BookingEngineTest, CancellationOfUnknownBookingReturnsFalse) {
  EXPECT_FALSE(engine_->CancelBooking("nobody", "missing"));

  auto result = book("u1", passengers({"Asha"}));
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(engine_->CancelBooking("u1", "missing"));
  EXPECT_FALSE(engine_->CancelBooking("u2", result.booking->id()));
  EXPECT_EQ(freeSeats(), 4u);
}

TEST_F(BookingEngineTest, RejectsUnknownTrainRouteAndClass) {
  EXPECT_EQ(book("u1", passengers({"Asha"}), false, "T9").status,
            BookingStatus::TRAIN_NOT_FOUND);

  auto reversed = engine_->BookTickets("T1", "u1", passengers({"Asha"}), "SL", "CCC", "AAA",
                                       kMonday, false);
  EXPECT_EQ(reversed.status, BookingStatus::INVALID_ROUTE);

  EXPECT_EQ(book("u1", passengers({"Asha"}), false, "T1", "1A").status,
            BookingStatus::INSUFFICIENT_CAPACITY);
  EXPECT_EQ(book("u1", {}).status, BookingStatus::INVALID_REQUEST);

  EXPECT_EQ(freeSeats(), 5u);
  EXPECT_EQ(metrics_.counterValue("bookings_rejected_total"), 4.0);
}

TEST_F(BookingEngineTest, ClassesHaveIndependentInventories) {
  ASSERT_TRUE(book("u1", passengers({"A", "B"}), false, "T1", "3A").ok());
  EXPECT_EQ(book("u1", passengers({"C"}), false, "T1", "3A").status,
            BookingStatus::INSUFFICIENT_CAPACITY);
  EXPECT_EQ(freeSeats("T1", "SL"), 5u);
  EXPECT_EQ(freeSeats("T1", "3A"), 0u);
}

TEST_F(BookingEngineTest, BookingsKeepInsertionOrder) {
  auto first = book("u1", passengers({"A"}));
  auto second = book("u1", passengers({"B"}), false, "T2");
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_NE(first.booking->id(), second.booking->id());

  auto bookings = engine_->GetBookings("u1");
  ASSERT_EQ(bookings.size(), 2u);
  EXPECT_EQ(bookings[0].id(), first.booking->id());
  EXPECT_EQ(bookings[1].id(), second.booking->id());
  EXPECT_EQ(bookings[1].trainId(), "T2");
}

TEST_F(BookingEngineTest, SearchFiltersByRouteDirectionAndWeekday) {
  auto monday = engine_->SearchTrains("AAA", "CCC", kMonday, "SL");
  ASSERT_EQ(monday.size(), 2u);
  EXPECT_EQ(monday[0]->id(), "T1");
  EXPECT_EQ(monday[1]->id(), "T2");

  auto tuesday = engine_->SearchTrains("AAA", "CCC", kTuesday, "SL");
  ASSERT_EQ(tuesday.size(), 1u);
  EXPECT_EQ(tuesday[0]->id(), "T3");

  EXPECT_TRUE(engine_->SearchTrains("CCC", "AAA", kMonday, "SL").empty());
  EXPECT_TRUE(engine_->SearchTrains("AAA", "AAA", kMonday, "SL").empty());
  EXPECT_TRUE(engine_->SearchTrains("AAA", "ZZZ", kMonday, "SL").empty());
}

TEST_F(BookingEngineTest, SearchIgnoresAvailability) {
  ASSERT_TRUE(book("u1", passengers({"A", "B", "C", "D", "E"})).ok());
  EXPECT_EQ(freeSeats(), 0u);
  EXPECT_EQ(engine_->SearchTrains("AAA", "CCC", kMonday, "SL").size(), 2u);
}

TEST_F(BookingEngineTest, SortsByDepartureAndArrival) {
  TrainList trains = engine_->trains();  // T1, T2, T3

  engine_->SortTrainsByDepartureTime(trains, true);
  EXPECT_EQ(trains[0]->id(), "T2");
  EXPECT_EQ(trains[1]->id(), "T1");
  EXPECT_EQ(trains[2]->id(), "T3");

  trains = engine_->trains();
  engine_->SortTrainsByDepartureTime(trains, false);
  EXPECT_EQ(trains[0]->id(), "T1");
  EXPECT_EQ(trains[1]->id(), "T3");
  EXPECT_EQ(trains[2]->id(), "T2");

  engine_->SortTrainsByArrivalTime(trains, true);
  EXPECT_EQ(trains[0]->id(), "T3");
  EXPECT_EQ(trains[1]->id(), "T1");
  EXPECT_EQ(trains[2]->id(), "T2");

  engine_->SortTrainsByArrivalTime(trains, false);
  EXPECT_EQ(trains[0]->id(), "T2");
}

TEST_F(BookingEngineTest, ScheduleListsAllStops) {
  auto stops = engine_->GetTrainSchedule("T1");
  ASSERT_EQ(stops.size(), 3u);
  EXPECT_EQ(stops[0].code, "AAA");
  EXPECT_EQ(stops[2].code, "CCC");
  EXPECT_EQ(stops[2].distance_from_origin, 200);
  EXPECT_TRUE(engine_->GetTrainSchedule("T9").empty());
}

// Concurrency tests
TEST(BookingEngineConcurrencyTest, NoSeatIsAssignedTwice) {
  const int capacity = 50;
  const int num_threads = 16;
  const int attempts_per_thread = 10;

  TrainRegistry trains;
  trains["T1"] = makeTrain("T1", "08:00", "14:00", capacity);
  observability::MetricsCollector metrics;
  BookingEngine engine(std::move(trains), []() { return TimeOfDay(9, 0); }, metrics);

  std::mutex seats_mutex;
  std::vector<std::string> all_seats;
  std::atomic<int> confirmed{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < attempts_per_thread; ++i) {
        auto result = engine.BookTickets("T1", "user" + std::to_string(t),
                                         {Passenger("p" + std::to_string(i))}, "SL", "AAA",
                                         "CCC", kMonday, false);
        if (result.ok()) {
          confirmed.fetch_add(1);
          std::lock_guard<std::mutex> lock(seats_mutex);
          all_seats.push_back(result.booking->assignedSeats().front());
        } else {
          EXPECT_EQ(result.status, BookingStatus::INSUFFICIENT_CAPACITY);
          rejected.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(confirmed.load(), capacity);
  EXPECT_EQ(rejected.load(), num_threads * attempts_per_thread - capacity);
  std::set<std::string> unique(all_seats.begin(), all_seats.end());
  EXPECT_EQ(unique.size(), all_seats.size());
  EXPECT_EQ(engine.findTrain("T1")->freeSeats("SL"), 0u);
  EXPECT_TRUE(engine.auditSeatConservation().empty());
}

TEST(BookingEngineConcurrencyTest, SeatsAreConservedUnderMixedTraffic) {
  TrainRegistry trains;
  trains["T1"] = makeTrain("T1", "08:00", "14:00", 20);
  trains["T2"] = makeTrain("T2", "06:00", "16:00", 20);
  observability::MetricsCollector metrics;
  BookingEngine engine(std::move(trains), []() { return TimeOfDay(11, 0); }, metrics);

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&engine, t]() {
      std::string user = "user" + std::to_string(t);
      std::string train = t % 2 == 0 ? "T1" : "T2";
      for (int i = 0; i < 50; ++i) {
        auto result = engine.BookTickets(train, user, {Passenger("a"), Passenger("b")}, "SL",
                                         "AAA", "CCC", kMonday, i % 3 == 0);
        if (!result.ok()) continue;
        if (i % 2 == 0) {
          engine.CancelBooking(user, result.booking->id());
        } else {
          engine.CancelBooking(user, result.booking->id(), {"b"});
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_TRUE(engine.auditSeatConservation().empty());

  size_t held = 0;
  for (int t = 0; t < 8; ++t) {
    for (const auto& booking : engine.GetBookings("user" + std::to_string(t))) {
      EXPECT_EQ(booking.passengers().size(), 1u);
      held += booking.passengers().size();
    }
  }
  size_t free_seats = engine.findTrain("T1")->freeSeats("SL") +
                      engine.findTrain("T2")->freeSeats("SL");
  EXPECT_EQ(held + free_seats, 40u);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  railway::observability::Logger::getInstance().setLogLevel(
      railway::observability::LogLevel::FATAL);
  return RUN_ALL_TESTS();
}
