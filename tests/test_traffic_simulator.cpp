#include "../include/booking_engine.hpp"
#include "../include/catalog/train_catalog_loader.hpp"
#include "../include/simulator/traffic_simulator.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace railway;

namespace {

// Two tiny trains so that the simulated users run out of seats
const char* kCatalog =
    "train_number,train_name,class_fares,class_capacity,running_days,stops\n"
    "T1,Morning,SL::100,SL::4,MON,AAA::Alpha::00:00::06:00::0;CCC::Gamma::09:00::09:00::300\n"
    "T2,Evening,SL::100,SL::4,MON,AAA::Alpha::00:00::18:00::0;CCC::Gamma::21:00::21:00::300\n";

}  // namespace

TEST(TrafficSimulatorTest, ConcurrentUsersPreserveSeatConservation) {
  std::istringstream input(kCatalog);
  observability::MetricsCollector metrics;
  BookingEngine engine(catalog::TrainCatalogLoader::loadFromStream(input),
                       []() { return TimeOfDay(9, 0); }, metrics);

  Date monday(2026, 11, 2);
  std::vector<simulator::Journey> journeys = {
      {"AAA", "CCC", "SL", monday, {"Asha", "Ravi"}},
      {"CCC", "AAA", "SL", monday, {"Nobody"}},
  };
  simulator::TrafficSimulator traffic(engine, journeys, 8, 6);
  traffic.run();

  auto stats = traffic.getStats();
  EXPECT_EQ(stats.searches, 48u);
  EXPECT_EQ(stats.searches_without_results, 24u);
  EXPECT_EQ(stats.bookings_confirmed + stats.bookings_rejected, 24u);
  EXPECT_EQ(stats.bookings_rejected, stats.rejected_for_capacity);
  EXPECT_GT(stats.bookings_confirmed, 0u);

  // Users always pick the earliest departure, so T2 is never touched
  EXPECT_EQ(engine.findTrain("T2")->freeSeats("SL"), 4u);
  EXPECT_TRUE(engine.auditSeatConservation().empty());
}

TEST(TrafficSimulatorTest, DefaultJourneysTargetSampleRoutes) {
  auto journeys = simulator::defaultJourneys(Date(2026, 11, 2));
  ASSERT_EQ(journeys.size(), 3u);
  EXPECT_EQ(journeys[0].source, "NDLS");
  EXPECT_EQ(journeys[2].destination, "NDLS");
  EXPECT_FALSE(journeys[1].passengers.empty());
}
