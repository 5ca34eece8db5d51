#include "include/booking_engine.hpp"
#include "include/config.hpp"
#include "include/catalog/train_catalog_loader.hpp"
#include "include/observability/logger.hpp"
#include "include/simulator/traffic_simulator.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
  using namespace railway;

  try {
    SimulatorConfig config = SimulatorConfig::fromArgs(argc, argv);
    observability::Logger::getInstance().setLogLevel(config.log_level);

    BookingEngine engine(catalog::TrainCatalogLoader::loadFromFile(config.catalog_path));

    // A Monday, so that every sample route has at least one running train
    Date travel_date(2026, 11, 2);
    simulator::TrafficSimulator traffic(engine, simulator::defaultJourneys(travel_date),
                                        config.users, config.rounds);
    traffic.run();

    auto stats = traffic.getStats();
    std::cout << "=== Traffic Simulation ===" << std::endl;
    std::cout << "Users: " << config.users << ", rounds: " << config.rounds << std::endl;
    std::cout << "Searches: " << stats.searches
              << " (without results: " << stats.searches_without_results << ")" << std::endl;
    std::cout << "Bookings confirmed: " << stats.bookings_confirmed << std::endl;
    std::cout << "Bookings rejected: " << stats.bookings_rejected
              << " (no capacity: " << stats.rejected_for_capacity << ")" << std::endl;
    std::cout << "Partial cancellations: " << stats.partial_cancellations << std::endl;
    std::cout << "Full cancellations: " << stats.full_cancellations << std::endl;
    std::cout << "Avg booking time: " << stats.avg_booking_time_ms << " ms" << std::endl;

    for (int u = 1; u <= static_cast<int>(config.users); ++u) {
      std::string user_id = "USER" + std::to_string(u);
      for (const auto& booking : engine.GetBookings(user_id)) {
        std::cout << user_id << " " << booking.id() << " train " << booking.trainId() << " "
                  << booking.travelClass() << " seats";
        for (const auto& seat : booking.assignedSeats()) std::cout << " " << seat;
        std::cout << " fare " << booking.fare() << std::endl;
      }
    }

    auto violations = engine.auditSeatConservation();
    if (!violations.empty()) {
      for (const auto& violation : violations) {
        std::cerr << "Seat conservation violated: " << violation << std::endl;
      }
      return 2;
    }
    std::cout << "Seat conservation holds for every train and class" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Simulation error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
