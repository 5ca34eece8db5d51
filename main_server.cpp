#include "include/config.hpp"
#include "include/reservation_server.hpp"
#include "include/catalog/train_catalog_loader.hpp"
#include "include/observability/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

std::atomic<bool> running{true};

void signalHandler(int /*signum*/) {
  running = false;
}

int main(int argc, char* argv[]) {
  using namespace railway;

  try {
    ServerConfig config = ServerConfig::fromArgs(argc, argv);
    observability::Logger::getInstance().setLogLevel(config.log_level);

    LOG_BUILDER(observability::LogLevel::INFO, "Starting reservation server")
        .field("port", config.port)
        .field("catalog", config.catalog_path);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto trains = catalog::TrainCatalogLoader::loadFromFile(config.catalog_path);
    auto engine = std::make_unique<BookingEngine>(std::move(trains));
    ReservationServer server(config.port, std::move(engine));

    if (!server.start()) {
      LOG_FATAL("Failed to start reservation server");
      return 1;
    }

    int ticks = 0;
    while (running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));

      // Report every 30 seconds
      if (++ticks % 30 == 0) {
        auto stats = server.getStats();
        LOG_BUILDER(observability::LogLevel::INFO, "Server statistics")
            .field("active_connections", stats.active_connections)
            .field("trains", stats.trains)
            .field("active_bookings", stats.active_bookings);
      }
    }

    server.stop();
  } catch (const std::exception& e) {
    std::cerr << "Server error: " << e.what() << std::endl;
    return 1;
  }

  LOG_INFO("Server shutdown complete");
  return 0;
}
