#ifndef CONFIG_HPP_
#define CONFIG_HPP_

#include "observability/logger.hpp"

#include <cstddef>
#include <string>

namespace railway {

/**
 * reservation_server [port] [catalog_path] [log_level]
 */
struct ServerConfig {
  int port = 8080;
  std::string catalog_path = "data/trains.csv";
  observability::LogLevel log_level = observability::LogLevel::INFO;

  // Throws std::invalid_argument on malformed values.
  static ServerConfig fromArgs(int argc, char* argv[]);
};

/**
 * traffic_simulator [catalog_path] [users] [rounds] [log_level]
 */
struct SimulatorConfig {
  std::string catalog_path = "data/trains.csv";
  size_t users = 6;
  size_t rounds = 3;
  observability::LogLevel log_level = observability::LogLevel::WARN;

  static SimulatorConfig fromArgs(int argc, char* argv[]);
};

}  // namespace railway

#endif  // CONFIG_HPP_
