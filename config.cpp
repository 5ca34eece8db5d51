#include "config.hpp"

#include <stdexcept>

namespace railway {

namespace {

long parseNumber(const std::string& text, const std::string& what, long min, long max) {
  size_t consumed = 0;
  long value = 0;
  try {
    value = std::stol(text, &consumed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Invalid " + what + ": " + text);
  }
  if (consumed != text.size() || value < min || value > max) {
    throw std::invalid_argument("Invalid " + what + ": " + text);
  }
  return value;
}

}  // namespace

ServerConfig ServerConfig::fromArgs(int argc, char* argv[]) {
  ServerConfig config;
  if (argc >= 2) config.port = static_cast<int>(parseNumber(argv[1], "port", 1, 65535));
  if (argc >= 3) config.catalog_path = argv[2];
  if (argc >= 4) config.log_level = observability::parseLogLevel(argv[3]);
  return config;
}

SimulatorConfig SimulatorConfig::fromArgs(int argc, char* argv[]) {
  SimulatorConfig config;
  if (argc >= 2) config.catalog_path = argv[1];
  if (argc >= 3) config.users = static_cast<size_t>(parseNumber(argv[2], "user count", 1, 1024));
  if (argc >= 4) config.rounds = static_cast<size_t>(parseNumber(argv[3], "round count", 1, 100000));
  if (argc >= 5) config.log_level = observability::parseLogLevel(argv[4]);
  return config;
}

}  // namespace railway
