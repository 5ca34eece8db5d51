#include "train_catalog_loader.hpp"

#include "observability/logger.hpp"

#include <fstream>
#include <map>
#include <set>
#include <vector>

namespace railway {
namespace catalog {

namespace {

constexpr size_t kFieldCount = 6;
const std::string kPairSeparator = ";";
const std::string kFieldSeparator = "::";

std::vector<std::string> split(const std::string& input, const std::string& separator) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = input.find(separator, start);
    if (pos == std::string::npos) {
      parts.push_back(input.substr(start));
      return parts;
    }
    parts.push_back(input.substr(start, pos - start));
    start = pos + separator.size();
  }
}

std::string trim(const std::string& text) {
  const char* whitespace = " \t\r\n";
  auto first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) return "";
  auto last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

std::vector<std::string> splitPair(const std::string& pair, size_t expected, size_t line,
                                   const std::string& what) {
  auto fields = split(trim(pair), kFieldSeparator);
  if (fields.size() != expected) {
    throw CatalogError(line, "Malformed " + what + " entry '" + pair + "'");
  }
  return fields;
}

double parseDouble(const std::string& text, size_t line, const std::string& what) {
  try {
    size_t consumed = 0;
    double value = std::stod(trim(text), &consumed);
    if (consumed != trim(text).size()) throw std::invalid_argument(text);
    return value;
  } catch (const std::logic_error&) {
    throw CatalogError(line, "Invalid " + what + " '" + text + "'");
  }
}

int parseInt(const std::string& text, size_t line, const std::string& what) {
  try {
    size_t consumed = 0;
    int value = std::stoi(trim(text), &consumed);
    if (consumed != trim(text).size()) throw std::invalid_argument(text);
    return value;
  } catch (const std::logic_error&) {
    throw CatalogError(line, "Invalid " + what + " '" + text + "'");
  }
}

std::map<std::string, double> parseClassFares(const std::string& input, size_t line) {
  std::map<std::string, double> fares;
  for (const auto& pair : split(input, kPairSeparator)) {
    auto fields = splitPair(pair, 2, line, "fare");
    double fare = parseDouble(fields[1], line, "fare");
    if (fare < 0) {
      throw CatalogError(line, "Negative fare for class " + fields[0]);
    }
    fares[trim(fields[0])] = fare;
  }
  return fares;
}

std::map<std::string, int> parseClassCapacity(const std::string& input, size_t line) {
  std::map<std::string, int> capacity;
  for (const auto& pair : split(input, kPairSeparator)) {
    auto fields = splitPair(pair, 2, line, "capacity");
    int seats = parseInt(fields[1], line, "capacity");
    if (seats < 0) {
      throw CatalogError(line, "Negative capacity for class " + fields[0]);
    }
    capacity[trim(fields[0])] = seats;
  }
  return capacity;
}

std::set<Weekday> parseRunningDays(const std::string& input, size_t line) {
  std::set<Weekday> days;
  for (const auto& day : split(input, kPairSeparator)) {
    try {
      days.insert(parseWeekday(trim(day)));
    } catch (const std::invalid_argument& e) {
      throw CatalogError(line, e.what());
    }
  }
  return days;
}

std::vector<Station> parseStops(const std::string& input, size_t line) {
  std::vector<Station> stops;
  for (const auto& entry : split(input, kPairSeparator)) {
    auto parts = splitPair(entry, 5, line, "stop");
    Station station;
    station.code = trim(parts[0]);
    station.name = trim(parts[1]);
    try {
      station.arrival_time = TimeOfDay::parse(trim(parts[2]));
      station.departure_time = TimeOfDay::parse(trim(parts[3]));
    } catch (const std::logic_error& e) {
      throw CatalogError(line, std::string(e.what()) + " at stop " + station.code);
    }
    station.distance_from_origin = parseInt(parts[4], line, "distance");
    if (station.distance_from_origin < 0) {
      throw CatalogError(line, "Negative distance at stop " + station.code);
    }
    stops.push_back(std::move(station));
  }
  return stops;
}

}  // namespace

CatalogError::CatalogError(size_t line, const std::string& message)
    : std::runtime_error(line == 0 ? message : "line " + std::to_string(line) + ": " + message),
      line_(line) {
}

std::shared_ptr<Train> TrainCatalogLoader::parseRecord(const std::string& line,
                                                       size_t line_number) {
  auto parts = split(line, ",");
  if (parts.size() != kFieldCount) {
    throw CatalogError(line_number, "Expected " + std::to_string(kFieldCount) +
                                        " fields, got " + std::to_string(parts.size()));
  }

  std::string id = trim(parts[0]);
  if (id.empty()) {
    throw CatalogError(line_number, "Missing train id");
  }

  auto fares = parseClassFares(parts[2], line_number);
  auto capacity = parseClassCapacity(parts[3], line_number);
  auto running_days = parseRunningDays(parts[4], line_number);
  auto stops = parseStops(parts[5], line_number);
  if (stops.empty()) {
    throw CatalogError(line_number, "Train " + id + " has no stops");
  }

  try {
    return std::make_shared<Train>(id, trim(parts[1]), Route(std::move(stops)),
                                   std::move(fares), capacity, std::move(running_days));
  } catch (const std::invalid_argument& e) {
    throw CatalogError(line_number, e.what());
  }
}

TrainRegistry TrainCatalogLoader::loadFromStream(std::istream& input) {
  TrainRegistry trains;
  std::string line;
  size_t line_number = 0;

  // Header
  if (std::getline(input, line)) {
    ++line_number;
  }

  while (std::getline(input, line)) {
    ++line_number;
    if (trim(line).empty()) {
      continue;
    }

    auto train = parseRecord(line, line_number);
    if (trains.count(train->id()) > 0) {
      throw CatalogError(line_number, "Duplicate train id " + train->id());
    }

    LOG_BUILDER(observability::LogLevel::DEBUG, "Loaded train")
        .field("train_id", train->id())
        .field("stops", train->route().size());
    trains.emplace(train->id(), std::move(train));
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Train catalog loaded")
      .field("trains", trains.size());
  return trains;
}

TrainRegistry TrainCatalogLoader::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw CatalogError(0, "Cannot open train catalog " + path);
  }
  return loadFromStream(file);
}

}  // namespace catalog
}  // namespace railway
