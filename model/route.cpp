#include "route.hpp"

#include <stdexcept>

namespace railway {

Route::Route(std::vector<Station> stops) : stops_(std::move(stops)) {
  if (stops_.empty()) {
    throw std::invalid_argument("Route needs at least one stop");
  }
  int previous = 0;
  for (const auto& station : stops_) {
    if (station.distance_from_origin < previous) {
      throw std::invalid_argument("Distance decreases at station " + station.code);
    }
    previous = station.distance_from_origin;
  }
}

std::optional<size_t> Route::indexOf(const std::string& code) const {
  for (size_t i = 0; i < stops_.size(); ++i) {
    if (stops_[i].code == code) {
      return i;
    }
  }
  return std::nullopt;
}

bool Route::serves(const std::string& source_code, const std::string& destination_code) const {
  auto source_index = indexOf(source_code);
  auto destination_index = indexOf(destination_code);
  return source_index && destination_index && *source_index < *destination_index;
}

int Route::distanceBetween(const std::string& source_code,
                           const std::string& destination_code) const {
  int source_distance = 0;
  int destination_distance = 0;
  if (auto i = indexOf(source_code)) source_distance = stops_[*i].distance_from_origin;
  if (auto i = indexOf(destination_code)) destination_distance = stops_[*i].distance_from_origin;
  return destination_distance - source_distance;
}

}  // namespace railway
