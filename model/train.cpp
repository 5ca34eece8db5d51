#include "train.hpp"

#include <stdexcept>

namespace railway {

Train::Train(std::string id, std::string name, Route route,
             std::map<std::string, double> class_base_fares,
             const std::map<std::string, int>& class_capacity,
             std::set<Weekday> running_days)
    : id_(std::move(id)),
      name_(std::move(name)),
      route_(std::move(route)),
      class_base_fares_(std::move(class_base_fares)),
      running_days_(std::move(running_days)) {
  if (route_.empty()) {
    throw std::invalid_argument("Train " + id_ + " has an empty route");
  }
  for (const auto& [travel_class, capacity] : class_capacity) {
    inventories_[travel_class] = std::make_unique<SeatInventory>(capacity);
  }
}

bool Train::serves(const std::string& source_code, const std::string& destination_code) const {
  return route_.serves(source_code, destination_code);
}

bool Train::runsOn(Weekday day) const {
  return running_days_.count(day) > 0;
}

double Train::getFare(const std::string& travel_class, const std::string& source_code,
                      const std::string& destination_code) const {
  double base_fare = class_base_fares_.at(travel_class);
  return base_fare * route_.distanceBetween(source_code, destination_code) / 100.0;
}

std::vector<std::string> Train::assignSeats(const std::string& travel_class, int count) {
  auto it = inventories_.find(travel_class);
  if (it == inventories_.end()) {
    return {};
  }
  return it->second->assign(count);
}

void Train::releaseSeats(const std::string& travel_class, const std::vector<std::string>& seats) {
  auto it = inventories_.find(travel_class);
  if (it != inventories_.end()) {
    it->second->release(seats);
  }
}

std::vector<std::string> Train::travelClasses() const {
  std::vector<std::string> classes;
  for (const auto& entry : inventories_) {
    classes.push_back(entry.first);
  }
  return classes;
}

bool Train::hasClass(const std::string& travel_class) const {
  return inventories_.count(travel_class) > 0;
}

int Train::capacity(const std::string& travel_class) const {
  auto it = inventories_.find(travel_class);
  return it == inventories_.end() ? 0 : it->second->capacity();
}

size_t Train::freeSeats(const std::string& travel_class) const {
  auto it = inventories_.find(travel_class);
  return it == inventories_.end() ? 0 : it->second->freeCount();
}

}  // namespace railway
