#include "seat_inventory.hpp"

namespace railway {

SeatInventory::SeatInventory(int capacity) : capacity_(capacity) {
  for (int i = 1; i <= capacity; ++i) {
    free_.insert(std::to_string(i));
  }
}

std::vector<std::string> SeatInventory::assign(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count < 1 || free_.size() < static_cast<size_t>(count)) {
    return {};
  }

  std::vector<std::string> assigned;
  assigned.reserve(count);
  auto it = free_.begin();
  for (int i = 0; i < count; ++i) {
    assigned.push_back(*it);
    it = free_.erase(it);
  }
  return assigned;
}

void SeatInventory::release(const std::vector<std::string>& seats) {
  std::lock_guard<std::mutex> lock(mutex_);
  free_.insert(seats.begin(), seats.end());
}

size_t SeatInventory::freeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return free_.size();
}

std::vector<std::string> SeatInventory::freeSeats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {free_.begin(), free_.end()};
}

}  // namespace railway
