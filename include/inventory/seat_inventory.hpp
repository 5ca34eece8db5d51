#ifndef SEAT_INVENTORY_HPP_
#define SEAT_INVENTORY_HPP_

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace railway {

/**
 * Orders seat identifiers numerically when they are decimal strings
 * ("2" < "10"), lexicographically otherwise.
 */
struct SeatOrder {
  bool operator()(const std::string& lhs, const std::string& rhs) const {
    if (lhs.size() != rhs.size()) return lhs.size() < rhs.size();
    return lhs < rhs;
  }
};

/**
 * Pool of free seat identifiers for one travel class of one train.
 * Thread-safe: assign() and release() are each a single atomic step.
 */
class SeatInventory {
 public:
  // Seats "1".."capacity" start out free.
  explicit SeatInventory(int capacity);

  SeatInventory(const SeatInventory&) = delete;
  SeatInventory& operator=(const SeatInventory&) = delete;

  /**
   * Removes and returns the `count` lowest free seats. Returns an empty
   * vector and leaves the pool untouched if fewer than `count` are free or
   * count < 1.
   */
  std::vector<std::string> assign(int count);

  /**
   * Returns seats to the pool. Already-free identifiers are ignored.
   */
  void release(const std::vector<std::string>& seats);

  size_t freeCount() const;
  int capacity() const { return capacity_; }
  std::vector<std::string> freeSeats() const;

 private:
  const int capacity_;
  std::set<std::string, SeatOrder> free_;
  mutable std::mutex mutex_;
};

}  // namespace railway

#endif  // SEAT_INVENTORY_HPP_
