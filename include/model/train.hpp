#ifndef TRAIN_HPP_
#define TRAIN_HPP_

#include "calendar.hpp"
#include "route.hpp"
#include "inventory/seat_inventory.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace railway {

/**
 * A scheduled train: its route, per-class fares and running days are fixed
 * at construction; the per-class seat inventories are the only mutable state.
 */
class Train {
 public:
  /**
   * `class_base_fares` are fares per 100 distance units.
   * `class_capacity` seeds one SeatInventory per class.
   */
  Train(std::string id, std::string name, Route route,
        std::map<std::string, double> class_base_fares,
        const std::map<std::string, int>& class_capacity,
        std::set<Weekday> running_days);

  // Non-copyable
  Train(const Train&) = delete;
  Train& operator=(const Train&) = delete;

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  const Route& route() const { return route_; }
  const std::set<Weekday>& runningDays() const { return running_days_; }
  const std::map<std::string, double>& baseFares() const { return class_base_fares_; }

  bool serves(const std::string& source_code, const std::string& destination_code) const;
  bool runsOn(Weekday day) const;

  /**
   * base_fare[class] * distance(source -> destination) / 100.
   * Precondition: serves(source, destination). Throws std::out_of_range for
   * a class without a fare.
   */
  double getFare(const std::string& travel_class, const std::string& source_code,
                 const std::string& destination_code) const;

  /**
   * Empty result if the class is unknown or has fewer than `count` free seats.
   */
  std::vector<std::string> assignSeats(const std::string& travel_class, int count);
  void releaseSeats(const std::string& travel_class, const std::vector<std::string>& seats);

  std::vector<std::string> travelClasses() const;
  bool hasClass(const std::string& travel_class) const;
  int capacity(const std::string& travel_class) const;
  size_t freeSeats(const std::string& travel_class) const;

 private:
  std::string id_;
  std::string name_;
  Route route_;
  std::map<std::string, double> class_base_fares_;
  std::set<Weekday> running_days_;
  std::map<std::string, std::unique_ptr<SeatInventory>> inventories_;
};

// Trains keyed by id.
using TrainRegistry = std::map<std::string, std::shared_ptr<Train>>;

}  // namespace railway

#endif  // TRAIN_HPP_
