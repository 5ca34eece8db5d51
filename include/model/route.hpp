#ifndef ROUTE_HPP_
#define ROUTE_HPP_

#include "calendar.hpp"

#include <optional>
#include <string>
#include <vector>

namespace railway {

/**
 * A single stop on a train's route.
 */
struct Station {
  std::string code;
  std::string name;
  TimeOfDay arrival_time;
  TimeOfDay departure_time;
  int distance_from_origin = 0;  // cumulative, same unit as fares (per 100)
};

/**
 * Ordered, read-only sequence of stops. Stop order defines the direction of
 * travel and cumulative distance never decreases along it.
 */
class Route {
 public:
  // Throws std::invalid_argument if there are no stops or distances decrease.
  explicit Route(std::vector<Station> stops);

  const std::vector<Station>& stops() const { return stops_; }
  bool empty() const { return stops_.empty(); }
  size_t size() const { return stops_.size(); }

  /**
   * Position of `code` in the route, or nullopt if the train never stops there.
   */
  std::optional<size_t> indexOf(const std::string& code) const;

  /**
   * True iff both stops exist and `source_code` comes strictly before
   * `destination_code`.
   */
  bool serves(const std::string& source_code, const std::string& destination_code) const;

  /**
   * Distance travelled between two served stops. Callers must check
   * serves() first; an unknown code counts as distance 0.
   */
  int distanceBetween(const std::string& source_code,
                      const std::string& destination_code) const;

  const TimeOfDay& firstDeparture() const { return stops_.front().departure_time; }
  const TimeOfDay& lastArrival() const { return stops_.back().arrival_time; }

 private:
  std::vector<Station> stops_;
};

}  // namespace railway

#endif  // ROUTE_HPP_
