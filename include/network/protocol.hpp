#ifndef PROTOCOL_HPP_
#define PROTOCOL_HPP_

#include "reservation_system.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace railway {

// JSON views of the domain types, found by nlohmann::json through ADL.
void to_json(nlohmann::json& j, const Station& station);
void to_json(nlohmann::json& j, const Passenger& passenger);
void to_json(nlohmann::json& j, const Booking& booking);

namespace network {
namespace protocol {

// Message types
enum class MessageType {
  UNKNOWN,
  SEARCH_TRAINS,
  BOOK_TICKETS,
  CANCEL_BOOKING,
  GET_BOOKINGS,
  GET_SCHEDULE,
  METRICS,
  HEARTBEAT
};

// Response status
enum class Status {
  SUCCESS,
  ERROR,
  INVALID_REQUEST,
  NOT_FOUND,
  INSUFFICIENT_CAPACITY,
  TATKAL_WINDOW_VIOLATION,
  INVALID_ROUTE
};

NLOHMANN_JSON_SERIALIZE_ENUM(MessageType, {
  {MessageType::UNKNOWN, "UNKNOWN"},
  {MessageType::SEARCH_TRAINS, "SEARCH_TRAINS"},
  {MessageType::BOOK_TICKETS, "BOOK_TICKETS"},
  {MessageType::CANCEL_BOOKING, "CANCEL_BOOKING"},
  {MessageType::GET_BOOKINGS, "GET_BOOKINGS"},
  {MessageType::GET_SCHEDULE, "GET_SCHEDULE"},
  {MessageType::METRICS, "METRICS"},
  {MessageType::HEARTBEAT, "HEARTBEAT"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Status, {
  {Status::ERROR, "ERROR"},
  {Status::SUCCESS, "SUCCESS"},
  {Status::INVALID_REQUEST, "INVALID_REQUEST"},
  {Status::NOT_FOUND, "NOT_FOUND"},
  {Status::INSUFFICIENT_CAPACITY, "INSUFFICIENT_CAPACITY"},
  {Status::TATKAL_WINDOW_VIOLATION, "TATKAL_WINDOW_VIOLATION"},
  {Status::INVALID_ROUTE, "INVALID_ROUTE"},
})

// Request base structure
struct Request {
  MessageType type = MessageType::UNKNOWN;
  std::string user_id;
  std::string correlation_id;
  nlohmann::json payload = nlohmann::json::object();

  // Helper methods for specific request types
  static Request searchTrains(const std::string& user_id, const std::string& source,
                              const std::string& destination, const std::string& date,
                              const std::string& travel_class,
                              const std::string& sort_by = "", bool ascending = true);

  static Request bookTickets(const std::string& user_id, const std::string& train_id,
                             const std::vector<std::string>& passenger_names,
                             const std::string& travel_class, const std::string& source,
                             const std::string& destination, const std::string& date,
                             bool tatkal);

  static Request cancelBooking(const std::string& user_id, const std::string& booking_id,
                               const std::vector<std::string>& passenger_names = {});

  static Request getBookings(const std::string& user_id);
  static Request getSchedule(const std::string& train_id);
  static Request metrics();
  static Request heartbeat();
};

// Response base structure
struct Response {
  Status status = Status::ERROR;
  std::string message;
  nlohmann::json payload = nlohmann::json::object();

  static Response success(const std::string& message,
                          const nlohmann::json& payload = nlohmann::json::object());
  static Response error(Status status, const std::string& message);

  // Carries the booking on success, the rejection reason otherwise
  static Response bookingResult(const BookingResult& result);
};

Status statusFor(BookingStatus status);

// Serialization functions; deserializers throw nlohmann::json::exception
std::string serializeRequest(const Request& request);
Request deserializeRequest(const std::string& json_str);

std::string serializeResponse(const Response& response);
Response deserializeResponse(const std::string& json_str);

/**
 * Length-prefixed framing for TCP transport: 8 hex digits, then the body.
 */
class MessageFramer {
 public:
  static constexpr size_t kHeaderSize = 8;
  static constexpr size_t kMaxMessageSize = 1 << 20;

  static std::string frameMessage(const std::string& message);

  // Throws std::runtime_error if the frame is short or oversized.
  static std::string unframeMessage(const std::string& framed_message);
  static bool isCompleteMessage(const std::string& buffer);

  /**
   * Removes the first complete frame from `buffer` and returns its body.
   */
  static std::string extractMessage(std::string& buffer);

 private:
  static size_t readLength(const std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace railway

#endif  // PROTOCOL_HPP_
