#include "protocol.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace railway {

void to_json(nlohmann::json& j, const Station& station) {
  j = nlohmann::json{{"code", station.code},
                     {"name", station.name},
                     {"arrival", station.arrival_time.toString()},
                     {"departure", station.departure_time.toString()},
                     {"distance", station.distance_from_origin}};
}

void to_json(nlohmann::json& j, const Passenger& passenger) {
  j = nlohmann::json{{"name", passenger.name}, {"seat", passenger.seat}};
}

void to_json(nlohmann::json& j, const Booking& booking) {
  j = nlohmann::json{{"booking_id", booking.id()},
                     {"train_id", booking.trainId()},
                     {"user_id", booking.userId()},
                     {"passengers", booking.passengers()},
                     {"travel_class", booking.travelClass()},
                     {"source", booking.sourceCode()},
                     {"destination", booking.destinationCode()},
                     {"date", booking.travelDate().toString()},
                     {"seats", booking.assignedSeats()},
                     {"fare", booking.fare()},
                     {"tatkal", booking.isTatkal()}};
}

namespace network {
namespace protocol {

// Request helper methods
Request Request::searchTrains(const std::string& user_id, const std::string& source,
                              const std::string& destination, const std::string& date,
                              const std::string& travel_class, const std::string& sort_by,
                              bool ascending) {
  Request req;
  req.type = MessageType::SEARCH_TRAINS;
  req.user_id = user_id;
  req.payload["source"] = source;
  req.payload["destination"] = destination;
  req.payload["date"] = date;
  req.payload["travel_class"] = travel_class;
  if (!sort_by.empty()) {
    req.payload["sort_by"] = sort_by;
    req.payload["ascending"] = ascending;
  }
  return req;
}

Request Request::bookTickets(const std::string& user_id, const std::string& train_id,
                             const std::vector<std::string>& passenger_names,
                             const std::string& travel_class, const std::string& source,
                             const std::string& destination, const std::string& date,
                             bool tatkal) {
  Request req;
  req.type = MessageType::BOOK_TICKETS;
  req.user_id = user_id;
  req.payload["train_id"] = train_id;
  req.payload["passengers"] = passenger_names;
  req.payload["travel_class"] = travel_class;
  req.payload["source"] = source;
  req.payload["destination"] = destination;
  req.payload["date"] = date;
  req.payload["tatkal"] = tatkal;
  return req;
}

Request Request::cancelBooking(const std::string& user_id, const std::string& booking_id,
                               const std::vector<std::string>& passenger_names) {
  Request req;
  req.type = MessageType::CANCEL_BOOKING;
  req.user_id = user_id;
  req.payload["booking_id"] = booking_id;
  req.payload["passenger_names"] = passenger_names;
  return req;
}

Request Request::getBookings(const std::string& user_id) {
  Request req;
  req.type = MessageType::GET_BOOKINGS;
  req.user_id = user_id;
  return req;
}

Request Request::getSchedule(const std::string& train_id) {
  Request req;
  req.type = MessageType::GET_SCHEDULE;
  req.payload["train_id"] = train_id;
  return req;
}

Request Request::metrics() {
  Request req;
  req.type = MessageType::METRICS;
  return req;
}

Request Request::heartbeat() {
  Request req;
  req.type = MessageType::HEARTBEAT;
  return req;
}

// Response helper methods
Response Response::success(const std::string& message, const nlohmann::json& payload) {
  Response resp;
  resp.status = Status::SUCCESS;
  resp.message = message;
  resp.payload = payload;
  return resp;
}

Response Response::error(Status status, const std::string& message) {
  Response resp;
  resp.status = status;
  resp.message = message;
  return resp;
}

Response Response::bookingResult(const BookingResult& result) {
  if (!result.ok() || !result.booking) {
    return error(statusFor(result.status), result.message);
  }
  nlohmann::json payload;
  payload["booking"] = *result.booking;
  return success(result.message, payload);
}

Status statusFor(BookingStatus status) {
  switch (status) {
    case BookingStatus::CONFIRMED: return Status::SUCCESS;
    case BookingStatus::TRAIN_NOT_FOUND: return Status::NOT_FOUND;
    case BookingStatus::INSUFFICIENT_CAPACITY: return Status::INSUFFICIENT_CAPACITY;
    case BookingStatus::TATKAL_WINDOW_VIOLATION: return Status::TATKAL_WINDOW_VIOLATION;
    case BookingStatus::INVALID_ROUTE: return Status::INVALID_ROUTE;
    case BookingStatus::INVALID_REQUEST: return Status::INVALID_REQUEST;
    default: return Status::ERROR;
  }
}

// Serialization functions
std::string serializeRequest(const Request& request) {
  nlohmann::json j;
  j["type"] = request.type;
  j["user_id"] = request.user_id;
  j["correlation_id"] = request.correlation_id;
  j["payload"] = request.payload;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Request deserializeRequest(const std::string& json_str) {
  nlohmann::json j = nlohmann::json::parse(json_str);
  Request req;
  req.type = j.at("type").get<MessageType>();
  req.user_id = j.value("user_id", "");
  req.correlation_id = j.value("correlation_id", "");
  req.payload = j.value("payload", nlohmann::json::object());
  return req;
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = response.status;
  j["message"] = response.message;
  j["payload"] = response.payload;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Response deserializeResponse(const std::string& json_str) {
  nlohmann::json j = nlohmann::json::parse(json_str);
  Response resp;
  resp.status = j.at("status").get<Status>();
  resp.message = j.value("message", "");
  resp.payload = j.value("payload", nlohmann::json::object());
  return resp;
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& message) {
  std::stringstream ss;
  ss << std::setw(kHeaderSize) << std::setfill('0') << std::hex << message.size();
  ss << message;
  return ss.str();
}

size_t MessageFramer::readLength(const std::string& buffer) {
  std::stringstream ss(buffer.substr(0, kHeaderSize));
  size_t message_size = 0;
  if (!(ss >> std::hex >> message_size)) {
    throw std::runtime_error("Invalid framed message: bad length header");
  }
  if (message_size > kMaxMessageSize) {
    throw std::runtime_error("Invalid framed message: too large");
  }
  return message_size;
}

std::string MessageFramer::unframeMessage(const std::string& framed_message) {
  if (framed_message.size() < kHeaderSize) {
    throw std::runtime_error("Invalid framed message: too short");
  }

  size_t message_size = readLength(framed_message);
  if (framed_message.size() < kHeaderSize + message_size) {
    throw std::runtime_error("Invalid framed message: incomplete");
  }

  return framed_message.substr(kHeaderSize, message_size);
}

bool MessageFramer::isCompleteMessage(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) return false;
  return buffer.size() >= kHeaderSize + readLength(buffer);
}

std::string MessageFramer::extractMessage(std::string& buffer) {
  std::string message = unframeMessage(buffer);
  buffer.erase(0, kHeaderSize + message.size());
  return message;
}

}  // namespace protocol
}  // namespace network
}  // namespace railway
