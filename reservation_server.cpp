#include "reservation_server.hpp"

#include "observability/logger.hpp"

#include <stdexcept>

namespace railway {

using network::protocol::MessageType;
using network::protocol::Request;
using network::protocol::Response;
using network::protocol::Status;

ReservationServer::ReservationServer(int port, std::unique_ptr<BookingEngine> engine,
                                     observability::MetricsCollector& metrics)
    : port_(port), engine_(std::move(engine)), metrics_(metrics) {
  tcp_server_ = std::make_unique<network::TCPServer>(
      port_, [this](const std::string& request) {
        return handleRequest(request);
      });
}

ReservationServer::~ReservationServer() {
  stop();
}

bool ReservationServer::start() {
  if (!tcp_server_->start()) {
    LOG_ERROR("Failed to start TCP server");
    return false;
  }
  LOG_BUILDER(observability::LogLevel::INFO, "Reservation server started")
      .field("port", port_)
      .field("trains", engine_->trains().size());
  return true;
}

void ReservationServer::stop() {
  if (tcp_server_ && tcp_server_->isRunning()) {
    tcp_server_->stop();
    LOG_INFO("Reservation server stopped");
  }
}

ReservationServer::Stats ReservationServer::getStats() const {
  Stats stats;
  stats.is_running = tcp_server_ && tcp_server_->isRunning();
  stats.active_connections = tcp_server_ ? tcp_server_->getConnectionCount() : 0;
  stats.trains = engine_->trains().size();
  stats.active_bookings = engine_->ledger().bookingCount();
  return stats;
}

std::string ReservationServer::handleRequest(const std::string& request_json) {
  Request request;
  try {
    request = network::protocol::deserializeRequest(request_json);
  } catch (const nlohmann::json::exception& e) {
    LOG_BUILDER(observability::LogLevel::WARN, "Undecodable request").field("error", e.what());
    return network::protocol::serializeResponse(
        Response::error(Status::INVALID_REQUEST, "Invalid request format"));
  }

  metrics_.incrementCounter("requests_total");

  Response response;
  try {
    response = dispatch(request);
  } catch (const nlohmann::json::exception& e) {
    response = Response::error(Status::INVALID_REQUEST, std::string("Bad payload: ") + e.what());
  } catch (const std::invalid_argument& e) {
    response = Response::error(Status::INVALID_REQUEST, e.what());
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Request failed")
        .field("error", e.what());
    response = Response::error(Status::ERROR, "Request processing failed");
  }

  if (response.status != Status::SUCCESS) {
    observability::Logger::getInstance().warn(response.message, __func__,
                                              request.correlation_id);
  }
  return network::protocol::serializeResponse(response);
}

Response ReservationServer::dispatch(const Request& request) {
  switch (request.type) {
    case MessageType::SEARCH_TRAINS:
      return searchTrains(request);
    case MessageType::BOOK_TICKETS:
      return bookTickets(request);
    case MessageType::CANCEL_BOOKING:
      return cancelBooking(request);
    case MessageType::GET_BOOKINGS:
      return getBookings(request);
    case MessageType::GET_SCHEDULE:
      return getSchedule(request);
    case MessageType::METRICS: {
      nlohmann::json payload;
      payload["metrics"] = metrics_.exportMetrics();
      return Response::success("Metrics exported", payload);
    }
    case MessageType::HEARTBEAT:
      return Response::success("Heartbeat acknowledged");
    default:
      return Response::error(Status::INVALID_REQUEST, "Unsupported operation");
  }
}

Response ReservationServer::searchTrains(const Request& request) {
  const auto& payload = request.payload;
  const std::string source = payload.at("source").get<std::string>();
  const std::string destination = payload.at("destination").get<std::string>();
  const std::string travel_class = payload.value("travel_class", "");
  Date date = Date::parse(payload.at("date").get<std::string>());

  TrainList trains = engine_->SearchTrains(source, destination, date, travel_class);

  std::string sort_by = payload.value("sort_by", "");
  bool ascending = payload.value("ascending", true);
  if (sort_by == "departure") {
    engine_->SortTrainsByDepartureTime(trains, ascending);
  } else if (sort_by == "arrival") {
    engine_->SortTrainsByArrivalTime(trains, ascending);
  } else if (!sort_by.empty()) {
    return Response::error(Status::INVALID_REQUEST, "Unknown sort key " + sort_by);
  }

  nlohmann::json results = nlohmann::json::array();
  for (const auto& train : trains) {
    nlohmann::json entry;
    entry["train_id"] = train->id();
    entry["name"] = train->name();
    entry["departure"] = train->route().firstDeparture().toString();
    entry["arrival"] = train->route().lastArrival().toString();
    if (train->baseFares().count(travel_class) > 0) {
      entry["fare"] = train->getFare(travel_class, source, destination);
      entry["free_seats"] = train->freeSeats(travel_class);
    }
    results.push_back(entry);
  }

  nlohmann::json response_payload;
  response_payload["trains"] = results;
  return Response::success("Found " + std::to_string(trains.size()) + " trains",
                           response_payload);
}

Response ReservationServer::bookTickets(const Request& request) {
  if (request.user_id.empty()) {
    return Response::error(Status::INVALID_REQUEST, "user_id is required");
  }
  const auto& payload = request.payload;

  std::vector<Passenger> passengers;
  for (const auto& name : payload.at("passengers")) {
    passengers.emplace_back(name.get<std::string>());
  }

  BookingResult result = engine_->BookTickets(
      payload.at("train_id").get<std::string>(), request.user_id, std::move(passengers),
      payload.at("travel_class").get<std::string>(), payload.at("source").get<std::string>(),
      payload.at("destination").get<std::string>(),
      Date::parse(payload.at("date").get<std::string>()), payload.value("tatkal", false));
  return Response::bookingResult(result);
}

Response ReservationServer::cancelBooking(const Request& request) {
  const auto& payload = request.payload;
  std::vector<std::string> names =
      payload.value("passenger_names", std::vector<std::string>{});

  bool cancelled = engine_->CancelBooking(request.user_id,
                                          payload.at("booking_id").get<std::string>(), names);
  if (!cancelled) {
    return Response::error(Status::NOT_FOUND, "Booking not found");
  }
  return Response::success(names.empty() ? "Booking cancelled" : "Passengers cancelled");
}

Response ReservationServer::getBookings(const Request& request) {
  nlohmann::json payload;
  payload["bookings"] = engine_->GetBookings(request.user_id);
  return Response::success("Bookings retrieved", payload);
}

Response ReservationServer::getSchedule(const Request& request) {
  const std::string train_id = request.payload.at("train_id").get<std::string>();
  auto stops = engine_->GetTrainSchedule(train_id);
  if (stops.empty()) {
    return Response::error(Status::NOT_FOUND, "Train not found");
  }
  nlohmann::json payload;
  payload["train_id"] = train_id;
  payload["stops"] = stops;
  return Response::success("Schedule retrieved", payload);
}

}  // namespace railway
