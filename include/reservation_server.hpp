#ifndef RESERVATION_SERVER_HPP_
#define RESERVATION_SERVER_HPP_

#include "booking_engine.hpp"
#include "network/protocol.hpp"
#include "network/tcp_server.hpp"
#include "observability/metrics.hpp"

#include <memory>
#include <string>

namespace railway {

/**
 * Exposes the reservation engine over the framed JSON protocol.
 * Every request is executed synchronously on the connection's thread.
 */
class ReservationServer {
 public:
  ReservationServer(int port, std::unique_ptr<BookingEngine> engine,
                    observability::MetricsCollector& metrics =
                        observability::getGlobalMetrics());
  ~ReservationServer();

  // Non-copyable
  ReservationServer(const ReservationServer&) = delete;
  ReservationServer& operator=(const ReservationServer&) = delete;

  bool start();
  void stop();

  struct Stats {
    bool is_running;
    size_t active_connections;
    size_t trains;
    size_t active_bookings;
  };
  Stats getStats() const;

  int getPort() const { return port_; }

  /**
   * Decodes one request, runs it and returns the encoded response. Never
   * throws: malformed input becomes an INVALID_REQUEST response.
   */
  std::string handleRequest(const std::string& request_json);

  network::protocol::Response dispatch(const network::protocol::Request& request);

 private:
  network::protocol::Response searchTrains(const network::protocol::Request& request);
  network::protocol::Response bookTickets(const network::protocol::Request& request);
  network::protocol::Response cancelBooking(const network::protocol::Request& request);
  network::protocol::Response getBookings(const network::protocol::Request& request);
  network::protocol::Response getSchedule(const network::protocol::Request& request);

  int port_;
  std::unique_ptr<BookingEngine> engine_;
  observability::MetricsCollector& metrics_;
  std::unique_ptr<network::TCPServer> tcp_server_;
};

}  // namespace railway

#endif  // RESERVATION_SERVER_HPP_
