#ifndef TCP_SERVER_HPP_
#define TCP_SERVER_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace railway {
namespace network {

/**
 * Blocking TCP server, one thread per client. Each framed request is handed
 * to the request handler and its return value is sent back framed.
 */
class TCPServer {
 public:
  using RequestHandler = std::function<std::string(const std::string&)>;

  TCPServer(int port, RequestHandler handler);
  ~TCPServer();

  // Non-copyable
  TCPServer(const TCPServer&) = delete;
  TCPServer& operator=(const TCPServer&) = delete;

  /**
   * Start the server and begin accepting connections.
   */
  bool start();

  /**
   * Stop the server and close all connections.
   */
  void stop();

  bool isRunning() const { return running_.load(); }
  int getPort() const { return port_; }

  /**
   * Get number of active connections.
   */
  size_t getConnectionCount() const;

 private:
  void acceptLoop();
  void handleClient(int client_socket, std::string client_addr);
  bool sendAll(int client_socket, const std::string& data);

  // Joins and closes connections whose handler has returned
  void reapFinishedClients();

  int port_;
  int server_socket_;
  RequestHandler request_handler_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> accept_thread_;
  std::unordered_map<int, std::thread> client_threads_;
  std::vector<int> finished_clients_;
  mutable std::mutex connections_mutex_;
};

}  // namespace network
}  // namespace railway

#endif  // TCP_SERVER_HPP_
