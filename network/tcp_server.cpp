#include "tcp_server.hpp"
#include "protocol.hpp"

#include "observability/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace railway {
namespace network {

TCPServer::TCPServer(int port, RequestHandler handler)
    : port_(port),
      server_socket_(-1),
      request_handler_(std::move(handler)),
      running_(false) {
}

TCPServer::~TCPServer() {
  stop();
}

bool TCPServer::start() {
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LOG_ERROR(std::string("Failed to create socket: ") + std::strerror(errno));
    return false;
  }

  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LOG_ERROR(std::string("Failed to set socket options: ") + std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  struct sockaddr_in address;
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(port_);

  if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
    LOG_ERROR("Failed to bind socket to port " + std::to_string(port_));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  if (listen(server_socket_, 16) < 0) {
    LOG_ERROR(std::string("Failed to listen on socket: ") + std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&TCPServer::acceptLoop, this);

  LOG_BUILDER(observability::LogLevel::INFO, "TCP server started").field("port", port_);
  return true;
}

void TCPServer::stop() {
  if (!running_.exchange(false)) return;

  // Close server socket to break accept loop
  if (server_socket_ >= 0) {
    shutdown(server_socket_, SHUT_RDWR);
    close(server_socket_);
    server_socket_ = -1;
  }

  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }

  std::unordered_map<int, std::thread> clients;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    clients.swap(client_threads_);
    finished_clients_.clear();
  }

  // Unblock readers, then wait for their handlers
  for (auto& [client_socket, thread] : clients) {
    shutdown(client_socket, SHUT_RDWR);
  }
  for (auto& [client_socket, thread] : clients) {
    if (thread.joinable()) {
      thread.join();
    }
    close(client_socket);
  }

  LOG_INFO("TCP server stopped");
}

void TCPServer::acceptLoop() {
  while (running_) {
    struct sockaddr_in client_address;
    socklen_t client_addr_len = sizeof(client_address);

    int client_socket = accept(server_socket_,
                               reinterpret_cast<struct sockaddr*>(&client_address),
                               &client_addr_len);

    reapFinishedClients();

    if (client_socket < 0) {
      if (running_) {
        LOG_WARN(std::string("Failed to accept connection: ") + std::strerror(errno));
      }
      continue;
    }

    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);
    std::string client_addr = std::string(client_ip) + ":" +
                              std::to_string(ntohs(client_address.sin_port));

    LOG_BUILDER(observability::LogLevel::INFO, "Accepted connection")
        .field("client", client_addr);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!running_) {
      close(client_socket);
      break;
    }
    client_threads_.emplace(client_socket,
                            std::thread(&TCPServer::handleClient, this, client_socket,
                                        client_addr));
  }
}

void TCPServer::handleClient(int client_socket, std::string client_addr) {
  char buffer[4096];
  std::string message_buffer;
  bool open = true;

  while (running_ && open) {
    ssize_t bytes_read = read(client_socket, buffer, sizeof(buffer));

    if (bytes_read <= 0) {
      if (bytes_read < 0 && running_) {
        LOG_WARN("Error reading from client " + client_addr);
      }
      break;
    }

    message_buffer.append(buffer, static_cast<size_t>(bytes_read));

    try {
      while (protocol::MessageFramer::isCompleteMessage(message_buffer)) {
        std::string request_json = protocol::MessageFramer::extractMessage(message_buffer);
        std::string response_json = request_handler_(request_json);

        if (!sendAll(client_socket, protocol::MessageFramer::frameMessage(response_json))) {
          LOG_WARN("Error writing to client " + client_addr);
          open = false;
          break;
        }
      }
    } catch (const std::runtime_error& e) {
      // Framing is unrecoverable: report once and drop the connection
      LOG_BUILDER(observability::LogLevel::WARN, "Malformed frame")
          .field("client", client_addr)
          .field("error", e.what());
      auto error_response = protocol::Response::error(
          protocol::Status::INVALID_REQUEST, "Invalid request frame");
      if (!sendAll(client_socket, protocol::MessageFramer::frameMessage(
                                      protocol::serializeResponse(error_response)))) {
        LOG_WARN("Error writing to client " + client_addr);
      }
      open = false;
    }
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Closed connection").field("client", client_addr);

  std::lock_guard<std::mutex> lock(connections_mutex_);
  if (client_threads_.count(client_socket) > 0) {
    finished_clients_.push_back(client_socket);
  }
}

bool TCPServer::sendAll(int client_socket, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t written = send(client_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(written);
  }
  return true;
}

void TCPServer::reapFinishedClients() {
  std::vector<std::thread> done;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (int client_socket : finished_clients_) {
      auto it = client_threads_.find(client_socket);
      if (it != client_threads_.end()) {
        done.push_back(std::move(it->second));
        client_threads_.erase(it);
        close(client_socket);
      }
    }
    finished_clients_.clear();
  }
  for (auto& thread : done) {
    thread.join();
  }
}

size_t TCPServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return client_threads_.size() - finished_clients_.size();
}

}  // namespace network
}  // namespace railway
