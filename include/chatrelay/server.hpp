#ifndef CHATRELAY_SERVER_HPP_
#define CHATRELAY_SERVER_HPP_

#include "connection.hpp"
#include "connection_handler.hpp"
#include "connection_pool.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>
#include <sockpp/tcp_acceptor.h>
#include <string>
#include <thread>
#include <vector>

namespace chatrelay {

// ============================================================================
// Server configuration
// ============================================================================

struct ServerConfig {
  uint16_t port = 7000;         // 0 = pick an ephemeral port
  std::string bind_addr;        // empty = all interfaces

  size_t initial_pool_size = 10;
  size_t max_pool_size = 0;     // 0 = grow without limit
  size_t recv_buffer_size = 2048;

  std::string greeting = "Hello";
  std::string farewell = "Bye!";
  std::string end_token = ":end";

  bool live_membership = true;  // false: peers frozen at accept time
  int poll_timeout_ms = 200;    // accept loop wake-up interval
  int read_timeout_ms = 0;      // 0 = no read timeout
  int write_timeout_ms = 5000;  // 0 = block on slow clients
  bool tcp_nodelay = false;
};

// ============================================================================
// Server (accept loop + one handler thread per client)
// ============================================================================

class Server {
 public:
  using ConnPtr = Connection::ConnPtr;

  // Binds and listens immediately. Throws std::runtime_error when the
  // listening socket cannot be set up.
  explicit Server(uint16_t port, const std::string& bind_addr = "");
  explicit Server(const ServerConfig& config);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Run the accept loop until stop() (blocking). On return every handler
  // thread has been joined.
  void run();

  // Request the accept loop to end. Safe to call from any thread or from a
  // signal handler, also before run() has started.
  void stop() { stop_requested_.store(true); }

  bool is_running() const { return is_running_.load(); }

  // Configuration (before run())

  // Rebuilds the pool. Ignored with a warning while the server is running or
  // any slot is occupied.
  Server& set_initial_pool_size(size_t size);

  Server& set_max_pool_size(size_t size);

  Server& set_recv_buffer_size(size_t size) {
    config_.recv_buffer_size = size;
    return *this;
  }

  Server& set_greeting(const std::string& greeting) {
    config_.greeting = greeting;
    return *this;
  }

  Server& set_farewell(const std::string& farewell) {
    config_.farewell = farewell;
    return *this;
  }

  Server& set_live_membership(bool live) {
    config_.live_membership = live;
    return *this;
  }

  Server& set_poll_timeout_ms(int timeout) {
    config_.poll_timeout_ms = timeout;
    return *this;
  }

  Server& set_read_timeout_ms(int timeout) {
    config_.read_timeout_ms = timeout;
    return *this;
  }

  Server& set_write_timeout_ms(int timeout) {
    config_.write_timeout_ms = timeout;
    return *this;
  }

  Server& set_tcp_nodelay(bool enable) {
    config_.tcp_nodelay = enable;
    return *this;
  }

  // Status
  uint16_t port() const { return bound_port_; }
  const ServerConfig& config() const { return config_; }
  const ConnectionPool& pool() const { return *pool_; }
  size_t get_connection_count() const { return pool_->occupied_count(); }
  size_t get_handler_count() const;

  const RelayStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  struct Worker {
    std::shared_ptr<ConnectionHandler> handler;
    std::thread thread;
  };

  ServerConfig config_;
  sockpp::tcp_acceptor acceptor_;
  uint16_t bound_port_ = 0;
  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};

  std::unique_ptr<ConnectionPool> pool_;

  mutable std::mutex workers_mutex_;
  std::vector<Worker> workers_;

  RelayStats stats_;

  // Internal methods
  void open_listener();
  bool pool_resizable();
  expected<void, ErrorCode> accept_connection();
  void launch_handler(const ConnPtr& slot);
  HandlerOptions handler_options() const;

  // Join handlers that have reached kClosed (all of them when wait_all).
  void reap_handlers(bool wait_all);
};

}  // namespace chatrelay

#endif  // CHATRELAY_SERVER_HPP_
