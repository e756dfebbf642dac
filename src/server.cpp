#include "chatrelay/server.hpp"

#include "chatrelay/log.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sockpp/inet_address.h>
#include <sockpp/socket.h>
#include <stdexcept>

namespace chatrelay {

static constexpr int kListenBacklog = 128;

Server::Server(uint16_t port, const std::string& bind_addr) : Server([&] {
  ServerConfig config;
  config.port = port;
  config.bind_addr = bind_addr;
  return config;
}()) {}

Server::Server(const ServerConfig& config)
    : config_(config), pool_(std::make_unique<ConnectionPool>(config.initial_pool_size, config.max_pool_size)) {
  open_listener();
}

Server::~Server() {
  stop();
  pool_->shutdown_all();
  reap_handlers(true);
  if (acceptor_.is_open()) {
    acceptor_.close();
  }
}

void Server::open_listener() {
  sockpp::initialize();

  sockpp::inet_address addr = config_.bind_addr.empty() ? sockpp::inet_address(config_.port)
                                                        : sockpp::inet_address(config_.bind_addr, config_.port);

  if (!acceptor_.open(addr, kListenBacklog)) {
    throw std::runtime_error("Failed to listen on port " + std::to_string(config_.port) + ": " +
                             acceptor_.last_error_str());
  }

  bound_port_ = acceptor_.address().port();
  CHATRELAY_LOG_INFO("Server initialized on " + (config_.bind_addr.empty() ? "0.0.0.0" : config_.bind_addr) + ":" +
                     std::to_string(bound_port_));
}

Server& Server::set_initial_pool_size(size_t size) {
  if (pool_resizable()) {
    config_.initial_pool_size = size;
    pool_ = std::make_unique<ConnectionPool>(config_.initial_pool_size, config_.max_pool_size);
  }
  return *this;
}

Server& Server::set_max_pool_size(size_t size) {
  if (pool_resizable()) {
    config_.max_pool_size = size;
    pool_ = std::make_unique<ConnectionPool>(config_.initial_pool_size, config_.max_pool_size);
  }
  return *this;
}

bool Server::pool_resizable() {
  // Handlers hold references into the current pool
  if (is_running_.load() || pool_->occupied_count() != 0 || get_handler_count() != 0) {
    CHATRELAY_LOG_WARN("Pool size can only change before run(); setting ignored");
    return false;
  }
  return true;
}

size_t Server::get_handler_count() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  return workers_.size();
}

void Server::run() {
  is_running_.store(true);
  CHATRELAY_LOG_INFO("Server starting (pool " + std::to_string(pool_->size()) + " slots, buffer " +
                     std::to_string(config_.recv_buffer_size) + " bytes)");

  while (!stop_requested_.load()) {
    pollfd pfd{acceptor_.handle(), POLLIN, 0};
    int ret = ::poll(&pfd, 1, config_.poll_timeout_ms);

    if (ret < 0) {
      if (errno == EINTR)
        continue;
      CHATRELAY_LOG_ERROR("Poll error on listening socket: " + std::string(strerror(errno)));
      break;
    }

    reap_handlers(false);

    if (ret == 0)
      continue;

    if (pfd.revents & (POLLERR | POLLNVAL)) {
      CHATRELAY_LOG_ERROR("Listening socket failed");
      break;
    }

    if (pfd.revents & POLLIN) {
      auto accepted = accept_connection();
      if (!accepted.has_value()) {
        CHATRELAY_LOG_DEBUG(std::string("Accept skipped: ") + to_string(accepted.get_error()));
      }
    }
  }

  // Wake every handler out of its blocking read, then wait for all of them
  pool_->shutdown_all();
  reap_handlers(true);

  is_running_.store(false);
  stop_requested_.store(false);

  CHATRELAY_LOG_INFO("Server stopped");
}

expected<void, ErrorCode> Server::accept_connection() {
  size_t pool_size = pool_->size();
  auto slot_result = pool_->find_or_create_empty_slot();

  if (!slot_result.has_value()) {
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    // Accept and immediately close to drain the queue
    sockpp::tcp_socket rejected = acceptor_.accept();
    if (rejected.is_open() && !rejected.close()) {
      CHATRELAY_LOG_WARN("Failed to close rejected client: " + rejected.last_error_str());
    }
    return expected<void, ErrorCode>::error(slot_result.get_error());
  }

  ConnPtr slot = slot_result.value();
  if (pool_->size() > pool_size) {
    stats_.pool_grows.fetch_add(1, std::memory_order_relaxed);
    CHATRELAY_LOG_INFO("Connection pool grew to " + std::to_string(pool_->size()) + " slots");
  }

  sockpp::inet_address peer;
  sockpp::tcp_socket sock = acceptor_.accept(&peer);
  if (!sock) {
    // The slot never received a stream, so it stays empty for the next try
    stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
    CHATRELAY_LOG_ERROR("Accept error: " + acceptor_.last_error_str());
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  auto attached = slot->attach(std::move(sock), peer);
  if (!attached.has_value()) {
    stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
    CHATRELAY_LOG_ERROR("Client #" + std::to_string(slot->get_id()) + ": attach failed: " +
                        to_string(attached.get_error()));
    return attached;
  }

  auto write_timeout = slot->set_write_timeout(std::chrono::milliseconds(config_.write_timeout_ms));
  if (!write_timeout.has_value()) {
    CHATRELAY_LOG_WARN("Client #" + std::to_string(slot->get_id()) + ": cannot set write timeout");
  }

  if (config_.tcp_nodelay) {
    auto nodelay = slot->set_tcp_nodelay(true);
    if (!nodelay.has_value()) {
      CHATRELAY_LOG_WARN("Client #" + std::to_string(slot->get_id()) + ": cannot set TCP_NODELAY");
    }
  }

  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
  CHATRELAY_LOG_INFO("Client #" + std::to_string(slot->get_id()) + " connected from " + slot->peer_address_string());

  try {
    launch_handler(slot);
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("Client #" + std::to_string(slot->get_id()) + ": cannot start handler: " + e.what());
    auto released = slot->release();
    if (!released.has_value()) {
      CHATRELAY_LOG_WARN("Client #" + std::to_string(slot->get_id()) + ": stream did not close cleanly");
    }
    stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);
    return expected<void, ErrorCode>::error(ErrorCode::kInternalError);
  }

  return expected<void, ErrorCode>::success();
}

void Server::launch_handler(const ConnPtr& slot) {
  // Peers occupied right now; used for the whole session unless live
  // membership is enabled
  auto peers = pool_->snapshot_others(slot->get_id());
  auto handler = std::make_shared<ConnectionHandler>(slot, std::move(peers), *pool_, handler_options(), &stats_);

  std::lock_guard<std::mutex> lock(workers_mutex_);
  // Reserve first: once the thread exists, storing it must not throw
  workers_.reserve(workers_.size() + 1);
  std::thread thread([handler]() { handler->run(); });
  workers_.push_back(Worker{handler, std::move(thread)});
}

HandlerOptions Server::handler_options() const {
  HandlerOptions options;
  options.greeting = config_.greeting;
  options.farewell = config_.farewell;
  options.end_token = config_.end_token;
  options.recv_buffer_size = config_.recv_buffer_size;
  options.live_membership = config_.live_membership;
  options.read_timeout = std::chrono::milliseconds(config_.read_timeout_ms);
  return options;
}

void Server::reap_handlers(bool wait_all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      if (wait_all || it->handler->is_closed()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

}  // namespace chatrelay
