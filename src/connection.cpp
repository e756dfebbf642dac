#include "chatrelay/connection.hpp"

#include "chatrelay/log.hpp"
#include "chatrelay/utils.hpp"

#include <cerrno>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace chatrelay {

Connection::Connection(uint32_t id) : id_(id) {}

Connection::~Connection() {
  if (reader_.is_open()) {
    reader_.close();
  }
  if (socket_.is_open()) {
    socket_.close();
  }
}

bool Connection::is_occupied() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return socket_.is_open();
}

bool Connection::is_greeted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return socket_.is_open() && greeted_;
}

sockpp::inet_address Connection::peer_address() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_;
}

std::string Connection::peer_address_string() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_.is_open())
    return {};
  return format_ipv4(peer_.address());
}

expected<void, ErrorCode> Connection::attach(sockpp::tcp_socket&& sock, const sockpp::inet_address& peer) {
  // Ignores SIGPIPE, so a write to a vanished client fails with EPIPE instead
  sockpp::initialize();

  std::lock_guard<std::mutex> lock(mutex_);
  if (socket_.is_open()) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  sockpp::tcp_socket reader = sock.clone();
  if (!reader.is_open()) {
    CHATRELAY_LOG_ERROR("Client #" + std::to_string(id_) + ": cannot duplicate stream: " + sock.last_error_str());
    sock.close();
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  if (!sock.write_timeout(kDefaultWriteTimeout)) {
    CHATRELAY_LOG_WARN("Client #" + std::to_string(id_) + ": cannot set write timeout: " + sock.last_error_str());
  }

  socket_ = std::move(sock);
  reader_ = std::move(reader);
  peer_ = peer;
  greeted_ = false;
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> Connection::receive(char* buf, size_t len) {
  if (!reader_.is_open()) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  ssize_t n = reader_.read(buf, len);
  if (n > 0) {
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }
  if (n == 0) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  int err = reader_.last_error();
  if (err == EAGAIN || err == EWOULDBLOCK) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
  }
  CHATRELAY_LOG_WARN("Client #" + std::to_string(id_) + ": read error: " + reader_.last_error_str());
  return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
}

expected<void, ErrorCode> Connection::send(std::string_view payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_.is_open()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return write_locked(payload);
}

expected<void, ErrorCode> Connection::greet(std::string_view greeting) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_.is_open()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  auto written = write_locked(greeting);
  if (written.has_value()) {
    greeted_ = true;
  }
  return written;
}

expected<void, ErrorCode> Connection::forward(std::string_view payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_.is_open()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  if (!greeted_) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  return write_locked(payload);
}

expected<void, ErrorCode> Connection::write_locked(std::string_view payload) {
  const char* p = payload.data();
  size_t remaining = payload.size();
  while (remaining > 0) {
    ssize_t n = socket_.write(p, remaining);
    if (n < 0) {
      int err = socket_.last_error();
      if (err == EINTR)
        continue;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        CHATRELAY_LOG_WARN("Client #" + std::to_string(id_) + ": write timed out, dropping client");
        if (!socket_.shutdown(SHUT_RDWR)) {
          CHATRELAY_LOG_DEBUG("Client #" + std::to_string(id_) + ": shutdown failed: " + socket_.last_error_str());
        }
      } else {
        CHATRELAY_LOG_WARN("Client #" + std::to_string(id_) + ": send error: " + socket_.last_error_str());
      }
      return expected<void, ErrorCode>::error(ErrorCode::kSendFailed);
    }
    p += n;
    remaining -= static_cast<size_t>(n);
  }
  return expected<void, ErrorCode>::success();
}

void Connection::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (socket_.is_open() && !socket_.shutdown(SHUT_RDWR)) {
    CHATRELAY_LOG_DEBUG("Client #" + std::to_string(id_) + ": shutdown failed: " + socket_.last_error_str());
  }
}

expected<void, ErrorCode> Connection::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_.is_open() && !reader_.is_open()) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  bool clean = true;
  if (socket_.is_open()) {
    // Shutdown first: the peer must see EOF even though reader_ shares the socket
    if (!socket_.shutdown(SHUT_RDWR)) {
      CHATRELAY_LOG_DEBUG("Client #" + std::to_string(id_) + ": shutdown failed: " + socket_.last_error_str());
    }
    if (!socket_.close()) {
      CHATRELAY_LOG_WARN("Client #" + std::to_string(id_) + ": close failed: " + socket_.last_error_str());
      clean = false;
    }
  }
  if (reader_.is_open() && !reader_.close()) {
    CHATRELAY_LOG_WARN("Client #" + std::to_string(id_) + ": close failed: " + reader_.last_error_str());
    clean = false;
  }
  peer_ = sockpp::inet_address();
  greeted_ = false;

  if (!clean) {
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::set_read_timeout(std::chrono::milliseconds timeout) {
  if (!reader_.read_timeout(timeout)) {
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::set_write_timeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_.is_open() || !socket_.write_timeout(timeout)) {
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::set_tcp_nodelay(bool enable) {
  std::lock_guard<std::mutex> lock(mutex_);
  int opt = enable ? 1 : 0;
  if (!socket_.set_option(IPPROTO_TCP, TCP_NODELAY, opt)) {
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

}  // namespace chatrelay
