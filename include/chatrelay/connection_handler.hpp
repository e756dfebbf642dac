#ifndef CHATRELAY_CONNECTION_HANDLER_HPP_
#define CHATRELAY_CONNECTION_HANDLER_HPP_

#include "connection.hpp"
#include "connection_pool.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace chatrelay {

// ============================================================================
// Session states
// ============================================================================

enum class SessionState {
  kGreeting,  // sending the welcome payload
  kRelaying,  // reading and relaying messages
  kClosing,   // closing the stream, releasing the slot
  kClosed     // terminal
};

const char* to_string(SessionState state) noexcept;

struct HandlerOptions {
  std::string greeting = "Hello";
  std::string farewell = "Bye!";
  std::string end_token = ":end";
  size_t recv_buffer_size = 2048;

  // Re-query the pool for peers at every broadcast instead of using the
  // snapshot taken at accept time.
  bool live_membership = true;

  // 0 = block on reads indefinitely
  std::chrono::milliseconds read_timeout{0};
};

// ============================================================================
// ConnectionHandler (one per accepted connection, runs on its own thread)
// ============================================================================

class ConnectionHandler {
 public:
  using ConnPtr = Connection::ConnPtr;

  // peers is the snapshot of other occupied slots taken when the connection
  // was accepted. pool is consulted instead when live_membership is set.
  // stats may be null.
  ConnectionHandler(ConnPtr conn, std::vector<ConnPtr> peers, const ConnectionPool& pool,
                    HandlerOptions options, RelayStats* stats = nullptr);

  ConnectionHandler(const ConnectionHandler&) = delete;
  ConnectionHandler& operator=(const ConnectionHandler&) = delete;

  // Drive the session from kGreeting to kClosed. Never throws; a failure
  // inside the session is logged and the slot is still released.
  void run();

  SessionState get_state() const { return state_.load(std::memory_order_acquire); }

  bool is_closed() const { return get_state() == SessionState::kClosed; }

  uint32_t get_id() const { return conn_->get_id(); }

 private:
  ConnPtr conn_;
  std::vector<ConnPtr> snapshot_;
  const ConnectionPool& pool_;
  HandlerOptions options_;
  RelayStats* stats_;

  std::atomic<SessionState> state_{SessionState::kGreeting};
  std::vector<char> recv_buffer_;

  // One step of the state machine.
  void step();

  SessionState on_greeting();
  SessionState on_relaying();
  void on_closing();

  // Forward text to every currently occupied peer.
  void broadcast(std::string_view text);

  void transition_to_state(SessionState state);
};

}  // namespace chatrelay

#endif  // CHATRELAY_CONNECTION_HANDLER_HPP_
