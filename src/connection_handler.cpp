#include "chatrelay/connection_handler.hpp"

#include "chatrelay/log.hpp"
#include "chatrelay/utils.hpp"

#include <exception>
#include <utility>

namespace chatrelay {

const char* to_string(SessionState state) noexcept {
  switch (state) {
    case SessionState::kGreeting:
      return "greeting";
    case SessionState::kRelaying:
      return "relaying";
    case SessionState::kClosing:
      return "closing";
    case SessionState::kClosed:
      return "closed";
  }
  return "unknown";
}

ConnectionHandler::ConnectionHandler(ConnPtr conn, std::vector<ConnPtr> peers, const ConnectionPool& pool,
                                     HandlerOptions options, RelayStats* stats)
    : conn_(std::move(conn)),
      snapshot_(std::move(peers)),
      pool_(pool),
      options_(std::move(options)),
      stats_(stats),
      recv_buffer_(options_.recv_buffer_size > 0 ? options_.recv_buffer_size : 1) {}

void ConnectionHandler::run() {
  // Whatever happens below, the thread ends with the session marked closed
  ScopeGuard mark_closed([this] { state_.store(SessionState::kClosed, std::memory_order_release); });

  try {
    while (get_state() != SessionState::kClosed) {
      step();
    }
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("Client #" + std::to_string(get_id()) + ": session aborted in " +
                        to_string(get_state()) + ": " + e.what());
    if (stats_) {
      stats_->handler_failures.fetch_add(1, std::memory_order_relaxed);
    }
    try {
      on_closing();
    } catch (const std::exception& inner) {
      CHATRELAY_LOG_ERROR("Client #" + std::to_string(get_id()) + ": slot release failed: " + inner.what());
    }
  }
}

void ConnectionHandler::step() {
  switch (get_state()) {
    case SessionState::kGreeting:
      transition_to_state(on_greeting());
      break;
    case SessionState::kRelaying:
      transition_to_state(on_relaying());
      break;
    case SessionState::kClosing:
      on_closing();
      break;
    case SessionState::kClosed:
      break;
  }
}

SessionState ConnectionHandler::on_greeting() {
  if (options_.read_timeout.count() > 0) {
    auto timeout_result = conn_->set_read_timeout(options_.read_timeout);
    if (!timeout_result.has_value()) {
      CHATRELAY_LOG_WARN("Client #" + std::to_string(get_id()) + ": cannot set read timeout");
    }
  }

  auto sent = conn_->greet(options_.greeting);
  if (!sent.has_value()) {
    CHATRELAY_LOG_WARN("Client #" + std::to_string(get_id()) + ": greeting failed: " + to_string(sent.get_error()));
    if (stats_) {
      stats_->send_errors.fetch_add(1, std::memory_order_relaxed);
    }
    return SessionState::kClosing;
  }
  return SessionState::kRelaying;
}

SessionState ConnectionHandler::on_relaying() {
  auto received = conn_->receive(recv_buffer_.data(), recv_buffer_.size());
  if (!received.has_value()) {
    switch (received.get_error()) {
      case ErrorCode::kConnectionClosed:
        CHATRELAY_LOG_INFO("Client #" + std::to_string(get_id()) + " disconnected");
        break;
      case ErrorCode::kTimeout:
        CHATRELAY_LOG_INFO("Client #" + std::to_string(get_id()) + " timed out");
        break;
      default:
        CHATRELAY_LOG_WARN("Client #" + std::to_string(get_id()) + ": receive failed: " +
                           to_string(received.get_error()));
        break;
    }
    return SessionState::kClosing;
  }

  size_t n = received.value();
  if (stats_) {
    stats_->messages_in.fetch_add(1, std::memory_order_relaxed);
    stats_->bytes_in.fetch_add(n, std::memory_order_relaxed);
  }

  std::string text = Utf8::decode_lossy(std::string_view(recv_buffer_.data(), n));
  CHATRELAY_LOG_DEBUG("Client #" + std::to_string(get_id()) + " received: " + text);

  // The token is checked before anything is relayed: it is never chat content
  if (starts_with(text, options_.end_token)) {
    CHATRELAY_LOG_INFO("Client #" + std::to_string(get_id()) + " sent end command");
    auto bye = conn_->send(options_.farewell);
    if (!bye.has_value()) {
      CHATRELAY_LOG_WARN("Client #" + std::to_string(get_id()) + ": farewell failed: " + to_string(bye.get_error()));
    }
    return SessionState::kClosing;
  }

  auto echoed = conn_->send(text);
  if (!echoed.has_value()) {
    CHATRELAY_LOG_WARN("Client #" + std::to_string(get_id()) + ": echo failed: " + to_string(echoed.get_error()));
    if (stats_) {
      stats_->send_errors.fetch_add(1, std::memory_order_relaxed);
    }
    return SessionState::kClosing;
  }
  CHATRELAY_LOG_DEBUG("#" + std::to_string(get_id()) + " -> #" + std::to_string(get_id()) + ": " + text);

  broadcast(text);
  return SessionState::kRelaying;
}

void ConnectionHandler::broadcast(std::string_view text) {
  const std::vector<ConnPtr> peers = options_.live_membership ? pool_.snapshot_others(get_id()) : snapshot_;

  for (const auto& peer : peers) {
    // forward() re-checks occupancy and greeting under the peer's own lock
    auto forwarded = peer->forward(text);
    if (forwarded.has_value()) {
      CHATRELAY_LOG_DEBUG("#" + std::to_string(get_id()) + " -> #" + std::to_string(peer->get_id()) + ": " +
                          std::string(text));
      if (stats_) {
        stats_->messages_relayed.fetch_add(1, std::memory_order_relaxed);
      }
    } else if (forwarded.get_error() != ErrorCode::kConnectionClosed &&
               forwarded.get_error() != ErrorCode::kInvalidState) {
      CHATRELAY_LOG_WARN("#" + std::to_string(get_id()) + " -> #" + std::to_string(peer->get_id()) +
                         " failed: " + to_string(forwarded.get_error()));
      if (stats_) {
        stats_->send_errors.fetch_add(1, std::memory_order_relaxed);
      }
    }
  }
}

void ConnectionHandler::on_closing() {
  auto released = conn_->release();
  if (released.has_value() || released.get_error() != ErrorCode::kInvalidState) {
    if (!released.has_value()) {
      CHATRELAY_LOG_WARN("Client #" + std::to_string(get_id()) + ": stream did not close cleanly");
    }
    if (stats_) {
      stats_->active_connections.fetch_sub(1, std::memory_order_relaxed);
    }
  }
  transition_to_state(SessionState::kClosed);
}

void ConnectionHandler::transition_to_state(SessionState state) {
  SessionState previous = state_.exchange(state, std::memory_order_acq_rel);
  if (previous != state) {
    CHATRELAY_LOG_DEBUG("Client #" + std::to_string(get_id()) + ": " + to_string(previous) + " -> " +
                        to_string(state));
  }
}

}  // namespace chatrelay
