#ifndef CHATRELAY_CONNECTION_HPP_
#define CHATRELAY_CONNECTION_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <memory>
#include <mutex>
#include <sockpp/inet_address.h>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>

namespace chatrelay {

// ============================================================================
// Connection (one pool slot: stable id + optional accepted stream)
// ============================================================================

/**
 * @brief A reusable client slot.
 *
 * The id is fixed at construction and never changes. The slot is occupied
 * while it holds an open stream and empty otherwise; there is no separate
 * flag. The stream and peer address are guarded by the slot mutex.
 *
 * The owning handler reads through a private duplicate of the stream, so a
 * blocked receive() never holds the slot mutex and other handlers can still
 * send() to this client.
 *
 * Peers only reach the client through forward(), which refuses until the
 * greeting has gone out, so the greeting is always the first payload.
 */
class Connection {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Applied to every attached stream; a send that cannot make progress for
  // this long fails and shuts the stream down.
  static constexpr std::chrono::milliseconds kDefaultWriteTimeout{5000};

  explicit Connection(uint32_t id);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  uint32_t get_id() const { return id_; }

  bool is_occupied() const;

  // Occupied and the greeting has been written.
  bool is_greeted() const;

  sockpp::inet_address peer_address() const;

  // Dotted-quad form of the peer address, empty when the slot is empty.
  std::string peer_address_string() const;

  // --- Accept loop API ---

  // Take ownership of an accepted stream.
  // Returns error(kInvalidState) if the slot is already occupied,
  // error(kSocketError) if the reader handle cannot be duplicated.
  expected<void, ErrorCode> attach(sockpp::tcp_socket&& sock, const sockpp::inet_address& peer);

  // --- Owning handler API ---

  // Read the next chunk into buf. Only the handler that owns the slot may
  // call this. Returns the byte count, error(kConnectionClosed) on EOF,
  // error(kTimeout) when a read timeout expires, error(kSocketError) otherwise.
  expected<size_t, ErrorCode> receive(char* buf, size_t len);

  // Close the stream and mark the slot empty. The slot is empty afterwards
  // even when closing reports an error.
  expected<void, ErrorCode> release();

  expected<void, ErrorCode> set_read_timeout(std::chrono::milliseconds timeout);

  // 0 = block until the peer drains its buffer.
  expected<void, ErrorCode> set_write_timeout(std::chrono::milliseconds timeout);

  expected<void, ErrorCode> set_tcp_nodelay(bool enable);

  // --- Any thread ---

  // Write the whole payload while holding the slot lock.
  // Returns error(kConnectionClosed) when the slot is empty, error(kSendFailed)
  // on a write error or when the write timeout expires. A timed out stream is
  // shut down, since part of the payload may already be on the wire.
  expected<void, ErrorCode> send(std::string_view payload);

  // Send the greeting and open the slot to forward().
  expected<void, ErrorCode> greet(std::string_view greeting);

  // send() on behalf of another client. Returns error(kInvalidState) while
  // the greeting is still pending.
  expected<void, ErrorCode> forward(std::string_view payload);

  // Shut the stream down in both directions without releasing the slot.
  // Wakes the owning handler out of a blocked receive().
  void shutdown();

 private:
  const uint32_t id_;

  mutable std::mutex mutex_;
  sockpp::tcp_socket socket_;
  sockpp::inet_address peer_;
  bool greeted_ = false;

  // Read side, touched only by the owning handler (and by attach/release
  // under mutex_ before/after the handler runs).
  sockpp::tcp_socket reader_;

  // Caller holds mutex_ and the slot is occupied.
  expected<void, ErrorCode> write_locked(std::string_view payload);
};

}  // namespace chatrelay

#endif  // CHATRELAY_CONNECTION_HPP_
