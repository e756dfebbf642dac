#ifndef CHATRELAY_CONNECTION_POOL_HPP_
#define CHATRELAY_CONNECTION_POOL_HPP_

#include "connection.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace chatrelay {

// ============================================================================
// ConnectionPool - growable set of shared, individually locked slots
// ============================================================================

/**
 * @brief Owns every Connection slot for the lifetime of the server.
 *
 * Slots are heap-allocated and shared, so growth never moves a slot that a
 * handler already references. The pool never shrinks; a released slot stays
 * in place and becomes available again.
 *
 * pool_mutex_ guards only the slot list itself. Occupancy is read through
 * each slot's own lock, never while holding pool_mutex_.
 */
class ConnectionPool {
 public:
  using ConnPtr = Connection::ConnPtr;

  // max_size == 0 means unbounded growth.
  explicit ConnectionPool(size_t initial_size, size_t max_size = 0);

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // First empty slot in creation order, or a newly appended one with
  // id = max id + 1. Returns error(kPoolExhausted) when the pool is bounded
  // and every slot is occupied.
  expected<ConnPtr, ErrorCode> find_or_create_empty_slot();

  // Every occupied slot except exclude_id, in creation order, evaluated now.
  std::vector<ConnPtr> snapshot_others(uint32_t exclude_id) const;

  // Copy of the whole slot list in creation order.
  std::vector<ConnPtr> slots() const;

  size_t size() const;
  size_t occupied_count() const;
  size_t max_size() const { return max_size_; }

  // Shut every occupied stream down (cooperative stop).
  void shutdown_all();

 private:
  const size_t max_size_;

  mutable std::mutex pool_mutex_;
  std::vector<ConnPtr> slots_;
};

// ============================================================================
// RelayStats - Atomic relay counters
// ============================================================================

struct alignas(kCacheLine) RelayStats {
  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> accept_errors{0};

  // Traffic counters
  std::atomic<uint64_t> messages_in{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> messages_relayed{0};
  std::atomic<uint64_t> send_errors{0};

  // Pool / handler
  std::atomic<uint64_t> pool_grows{0};
  std::atomic<uint64_t> handler_failures{0};

  void reset() {
    total_connections = 0;
    active_connections = 0;
    rejected_connections = 0;
    accept_errors = 0;
    messages_in = 0;
    bytes_in = 0;
    messages_relayed = 0;
    send_errors = 0;
    pool_grows = 0;
    handler_failures = 0;
  }
};

}  // namespace chatrelay

#endif  // CHATRELAY_CONNECTION_POOL_HPP_
