#include "chatrelay/connection_pool.hpp"

#include "chatrelay/log.hpp"

#include <algorithm>

namespace chatrelay {

ConnectionPool::ConnectionPool(size_t initial_size, size_t max_size) : max_size_(max_size) {
  if (max_size_ != 0 && initial_size > max_size_) {
    initial_size = max_size_;
  }
  slots_.reserve(initial_size);
  for (size_t i = 0; i < initial_size; ++i) {
    slots_.push_back(std::make_shared<Connection>(static_cast<uint32_t>(i)));
  }
}

expected<ConnectionPool::ConnPtr, ErrorCode> ConnectionPool::find_or_create_empty_slot() {
  for (const auto& slot : slots()) {
    if (!slot->is_occupied()) {
      return expected<ConnPtr, ErrorCode>::success(slot);
    }
  }

  std::lock_guard<std::mutex> lock(pool_mutex_);
  if (max_size_ != 0 && slots_.size() >= max_size_) {
    CHATRELAY_LOG_WARN("Connection pool exhausted (" + std::to_string(max_size_) + " slots)");
    return expected<ConnPtr, ErrorCode>::error(ErrorCode::kPoolExhausted);
  }

  uint32_t next_id = 0;
  for (const auto& slot : slots_) {
    next_id = std::max(next_id, slot->get_id() + 1);
  }
  auto slot = std::make_shared<Connection>(next_id);
  slots_.push_back(slot);
  CHATRELAY_LOG_DEBUG("Connection pool grew to " + std::to_string(slots_.size()) + " slots");
  return expected<ConnPtr, ErrorCode>::success(std::move(slot));
}

std::vector<ConnectionPool::ConnPtr> ConnectionPool::snapshot_others(uint32_t exclude_id) const {
  std::vector<ConnPtr> others;
  for (auto& slot : slots()) {
    if (slot->get_id() != exclude_id && slot->is_occupied()) {
      others.push_back(std::move(slot));
    }
  }
  return others;
}

std::vector<ConnectionPool::ConnPtr> ConnectionPool::slots() const {
  std::lock_guard<std::mutex> lock(pool_mutex_);
  return slots_;
}

size_t ConnectionPool::size() const {
  std::lock_guard<std::mutex> lock(pool_mutex_);
  return slots_.size();
}

size_t ConnectionPool::occupied_count() const {
  auto all = slots();
  return static_cast<size_t>(
      std::count_if(all.begin(), all.end(), [](const ConnPtr& slot) { return slot->is_occupied(); }));
}

void ConnectionPool::shutdown_all() {
  for (const auto& slot : slots()) {
    slot->shutdown();
  }
}

}  // namespace chatrelay
