#pragma once

// lexledger/channel.hpp - Bounded multi-producer / single-consumer channel.
//
// Background sync tasks push inbound batches here; the single ingest task
// drains them into the RecordPool. Background tasks never touch ledger state
// directly.
//
// INVARIANTS:
//   - size() <= capacity at all times (capacity 0 = unbounded).
//   - Block: push() waits for room or close(). DropOldest: push() evicts the
//     front item and never waits.
//   - After close(), push() fails and pop() drains what remains, then
//     returns nullopt.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace lexledger {

enum class ChannelPolicy { Block, DropOldest };

template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t capacity, ChannelPolicy policy = ChannelPolicy::Block)
      : capacity_(capacity), policy_(policy) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    if (closed_) return false;
    if (capacity_ > 0 && queue_.size() >= capacity_) {
      if (policy_ == ChannelPolicy::Block) {
        cv_capacity_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
      } else {
        queue_.pop_front();
        ++dropped_;
      }
    }
    queue_.push_back(std::move(item));
    cv_items_.notify_one();
    return true;
  }

  // Non-blocking.
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mu_);
    return pop_locked();
  }

  // Waits up to `timeout` for an item.
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_items_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return pop_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_items_.notify_all();
    cv_capacity_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  size_t dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

 private:
  std::optional<T> pop_locked() {
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    if (capacity_ > 0) cv_capacity_.notify_one();
    return item;
  }

  const size_t capacity_;
  const ChannelPolicy policy_;
  mutable std::mutex mu_;
  std::condition_variable cv_items_;
  std::condition_variable cv_capacity_;
  std::deque<T> queue_;
  size_t dropped_{0};
  bool closed_{false};
};

}  // namespace lexledger
