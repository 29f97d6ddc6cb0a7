#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace orbitcore::session {

enum class PushResult { Accepted, Full, Closed };

/// Bounded multi-producer, single-consumer queue. Producers never wait.
template <typename T> class Mailbox {
public:
  explicit Mailbox(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  PushResult try_push(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return PushResult::Closed;
    }
    if (items_.size() >= capacity_) {
      return PushResult::Full;
    }
    items_.push_back(std::move(item));
    return PushResult::Accepted;
  }

  /// Control messages bypass the capacity bound so shutdown is never refused.
  PushResult push_control(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return PushResult::Closed;
    }
    items_.push_back(std::move(item));
    return PushResult::Accepted;
  }

  [[nodiscard]] std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  /// Rejects further pushes; returns how many queued items were discarded.
  std::size_t close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    const std::size_t discarded = items_.size();
    items_.clear();
    return discarded;
  }

  [[nodiscard]] bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<T> items_;
  bool closed_ = false;
};

} // namespace orbitcore::session
