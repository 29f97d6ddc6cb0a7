#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace orbitcore::session {

namespace detail {

template <typename T> struct SubscriberQueue {
  explicit SubscriberQueue(const std::size_t cap) : capacity(cap) {}

  std::mutex mutex;
  std::condition_variable ready;
  std::deque<T> items;
  std::size_t capacity;
  bool closed = false;
  bool lagged = false;
};

} // namespace detail

template <typename T> class BroadcastChannel;

/// Receiving end of a BroadcastChannel. Closing (or destroying) it detaches the
/// subscriber; the channel prunes it on the next publish.
template <typename T> class Subscription {
public:
  Subscription() = default;
  ~Subscription() { close(); }

  Subscription(Subscription &&other) noexcept = default;
  Subscription &operator=(Subscription &&other) noexcept {
    if (this != &other) {
      close();
      queue_ = std::move(other.queue_);
    }
    return *this;
  }
  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  [[nodiscard]] std::optional<T> try_recv() {
    if (queue_ == nullptr) {
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return pop_locked();
  }

  /// Waits up to `timeout` for an item. Returns nullopt on timeout or once the
  /// subscription is closed and drained.
  [[nodiscard]] std::optional<T> recv_for(const std::chrono::milliseconds timeout) {
    if (queue_ == nullptr) {
      return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->ready.wait_for(lock, timeout,
                           [this] { return !queue_->items.empty() || queue_->closed; });
    return pop_locked();
  }

  /// True once the channel dropped this subscriber for falling behind.
  [[nodiscard]] bool lagged() const {
    if (queue_ == nullptr) {
      return false;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->lagged;
  }

  [[nodiscard]] bool closed() const {
    if (queue_ == nullptr) {
      return true;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->closed;
  }

  [[nodiscard]] std::size_t pending() const {
    if (queue_ == nullptr) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->items.size();
  }

  void close() {
    if (queue_ == nullptr) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(queue_->mutex);
      queue_->closed = true;
    }
    queue_->ready.notify_all();
  }

  [[nodiscard]] bool valid() const { return queue_ != nullptr; }

private:
  friend class BroadcastChannel<T>;

  explicit Subscription(std::shared_ptr<detail::SubscriberQueue<T>> queue)
      : queue_(std::move(queue)) {}

  std::optional<T> pop_locked() {
    if (queue_->items.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_->items.front());
    queue_->items.pop_front();
    return item;
  }

  std::shared_ptr<detail::SubscriberQueue<T>> queue_;
};

struct PublishResult {
  std::size_t delivered = 0;
  std::size_t dropped = 0;
};

/// Fan-out to any number of subscribers, each with its own bounded queue.
/// Publishing never waits for a consumer: a subscriber whose queue is full is
/// marked lagged, closed and removed.
template <typename T> class BroadcastChannel {
public:
  explicit BroadcastChannel(const std::size_t queue_capacity = 256)
      : queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity) {}

  ~BroadcastChannel() { close_all(); }

  BroadcastChannel(const BroadcastChannel &) = delete;
  BroadcastChannel &operator=(const BroadcastChannel &) = delete;

  [[nodiscard]] Subscription<T> subscribe() {
    auto queue = std::make_shared<detail::SubscriberQueue<T>>(queue_capacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(queue);
    return Subscription<T>(std::move(queue));
  }

  PublishResult publish(const T &value) {
    PublishResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
      auto &queue = **it;
      bool keep = true;
      {
        std::lock_guard<std::mutex> queue_lock(queue.mutex);
        if (queue.closed) {
          keep = false;
        } else if (queue.items.size() >= queue.capacity) {
          queue.lagged = true;
          queue.closed = true;
          keep = false;
          ++result.dropped;
        } else {
          queue.items.push_back(value);
          ++result.delivered;
        }
      }
      queue.ready.notify_one();
      it = keep ? std::next(it) : subscribers_.erase(it);
    }
    return result;
  }

  [[nodiscard]] std::size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

  void close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &queue : subscribers_) {
      {
        std::lock_guard<std::mutex> queue_lock(queue->mutex);
        queue->closed = true;
      }
      queue->ready.notify_all();
    }
    subscribers_.clear();
  }

private:
  std::size_t queue_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<detail::SubscriberQueue<T>>> subscribers_;
};

} // namespace orbitcore::session
