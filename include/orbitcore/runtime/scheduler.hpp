#pragma once

#include "orbitcore/common/result.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace orbitcore::runtime {

/// Fixed worker pool that runs actor slices. Tasks are short and cooperative:
/// each one processes a bounded number of inbox messages and returns.
class ActorScheduler {
public:
  using Task = std::function<void()>;

  explicit ActorScheduler(std::size_t workers = 4);
  ~ActorScheduler();

  ActorScheduler(const ActorScheduler &) = delete;
  ActorScheduler &operator=(const ActorScheduler &) = delete;

  [[nodiscard]] common::Status start();

  /// Runs the tasks already queued, then joins the workers.
  void stop();

  /// Returns false when the scheduler is not running.
  bool submit(Task task);

  [[nodiscard]] bool running() const { return running_.load(); }
  [[nodiscard]] std::size_t worker_count() const { return worker_count_; }
  [[nodiscard]] std::size_t queued() const;

private:
  void worker_loop();

  std::size_t worker_count_;
  std::atomic<bool> running_{false};
  bool stopping_ = false;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::vector<std::thread> workers_;
};

} // namespace orbitcore::runtime
