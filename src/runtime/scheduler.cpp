#include "orbitcore/runtime/scheduler.hpp"

#include "orbitcore/observability/global.hpp"

#include <exception>

namespace orbitcore::runtime {

ActorScheduler::ActorScheduler(const std::size_t workers)
    : worker_count_(workers == 0 ? 1 : workers) {}

ActorScheduler::~ActorScheduler() { stop(); }

common::Status ActorScheduler::start() {
  if (running_.exchange(true)) {
    return common::Status::success();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  try {
    for (std::size_t i = 0; i < worker_count_; ++i) {
      workers_.emplace_back([this] { worker_loop(); });
    }
  } catch (const std::exception &ex) {
    stop();
    return common::Status::error(std::string("failed to start scheduler workers: ") + ex.what());
  }
  return common::Status::success();
}

void ActorScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  running_ = false;
}

bool ActorScheduler::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !running_.load()) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::size_t ActorScheduler::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void ActorScheduler::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    try {
      task();
    } catch (const std::exception &ex) {
      observability::record_error("scheduler", std::string("task failed: ") + ex.what());
    }
  }
}

} // namespace orbitcore::runtime
