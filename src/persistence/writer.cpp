#include "orbitcore/persistence/writer.hpp"

#include "orbitcore/observability/global.hpp"

#include <iostream>

namespace orbitcore::persistence {

PersistenceWriter::PersistenceWriter(SqliteSessionStore &store, WriterOptions options)
    : store_(store), options_(options) {
  if (options_.queue_capacity == 0) {
    options_.queue_capacity = 1;
  }
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

PersistenceWriter::~PersistenceWriter() { stop(); }

common::Status PersistenceWriter::start() {
  if (stopped_.load()) {
    return common::Status::error("persistence writer was stopped");
  }
  if (running_.exchange(true)) {
    return common::Status::success();
  }
  thread_ = std::thread([this] { writer_loop(); });
  return common::Status::success();
}

void PersistenceWriter::stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  running_.store(false);
  queue_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  const auto status = drain();
  if (!status.ok()) {
    std::cerr << "[persistence] final flush failed: " << status.error() << "\n";
  }
}

common::Status PersistenceWriter::submit(const std::string &session_id,
                                         const std::uint64_t revision,
                                         const session::PersistOp &op) {
  return try_enqueue(PersistCommand{.session_id = session_id, .revision = revision, .op = op});
}

common::Status PersistenceWriter::try_enqueue(PersistCommand command) {
  if (stopped_.load()) {
    return common::Status::error("persistence writer is stopped");
  }
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.size() >= options_.queue_capacity) {
      return common::Status::error("persistence queue is full");
    }
    queue_.push_back(std::move(command));
    depth = queue_.size();
  }
  if (depth >= options_.batch_size) {
    queue_cv_.notify_one();
  }
  observability::record_metric(observability::PersistQueueDepthMetric{.depth = depth});
  return common::Status::success();
}

common::Status PersistenceWriter::flush() { return drain(); }

std::size_t PersistenceWriter::queued() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

void PersistenceWriter::writer_loop() {
  while (running_.load()) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, options_.flush_interval, [this] {
        return !running_.load() || queue_.size() >= options_.batch_size;
      });
    }
    const auto status = drain();
    if (!status.ok()) {
      std::cerr << "[persistence] " << status.error() << "\n";
    }
  }
}

common::Status PersistenceWriter::drain() {
  // Holding write_mutex_ while taking batches keeps commands in queue order
  // when flush() races with the writer thread.
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  common::Status first_failure = common::Status::success();
  while (true) {
    std::vector<PersistCommand> batch;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      while (!queue_.empty() && batch.size() < options_.batch_size) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
    }
    if (batch.empty()) {
      break;
    }

    const auto started = std::chrono::steady_clock::now();
    const auto status = store_.apply_batch(batch);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observability::record_persistence_flush(batch.size(), elapsed, status.ok());
    if (status.ok()) {
      written_ += batch.size();
      continue;
    }
    ++failed_batches_;
    observability::record_error("persistence", "dropped batch of " +
                                                   std::to_string(batch.size()) +
                                                   " commands: " + status.error());
    if (first_failure.ok()) {
      first_failure = status;
    }
  }
  return first_failure;
}

} // namespace orbitcore::persistence
