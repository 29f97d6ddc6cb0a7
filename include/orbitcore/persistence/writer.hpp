#pragma once

#include "orbitcore/common/result.hpp"
#include "orbitcore/persistence/store.hpp"
#include "orbitcore/session/effect_executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace orbitcore::persistence {

struct WriterOptions {
  std::size_t queue_capacity = 1'000;
  std::size_t batch_size = 50;
  std::chrono::milliseconds flush_interval{100};
};

/// Batches persist commands from every actor into store transactions on a
/// background thread. Enqueueing never waits: a full queue is reported back
/// to the actor as an effect failure.
class PersistenceWriter final : public session::IPersistSink {
public:
  PersistenceWriter(SqliteSessionStore &store, WriterOptions options = {});
  ~PersistenceWriter() override;

  PersistenceWriter(const PersistenceWriter &) = delete;
  PersistenceWriter &operator=(const PersistenceWriter &) = delete;

  [[nodiscard]] common::Status start();

  /// Writes everything still queued, then joins the writer thread. Commands
  /// submitted afterwards are refused.
  void stop();

  [[nodiscard]] common::Status submit(const std::string &session_id, std::uint64_t revision,
                                      const session::PersistOp &op) override;
  [[nodiscard]] common::Status try_enqueue(PersistCommand command);

  /// Synchronously writes everything queued so far. Returns the first batch
  /// failure, if any.
  [[nodiscard]] common::Status flush();

  [[nodiscard]] bool running() const { return running_.load(); }
  [[nodiscard]] std::size_t queued() const;
  [[nodiscard]] std::uint64_t written() const { return written_.load(); }
  [[nodiscard]] std::uint64_t failed_batches() const { return failed_batches_.load(); }

private:
  void writer_loop();
  [[nodiscard]] common::Status drain();

  SqliteSessionStore &store_;
  WriterOptions options_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> failed_batches_{0};

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<PersistCommand> queue_;

  std::mutex write_mutex_;
  std::thread thread_;
};

} // namespace orbitcore::persistence
