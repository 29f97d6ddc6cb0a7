#include "tests/helpers/test_helpers.hpp"

#include "orbitcore/common/time.hpp"
#include "orbitcore/observability/global.hpp"

#include <atomic>
#include <memory>
#include <random>
#include <thread>

namespace orbitcore::testing {

config::Config test_config() {
  config::Config config;
  config.registry.shards = 4;
  config.registry.inbox_capacity = 64;
  config.registry.subscriber_queue_capacity = 64;
  config.registry.event_log_capacity = 100;
  config.registry.ended_grace_seconds = 60;
  config.registry.subscribe_timeout_ms = 2'000;
  config.registry.reap_interval_ms = 60'000;
  config.scheduler.workers = 2;
  config.scheduler.max_messages_per_slice = 8;
  config.persistence.batch_size = 10;
  config.persistence.flush_interval_ms = 20;
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("orbitcore-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

common::Status RecordingPersistSink::submit(const std::string &session_id,
                                            const std::uint64_t revision,
                                            const session::PersistOp &op) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failures_left_ > 0) {
    --failures_left_;
    return common::Status::error("persistence queue is full");
  }
  commands_.push_back(RecordedPersist{.session_id = session_id, .revision = revision, .op = op});
  return common::Status::success();
}

void RecordingPersistSink::fail_next(const std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_left_ = count;
}

std::vector<RecordedPersist> RecordingPersistSink::commands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return commands_;
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

ObserverGuard::ObserverGuard() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverGuard::~ObserverGuard() { observability::set_global_observer(nullptr); }

std::string fixed_time(const std::uint64_t seconds_after_base) {
  const auto base = common::parse_rfc3339("2026-01-01T00:00:00.000Z");
  return common::to_rfc3339(base.value_or(std::chrono::system_clock::time_point{}) +
                            std::chrono::seconds(seconds_after_base));
}

session::Clock stepping_clock() {
  auto counter = std::make_shared<std::atomic<std::uint64_t>>(0);
  return [counter] { return fixed_time(counter->fetch_add(1)); };
}

session::SessionState make_state(const std::string &id) {
  session::SessionState state;
  state.id = id;
  state.provider = "codex";
  state.project_path = "/work/project";
  state.project_name = "project";
  state.started_at = fixed_time(0);
  state.last_activity_at = state.started_at;
  return state;
}

session::Message make_message(const std::string &id, const session::MessageType type,
                              const std::string &content) {
  session::Message message;
  message.id = id;
  message.type = type;
  message.content = content;
  return message;
}

bool wait_until(const std::function<bool()> &predicate, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

} // namespace orbitcore::testing
