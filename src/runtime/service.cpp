#include "orbitcore/runtime/service.hpp"

#include "orbitcore/common/ids.hpp"
#include "orbitcore/common/time.hpp"
#include "orbitcore/observability/global.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <vector>

namespace orbitcore::runtime {

namespace {

constexpr std::chrono::seconds ACTOR_SHUTDOWN_TIMEOUT{2};

session::RegistryOptions registry_options(const config::Config &config) {
  return session::RegistryOptions{
      .shards = config.registry.shards,
      .list_queue_capacity = config.registry.subscriber_queue_capacity,
      .subscribe_timeout = std::chrono::milliseconds(config.registry.subscribe_timeout_ms)};
}

} // namespace

SessionService::SessionService(config::Config config,
                               std::unique_ptr<persistence::SqliteSessionStore> store,
                               IRuntimeConnector &connector, session::Clock clock)
    : config_(std::move(config)), store_(std::move(store)), connector_(connector),
      clock_(std::move(clock)), scheduler_(config_.scheduler.workers),
      registry_(registry_options(config_)) {
  if (store_ != nullptr) {
    writer_ = std::make_unique<persistence::PersistenceWriter>(
        *store_, persistence::WriterOptions{
                     .queue_capacity = config_.persistence.queue_capacity,
                     .batch_size = config_.persistence.batch_size,
                     .flush_interval =
                         std::chrono::milliseconds(config_.persistence.flush_interval_ms)});
  }
}

SessionService::~SessionService() { stop(); }

std::string SessionService::now() const { return clock_ ? clock_() : common::now_rfc3339(); }

common::Status SessionService::start() {
  if (running_.load()) {
    return common::Status::success();
  }
  auto status = scheduler_.start();
  if (!status.ok()) {
    return status;
  }
  if (writer_ != nullptr) {
    status = writer_->start();
    if (!status.ok()) {
      scheduler_.stop();
      return status;
    }
  }

  if (store_ != nullptr) {
    auto restored = store_->load_active_sessions();
    if (!restored.ok()) {
      stop();
      return common::Status::error("failed to restore sessions: " + restored.error());
    }
    auto states = restored.take();
    for (auto &state : states) {
      const std::string id = state.id;
      auto spawned = spawn(std::move(state), true);
      if (!spawned.ok()) {
        observability::record_error("service", "failed to restore " + id + ": " +
                                                   spawned.error());
      }
    }
    if (!states.empty()) {
      std::cerr << "[service] restored " << registry_.size() << " sessions\n";
    }
  }

  running_.store(true);
  housekeeping_thread_ = std::thread([this] { housekeeping_loop(); });
  return common::Status::success();
}

void SessionService::stop() {
  bool was_running = false;
  {
    std::lock_guard<std::mutex> lock(housekeeping_mutex_);
    was_running = running_.exchange(false);
  }
  housekeeping_cv_.notify_all();
  if (housekeeping_thread_.joinable()) {
    housekeeping_thread_.join();
  }

  std::vector<std::future<void>> pending;
  for (const auto &handle : registry_.handles()) {
    session::ShutdownRequest request;
    auto done = request.done.get_future();
    if (handle->shutdown(std::move(request)) == session::PushResult::Accepted) {
      pending.push_back(std::move(done));
    }
  }
  for (auto &done : pending) {
    if (done.wait_for(ACTOR_SHUTDOWN_TIMEOUT) != std::future_status::ready) {
      observability::record_error("service", "actor did not acknowledge shutdown in time");
    }
  }
  for (const auto &id : registry_.ids()) {
    registry_.remove(id);
  }

  scheduler_.stop();
  if (writer_ != nullptr) {
    writer_->stop();
  }
  if (was_running) {
    std::cerr << "[service] stopped\n";
  }
}

common::Result<session::SessionHandle>
SessionService::create_session(const CreateSessionRequest &request) {
  using R = common::Result<session::SessionHandle>;
  if (request.provider.empty()) {
    return R::failure("provider is required");
  }
  if (request.project_path.empty()) {
    return R::failure("project_path is required");
  }
  auto id = common::new_session_id();
  if (!id.ok()) {
    return R::failure("failed to generate session id: " + id.error());
  }

  session::SessionState state;
  state.id = id.take();
  state.provider = request.provider;
  state.project_path = request.project_path;
  state.project_name = request.project_name;
  state.model = request.model;
  state.approval_policy = request.approval_policy;
  state.sandbox_mode = request.sandbox_mode;
  state.forked_from = request.forked_from;
  state.started_at = now();
  state.last_activity_at = state.started_at;

  if (writer_ != nullptr) {
    auto status = writer_->submit(state.id, 0,
                                  session::persist::SessionCreate{
                                      .provider = state.provider,
                                      .project_path = state.project_path,
                                      .project_name = state.project_name,
                                      .model = state.model,
                                      .approval_policy = state.approval_policy,
                                      .sandbox_mode = state.sandbox_mode,
                                      .forked_from = state.forked_from,
                                      .started_at = state.started_at,
                                  });
    if (!status.ok()) {
      return R::failure("failed to persist new session: " + status.error());
    }
  }
  return spawn(std::move(state), false);
}

common::Result<session::SessionHandle> SessionService::spawn(session::SessionState state,
                                                             const bool restored) {
  using R = common::Result<session::SessionHandle>;
  const std::string id = state.id;
  const std::string provider = state.provider;
  auto actor = session::SessionActor::create(
      std::move(state),
      session::ActorOptions{
          .inbox_capacity = config_.registry.inbox_capacity,
          .event_log_capacity = config_.registry.event_log_capacity,
          .subscriber_queue_capacity = config_.registry.subscriber_queue_capacity,
          .max_messages_per_slice = config_.scheduler.max_messages_per_slice,
      },
      session::SessionActor::Dependencies{
          .scheduler = &scheduler_,
          .persist = writer_.get(),
          .connector = &connector_,
          .clock = clock_,
      });
  if (!registry_.register_session(actor)) {
    return R::failure("session already registered: " + id);
  }
  observability::record_session_spawned(id, provider, restored);
  return R::success(std::move(actor));
}

std::size_t SessionService::reap_ended(const std::string &now) {
  const auto now_time = common::parse_rfc3339(now);
  if (!now_time.has_value()) {
    observability::record_error("service", "reaper got an unparseable time: " + now);
    return 0;
  }
  const auto grace = std::chrono::seconds(config_.registry.ended_grace_seconds);

  std::size_t reaped = 0;
  for (const auto &handle : registry_.handles()) {
    const auto snapshot = handle->snapshot();
    if (!session::is_ended(snapshot->phase) || !snapshot->ended_at.has_value()) {
      continue;
    }
    const auto ended_at = common::parse_rfc3339(*snapshot->ended_at);
    if (!ended_at.has_value() || *now_time - *ended_at < grace) {
      continue;
    }
    if (registry_.remove(handle->id()) == nullptr) {
      continue;
    }
    const auto result = handle->shutdown(session::ShutdownRequest{});
    if (result != session::PushResult::Accepted && !handle->stopped()) {
      observability::record_error("service", "could not stop reaped session " + handle->id());
    }
    ++reaped;
  }
  return reaped;
}

void SessionService::housekeeping_loop() {
  const auto tick = std::chrono::milliseconds(config_.registry.list_refresh_ms);
  const auto reap_interval = std::chrono::milliseconds(config_.registry.reap_interval_ms);
  auto next_reap = std::chrono::steady_clock::now() + reap_interval;
  std::unique_lock<std::mutex> lock(housekeeping_mutex_);
  while (running_.load()) {
    housekeeping_cv_.wait_for(lock, tick, [this] { return !running_.load(); });
    if (!running_.load()) {
      break;
    }
    lock.unlock();
    registry_.publish_list_updates();
    if (std::chrono::steady_clock::now() >= next_reap) {
      next_reap = std::chrono::steady_clock::now() + reap_interval;
      const auto reaped = reap_ended(now());
      if (reaped > 0) {
        std::cerr << "[service] reaped " << reaped << " ended sessions\n";
      }
    }
    lock.lock();
  }
}

} // namespace orbitcore::runtime
