#pragma once

#include "orbitcore/common/result.hpp"
#include "orbitcore/config/schema.hpp"
#include "orbitcore/persistence/store.hpp"
#include "orbitcore/persistence/writer.hpp"
#include "orbitcore/runtime/connector.hpp"
#include "orbitcore/runtime/scheduler.hpp"
#include "orbitcore/session/actor.hpp"
#include "orbitcore/session/registry.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace orbitcore::runtime {

struct CreateSessionRequest {
  std::string provider;
  std::string project_path;
  std::optional<std::string> project_name;
  std::optional<std::string> model;
  std::optional<std::string> approval_policy;
  std::optional<std::string> sandbox_mode;
  std::optional<std::string> forked_from;
};

/// Owns the scheduler, registry and persistence writer, and spawns actors.
/// The store is optional; without one sessions live only in memory.
class SessionService {
public:
  SessionService(config::Config config, std::unique_ptr<persistence::SqliteSessionStore> store,
                 IRuntimeConnector &connector, session::Clock clock = {});
  ~SessionService();

  SessionService(const SessionService &) = delete;
  SessionService &operator=(const SessionService &) = delete;

  /// Starts workers, restores active sessions from the store and starts the
  /// housekeeping thread (list updates, ended-session reaper).
  [[nodiscard]] common::Status start();

  /// Shuts down every actor, then the scheduler, then flushes the writer.
  void stop();

  [[nodiscard]] common::Result<session::SessionHandle>
  create_session(const CreateSessionRequest &request);

  /// Spawns and registers an actor for an existing state.
  [[nodiscard]] common::Result<session::SessionHandle> spawn(session::SessionState state,
                                                             bool restored);

  /// Removes ended sessions whose grace period has passed at `now`.
  /// Returns the number of sessions removed.
  std::size_t reap_ended(const std::string &now);

  [[nodiscard]] session::SessionRegistry &registry() { return registry_; }
  [[nodiscard]] ActorScheduler &scheduler() { return scheduler_; }
  [[nodiscard]] persistence::PersistenceWriter *writer() { return writer_.get(); }
  [[nodiscard]] persistence::SqliteSessionStore *store() { return store_.get(); }
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] bool running() const { return running_.load(); }

private:
  /// Publishes list updates every `list_refresh_ms` and reaps ended sessions
  /// every `reap_interval_ms`.
  void housekeeping_loop();
  [[nodiscard]] std::string now() const;

  config::Config config_;
  std::unique_ptr<persistence::SqliteSessionStore> store_;
  std::unique_ptr<persistence::PersistenceWriter> writer_;
  IRuntimeConnector &connector_;
  session::Clock clock_;
  ActorScheduler scheduler_;
  session::SessionRegistry registry_;

  std::atomic<bool> running_{false};
  std::mutex housekeeping_mutex_;
  std::condition_variable housekeeping_cv_;
  std::thread housekeeping_thread_;
};

} // namespace orbitcore::runtime
