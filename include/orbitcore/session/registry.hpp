#pragma once

#include "orbitcore/session/actor.hpp"
#include "orbitcore/session/broadcast.hpp"
#include "orbitcore/session/input.hpp"
#include "orbitcore/session/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orbitcore::session {

using SessionHandle = std::shared_ptr<SessionActor>;

enum class RouteError { UnknownSession, Busy, Ended, Closed };

[[nodiscard]] std::string_view route_error_code(RouteError error);

class RouteStatus {
public:
  static RouteStatus success() { return RouteStatus(true, RouteError::UnknownSession, ""); }
  static RouteStatus failure(RouteError error, std::string message) {
    return RouteStatus(false, error, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] RouteError error() const { return error_; }
  [[nodiscard]] const std::string &message() const { return message_; }

private:
  RouteStatus(bool ok, RouteError error, std::string message)
      : ok_(ok), error_(error), message_(std::move(message)) {}

  bool ok_;
  RouteError error_;
  std::string message_;
};

struct SubscribeOutcome {
  RouteStatus status = RouteStatus::success();
  std::optional<SubscribeReply> reply;
};

struct ListEvent {
  enum class Kind { Created, Updated, Removed };

  Kind kind = Kind::Updated;
  SessionSummary summary;
};

[[nodiscard]] std::string_view list_event_kind_name(ListEvent::Kind kind);

/// Current summaries plus live list changes. Changes that raced with the
/// initial listing may repeat a summary already present in `sessions`.
struct ListSubscription {
  std::vector<SessionSummary> sessions;
  Subscription<ListEvent> live;
};

struct RegistryOptions {
  std::size_t shards = 16;
  std::size_t list_queue_capacity = 256;
  std::chrono::milliseconds subscribe_timeout{2'000};
};

/// Concurrent index of live sessions. Each shard publishes an immutable map
/// through an atomic pointer: lookups never lock, writers serialize per shard
/// and swap in a modified copy.
class SessionRegistry {
public:
  explicit SessionRegistry(RegistryOptions options = {});

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  /// Returns false when a session with the same id is already registered.
  bool register_session(SessionHandle handle);
  /// Returns the removed handle, or nullptr when the id was unknown.
  SessionHandle remove(const std::string &id);

  [[nodiscard]] SessionHandle find(const std::string &id) const;

  /// Non-blocking routing of one input to the owning actor.
  [[nodiscard]] RouteStatus send(const std::string &id, Input input);

  /// Asks the actor for a replay or snapshot and attaches a live subscription,
  /// waiting at most the configured subscribe timeout for the reply.
  [[nodiscard]] SubscribeOutcome subscribe(const std::string &id,
                                           std::optional<std::uint64_t> since_revision);

  [[nodiscard]] std::shared_ptr<const SessionState> snapshot(const std::string &id) const;
  [[nodiscard]] std::vector<SessionSummary> list() const;
  [[nodiscard]] ListSubscription subscribe_list();

  /// Compares every session's published snapshot with the revision last
  /// announced on the list channel and publishes Updated for each change.
  /// Runs off the actors' path; actors only swap their own snapshot pointer.
  /// Returns the number of Updated events published.
  std::size_t publish_list_updates();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::vector<SessionHandle> handles() const;
  [[nodiscard]] std::size_t shard_count() const { return shards_.size(); }

private:
  using Map = std::unordered_map<std::string, SessionHandle>;

  struct Shard {
    std::mutex write_mutex;
    std::atomic<std::shared_ptr<const Map>> map;
  };

  [[nodiscard]] Shard &shard_for(const std::string &id) const;
  void record_active_count() const;

  RegistryOptions options_;
  std::vector<std::unique_ptr<Shard>> shards_;
  BroadcastChannel<ListEvent> list_channel_;
  std::mutex listed_mutex_;
  std::unordered_map<std::string, std::uint64_t> listed_revisions_;
};

} // namespace orbitcore::session
