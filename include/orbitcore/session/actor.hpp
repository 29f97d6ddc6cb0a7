#pragma once

#include "orbitcore/runtime/connector.hpp"
#include "orbitcore/runtime/scheduler.hpp"
#include "orbitcore/session/broadcast.hpp"
#include "orbitcore/session/effect_executor.hpp"
#include "orbitcore/session/event_log.hpp"
#include "orbitcore/session/input.hpp"
#include "orbitcore/session/mailbox.hpp"
#include "orbitcore/session/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace orbitcore::session {

struct SubscribeReply {
  /// Session revision at the moment the subscriber was attached.
  std::uint64_t revision = 0;
  /// Events after the requested revision; set when it was inside the window.
  std::optional<std::vector<LoggedEventPtr>> replay;
  /// Full state; set when no replay was possible.
  std::shared_ptr<const SessionState> snapshot;
  Subscription<LoggedEventPtr> live;
};

struct SubscribeRequest {
  std::optional<std::uint64_t> since_revision;
  std::promise<SubscribeReply> reply;
};

struct ShutdownRequest {
  std::promise<void> done;
};

using ActorMessage = std::variant<Input, SubscribeRequest, ShutdownRequest>;

struct ActorOptions {
  std::size_t inbox_capacity = 256;
  std::size_t event_log_capacity = 1'000;
  std::size_t subscriber_queue_capacity = 256;
  std::size_t max_messages_per_slice = 64;
};

using Clock = std::function<std::string()>;

/// Exclusive owner of one session's state. Messages are processed one at a
/// time in arrival order, in slices run on the shared ActorScheduler.
class SessionActor : public std::enable_shared_from_this<SessionActor> {
public:
  struct Dependencies {
    runtime::ActorScheduler *scheduler = nullptr;
    IPersistSink *persist = nullptr;
    runtime::IRuntimeConnector *connector = nullptr;
    Clock clock;
  };

  [[nodiscard]] static std::shared_ptr<SessionActor> create(SessionState initial,
                                                            ActorOptions options,
                                                            Dependencies deps);

  SessionActor(const SessionActor &) = delete;
  SessionActor &operator=(const SessionActor &) = delete;

  /// Non-blocking. Full when the inbox is saturated, Closed after shutdown.
  PushResult post(Input input);
  PushResult subscribe(SubscribeRequest request);
  /// Shutdown bypasses the inbox bound; it is processed after queued messages.
  PushResult shutdown(ShutdownRequest request);

  [[nodiscard]] std::shared_ptr<const SessionState> snapshot() const;
  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] std::size_t inbox_depth() const { return inbox_.size(); }
  [[nodiscard]] bool stopped() const { return stopped_.load(); }

private:
  SessionActor(SessionState initial, ActorOptions options, Dependencies deps);

  void schedule();
  void run_slice();
  void handle(ActorMessage message);
  void handle_input(const Input &input);
  void handle_subscribe(SubscribeRequest request);
  void handle_shutdown(ShutdownRequest request);

  std::string id_;
  ActorOptions options_;
  Dependencies deps_;
  Mailbox<ActorMessage> inbox_;
  EventLog log_;
  BroadcastChannel<LoggedEventPtr> channel_;
  EffectExecutor executor_;
  std::atomic<std::shared_ptr<const SessionState>> snapshot_;
  std::atomic<bool> scheduled_{false};
  std::atomic<bool> stopped_{false};
};

} // namespace orbitcore::session
