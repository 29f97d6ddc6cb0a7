#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace orbitcore::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::string_view log_level_name(LogLevel level);
[[nodiscard]] LogLevel parse_log_level(const std::string &value, LogLevel fallback);

struct SessionSpawnedEvent {
  std::string session_id;
  std::string provider;
  bool restored = false;
};

struct SessionEndedEvent {
  std::string session_id;
  std::string reason;
};

struct SessionRemovedEvent {
  std::string session_id;
};

struct InvalidTransitionEvent {
  std::string session_id;
  std::string phase;
  std::string input;
};

struct EffectFailedEvent {
  std::string session_id;
  std::string effect;
  std::string message;
  bool fed_back = true;
};

struct SubscriberDroppedEvent {
  std::string session_id;
  std::string reason;
};

struct RouteRejectedEvent {
  std::string session_id;
  std::string reason;
};

struct PersistenceFlushEvent {
  std::size_t commands = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SessionSpawnedEvent, SessionEndedEvent, SessionRemovedEvent,
                 InvalidTransitionEvent, EffectFailedEvent, SubscriberDroppedEvent,
                 RouteRejectedEvent, PersistenceFlushEvent, ErrorEvent>;

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct InboxDepthMetric {
  std::string session_id;
  std::uint64_t depth = 0;
};

struct PersistQueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<ActiveSessionsMetric, InboxDepthMetric, PersistQueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace orbitcore::observability
