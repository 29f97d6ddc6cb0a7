#include "orbitcore/observability/log_observer.hpp"

#include "orbitcore/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace orbitcore::observability {

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string &value, const LogLevel fallback) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return fallback;
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream *out)
    : min_level_(min_level), out_(out == nullptr ? &std::cerr : out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionSpawnedEvent>) {
          log_line(LogLevel::Info, "session.spawned id=" + evt.session_id +
                                       " provider=" + evt.provider +
                                       (evt.restored ? " restored=true" : ""));
        } else if constexpr (std::is_same_v<T, SessionEndedEvent>) {
          log_line(LogLevel::Info, "session.ended id=" + evt.session_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, SessionRemovedEvent>) {
          log_line(LogLevel::Debug, "session.removed id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, InvalidTransitionEvent>) {
          log_line(LogLevel::Warn, "session.invalid_transition id=" + evt.session_id +
                                       " phase=" + evt.phase + " input=" + evt.input);
        } else if constexpr (std::is_same_v<T, EffectFailedEvent>) {
          log_line(LogLevel::Error, "session.effect_failed id=" + evt.session_id +
                                        " effect=" + evt.effect + " error=" + evt.message +
                                        (evt.fed_back ? "" : " fed_back=false"));
        } else if constexpr (std::is_same_v<T, SubscriberDroppedEvent>) {
          log_line(LogLevel::Warn,
                   "subscriber.dropped id=" + evt.session_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, RouteRejectedEvent>) {
          log_line(LogLevel::Debug,
                   "registry.route_rejected id=" + evt.session_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, PersistenceFlushEvent>) {
          log_line(evt.success ? LogLevel::Debug : LogLevel::Error,
                   "persistence.flush commands=" + std::to_string(evt.commands) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, InboxDepthMetric>) {
          log_line(LogLevel::Debug,
                   "metric.inbox_depth id=" + m.session_id + " depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, PersistQueueDepthMetric>) {
          log_line(LogLevel::Debug, "metric.persist_queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace orbitcore::observability
