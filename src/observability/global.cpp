#include "orbitcore/observability/global.hpp"

#include <mutex>

namespace orbitcore::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session_spawned(const std::string &session_id, const std::string &provider,
                            const bool restored) {
  record_event(SessionSpawnedEvent{
      .session_id = session_id, .provider = provider, .restored = restored});
}

void record_session_ended(const std::string &session_id, const std::string &reason) {
  record_event(SessionEndedEvent{.session_id = session_id, .reason = reason});
}

void record_session_removed(const std::string &session_id) {
  record_event(SessionRemovedEvent{.session_id = session_id});
}

void record_invalid_transition(const std::string &session_id, const std::string &phase,
                               const std::string &input) {
  record_event(
      InvalidTransitionEvent{.session_id = session_id, .phase = phase, .input = input});
}

void record_effect_failed(const std::string &session_id, const std::string &effect,
                          const std::string &message, const bool fed_back) {
  record_event(EffectFailedEvent{
      .session_id = session_id, .effect = effect, .message = message, .fed_back = fed_back});
}

void record_subscriber_dropped(const std::string &session_id, const std::string &reason) {
  record_event(SubscriberDroppedEvent{.session_id = session_id, .reason = reason});
}

void record_route_rejected(const std::string &session_id, const std::string &reason) {
  record_event(RouteRejectedEvent{.session_id = session_id, .reason = reason});
}

void record_persistence_flush(const std::size_t commands, const std::chrono::milliseconds duration,
                              const bool success) {
  record_event(
      PersistenceFlushEvent{.commands = commands, .duration = duration, .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace orbitcore::observability
