#pragma once

#include "orbitcore/observability/observer.hpp"

#include <memory>

namespace orbitcore::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_spawned(const std::string &session_id, const std::string &provider,
                            bool restored);
void record_session_ended(const std::string &session_id, const std::string &reason);
void record_session_removed(const std::string &session_id);
void record_invalid_transition(const std::string &session_id, const std::string &phase,
                               const std::string &input);
void record_effect_failed(const std::string &session_id, const std::string &effect,
                          const std::string &message, bool fed_back);
void record_subscriber_dropped(const std::string &session_id, const std::string &reason);
void record_route_rejected(const std::string &session_id, const std::string &reason);
void record_persistence_flush(std::size_t commands, std::chrono::milliseconds duration,
                              bool success);
void record_error(const std::string &component, const std::string &message);

} // namespace orbitcore::observability
