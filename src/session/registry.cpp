#include "orbitcore/session/registry.hpp"

#include "orbitcore/observability/global.hpp"

#include <algorithm>
#include <functional>

namespace orbitcore::session {

std::string_view route_error_code(const RouteError error) {
  switch (error) {
  case RouteError::UnknownSession:
    return "unknown_session";
  case RouteError::Busy:
    return "busy";
  case RouteError::Ended:
    return "ended";
  case RouteError::Closed:
    return "closed";
  }
  return "unknown_session";
}

std::string_view list_event_kind_name(const ListEvent::Kind kind) {
  switch (kind) {
  case ListEvent::Kind::Created:
    return "created";
  case ListEvent::Kind::Updated:
    return "updated";
  case ListEvent::Kind::Removed:
    return "removed";
  }
  return "updated";
}

SessionRegistry::SessionRegistry(RegistryOptions options)
    : options_(options), list_channel_(options.list_queue_capacity) {
  const std::size_t count = options_.shards == 0 ? 1 : options_.shards;
  shards_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto shard = std::make_unique<Shard>();
    shard->map.store(std::make_shared<const Map>());
    shards_.push_back(std::move(shard));
  }
}

SessionRegistry::Shard &SessionRegistry::shard_for(const std::string &id) const {
  return *shards_[std::hash<std::string>{}(id) % shards_.size()];
}

bool SessionRegistry::register_session(SessionHandle handle) {
  if (handle == nullptr) {
    return false;
  }
  const std::string id = handle->id();
  auto &shard = shard_for(id);
  {
    std::lock_guard<std::mutex> lock(shard.write_mutex);
    const auto current = shard.map.load();
    if (current->contains(id)) {
      return false;
    }
    auto next = std::make_shared<Map>(*current);
    next->emplace(id, handle);
    shard.map.store(std::move(next));
  }
  {
    std::lock_guard<std::mutex> lock(listed_mutex_);
    const auto snapshot = handle->snapshot();
    listed_revisions_[id] = snapshot->revision;
    list_channel_.publish(
        ListEvent{.kind = ListEvent::Kind::Created, .summary = summarize(*snapshot)});
  }
  record_active_count();
  return true;
}

SessionHandle SessionRegistry::remove(const std::string &id) {
  auto &shard = shard_for(id);
  SessionHandle removed;
  {
    std::lock_guard<std::mutex> lock(shard.write_mutex);
    const auto current = shard.map.load();
    const auto it = current->find(id);
    if (it == current->end()) {
      return nullptr;
    }
    removed = it->second;
    auto next = std::make_shared<Map>(*current);
    next->erase(id);
    shard.map.store(std::move(next));
  }
  {
    std::lock_guard<std::mutex> lock(listed_mutex_);
    listed_revisions_.erase(id);
    list_channel_.publish(
        ListEvent{.kind = ListEvent::Kind::Removed, .summary = summarize(*removed->snapshot())});
  }
  observability::record_session_removed(id);
  record_active_count();
  return removed;
}

SessionHandle SessionRegistry::find(const std::string &id) const {
  const auto map = shard_for(id).map.load();
  const auto it = map->find(id);
  return it == map->end() ? nullptr : it->second;
}

RouteStatus SessionRegistry::send(const std::string &id, Input input) {
  const auto handle = find(id);
  if (handle == nullptr) {
    observability::record_route_rejected(id, "unknown_session");
    return RouteStatus::failure(RouteError::UnknownSession, "unknown session: " + id);
  }
  if (handle->stopped()) {
    observability::record_route_rejected(id, "closed");
    return RouteStatus::failure(RouteError::Closed, "session actor has stopped");
  }
  if (is_ended(handle->snapshot()->phase) && !std::holds_alternative<input::Resume>(input)) {
    observability::record_route_rejected(id, "ended");
    return RouteStatus::failure(RouteError::Ended, "session has ended");
  }
  switch (handle->post(std::move(input))) {
  case PushResult::Accepted:
    return RouteStatus::success();
  case PushResult::Full:
    observability::record_route_rejected(id, "busy");
    return RouteStatus::failure(RouteError::Busy, "session inbox is full");
  case PushResult::Closed:
    break;
  }
  observability::record_route_rejected(id, "closed");
  return RouteStatus::failure(RouteError::Closed, "session actor has stopped");
}

SubscribeOutcome SessionRegistry::subscribe(const std::string &id,
                                            const std::optional<std::uint64_t> since_revision) {
  const auto handle = find(id);
  if (handle == nullptr) {
    return {.status = RouteStatus::failure(RouteError::UnknownSession, "unknown session: " + id)};
  }
  SubscribeRequest request{.since_revision = since_revision, .reply = {}};
  auto future = request.reply.get_future();
  switch (handle->subscribe(std::move(request))) {
  case PushResult::Accepted:
    break;
  case PushResult::Full:
    return {.status = RouteStatus::failure(RouteError::Busy, "session inbox is full")};
  case PushResult::Closed:
    return {.status = RouteStatus::failure(RouteError::Closed, "session actor has stopped")};
  }
  if (future.wait_for(options_.subscribe_timeout) != std::future_status::ready) {
    return {.status = RouteStatus::failure(RouteError::Busy, "subscribe timed out")};
  }
  try {
    return {.status = RouteStatus::success(), .reply = future.get()};
  } catch (const std::future_error &) {
    return {.status = RouteStatus::failure(RouteError::Closed,
                                           "session stopped before answering subscribe")};
  }
}

std::shared_ptr<const SessionState> SessionRegistry::snapshot(const std::string &id) const {
  const auto handle = find(id);
  return handle == nullptr ? nullptr : handle->snapshot();
}

std::vector<SessionSummary> SessionRegistry::list() const {
  std::vector<SessionSummary> out;
  for (const auto &handle : handles()) {
    out.push_back(summarize(*handle->snapshot()));
  }
  std::sort(out.begin(), out.end(), [](const SessionSummary &a, const SessionSummary &b) {
    return a.id < b.id;
  });
  return out;
}

ListSubscription SessionRegistry::subscribe_list() {
  ListSubscription out;
  out.live = list_channel_.subscribe();
  out.sessions = list();
  return out;
}

std::size_t SessionRegistry::publish_list_updates() {
  std::lock_guard<std::mutex> lock(listed_mutex_);
  std::size_t published = 0;
  for (const auto &shard : shards_) {
    const auto map = shard->map.load();
    for (const auto &[id, handle] : *map) {
      // Sessions registered after this map load are announced by their Created event.
      const auto listed = listed_revisions_.find(id);
      if (listed == listed_revisions_.end()) {
        continue;
      }
      const auto snapshot = handle->snapshot();
      if (snapshot->revision == listed->second) {
        continue;
      }
      listed->second = snapshot->revision;
      const auto result = list_channel_.publish(
          ListEvent{.kind = ListEvent::Kind::Updated, .summary = summarize(*snapshot)});
      if (result.dropped > 0) {
        observability::record_subscriber_dropped("", "list subscriber queue full");
      }
      ++published;
    }
  }
  return published;
}

std::size_t SessionRegistry::size() const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    total += shard->map.load()->size();
  }
  return total;
}

std::vector<std::string> SessionRegistry::ids() const {
  std::vector<std::string> out;
  for (const auto &shard : shards_) {
    for (const auto &[id, handle] : *shard->map.load()) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<SessionHandle> SessionRegistry::handles() const {
  std::vector<SessionHandle> out;
  for (const auto &shard : shards_) {
    for (const auto &[id, handle] : *shard->map.load()) {
      out.push_back(handle);
    }
  }
  return out;
}

void SessionRegistry::record_active_count() const {
  observability::record_metric(observability::ActiveSessionsMetric{.count = size()});
}

} // namespace orbitcore::session
