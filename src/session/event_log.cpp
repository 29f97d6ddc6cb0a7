#include "orbitcore/session/event_log.hpp"

#include "orbitcore/session/codec.hpp"

namespace orbitcore::session {

LoggedEventPtr make_logged_event(SessionEvent event) {
  auto logged = std::make_shared<LoggedEvent>();
  logged->json = to_json(event);
  logged->event = std::move(event);
  return logged;
}

EventLog::EventLog(const std::size_t capacity, const std::uint64_t base_revision)
    : capacity_(capacity == 0 ? 1 : capacity), floor_(base_revision) {}

bool EventLog::append(LoggedEventPtr event) {
  if (event == nullptr || event->event.revision != newest_revision() + 1) {
    return false;
  }
  entries_.push_back(std::move(event));
  while (entries_.size() > capacity_) {
    floor_ = entries_.front()->event.revision;
    entries_.pop_front();
  }
  return true;
}

std::optional<std::vector<LoggedEventPtr>> EventLog::replay_since(const std::uint64_t since) const {
  if (since < floor_ || since > newest_revision()) {
    return std::nullopt;
  }
  const auto skip = static_cast<std::size_t>(since - floor_);
  return std::vector<LoggedEventPtr>(entries_.begin() + static_cast<std::ptrdiff_t>(skip),
                                     entries_.end());
}

std::optional<std::uint64_t> EventLog::oldest_revision() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.front()->event.revision;
}

std::uint64_t EventLog::newest_revision() const {
  return entries_.empty() ? floor_ : entries_.back()->event.revision;
}

std::vector<LoggedEventPtr> EventLog::entries() const {
  return std::vector<LoggedEventPtr>(entries_.begin(), entries_.end());
}

} // namespace orbitcore::session
