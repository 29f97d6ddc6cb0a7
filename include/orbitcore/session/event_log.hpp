#pragma once

#include "orbitcore/session/event.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orbitcore::session {

/// An emitted event together with its wire encoding, shared between the log
/// and every subscriber queue.
struct LoggedEvent {
  SessionEvent event;
  std::string json;
};

using LoggedEventPtr = std::shared_ptr<const LoggedEvent>;

[[nodiscard]] LoggedEventPtr make_logged_event(SessionEvent event);

/// Bounded ring of the most recent events of one session. Owned by the
/// session's actor; not thread-safe.
class EventLog {
public:
  /// `base_revision` is the session revision when the log was created; events
  /// at or below it are not available for replay.
  explicit EventLog(std::size_t capacity = 1'000, std::uint64_t base_revision = 0);

  /// Appends an event whose revision must be exactly newest_revision() + 1.
  [[nodiscard]] bool append(LoggedEventPtr event);

  /// Events with revision > since, oldest first, when `since` lies inside the
  /// buffered window [floor, newest]. nullopt means the caller must send a
  /// snapshot instead.
  [[nodiscard]] std::optional<std::vector<LoggedEventPtr>> replay_since(std::uint64_t since) const;

  [[nodiscard]] std::optional<std::uint64_t> oldest_revision() const;
  [[nodiscard]] std::uint64_t newest_revision() const;
  [[nodiscard]] std::uint64_t floor_revision() const { return floor_; }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::vector<LoggedEventPtr> entries() const;

private:
  std::size_t capacity_;
  std::uint64_t floor_;
  std::deque<LoggedEventPtr> entries_;
};

} // namespace orbitcore::session
