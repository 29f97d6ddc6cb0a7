#pragma once

#include "orbitcore/common/result.hpp"
#include "orbitcore/session/event.hpp"
#include "orbitcore/session/types.hpp"

namespace orbitcore::session {

/// Viewer-side copy of a session: starts from a snapshot and folds in events.
/// Applying every event after the snapshot reproduces the actor's state.
class SessionMirror {
public:
  explicit SessionMirror(SessionState snapshot) : state_(std::move(snapshot)) {}

  /// Events at or below the current revision are ignored; a gap is an error
  /// and means the viewer must resubscribe.
  [[nodiscard]] common::Status apply(const SessionEvent &event);

  [[nodiscard]] const SessionState &state() const { return state_; }
  [[nodiscard]] std::uint64_t revision() const { return state_.revision; }

private:
  void apply_changes(const StateChanges &changes);

  SessionState state_;
};

} // namespace orbitcore::session
