#pragma once

#include "orbitcore/session/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace orbitcore::session {

/// Partial update of session fields. An outer nullopt means "unchanged"; for
/// nested optionals an inner nullopt means "cleared".
struct StateChanges {
  std::optional<SessionStatus> status;
  std::optional<WorkStatus> work_status;
  std::optional<std::string> last_activity_at;
  std::optional<std::optional<std::string>> ended_at;
  std::optional<std::optional<std::string>> current_turn_id;
  std::optional<std::uint64_t> turn_count;
  std::optional<std::optional<std::string>> current_diff;
  std::optional<std::optional<std::string>> current_plan;
  std::optional<std::optional<std::string>> custom_name;
  std::optional<std::optional<std::string>> model;
  std::optional<std::optional<std::string>> approval_policy;
  std::optional<std::optional<std::string>> sandbox_mode;
  std::optional<std::optional<std::string>> current_cwd;
  std::optional<std::optional<std::string>> git_branch;
  std::optional<std::optional<std::string>> git_sha;
  std::optional<std::optional<ApprovalRequest>> pending_approval;

  bool operator==(const StateChanges &) const = default;
};

struct MessageChanges {
  std::optional<std::string> content;
  std::optional<std::string> tool_output;
  std::optional<bool> is_error;
  std::optional<std::uint64_t> duration_ms;

  bool operator==(const MessageChanges &) const = default;
};

namespace event {

struct SessionDelta {
  StateChanges changes;
  bool operator==(const SessionDelta &) const = default;
};

struct MessageAppended {
  Message message;
  bool operator==(const MessageAppended &) const = default;
};

struct MessageUpdated {
  std::string message_id;
  MessageChanges changes;
  bool operator==(const MessageUpdated &) const = default;
};

struct ApprovalRequested {
  ApprovalRequest request;
  bool operator==(const ApprovalRequested &) const = default;
};

struct TokensUpdated {
  TokenUsage usage;
  bool operator==(const TokensUpdated &) const = default;
};

struct SessionEnded {
  std::string reason;
  bool operator==(const SessionEnded &) const = default;
};

struct TurnDiffSnapshot {
  TurnDiff turn_diff;
  bool operator==(const TurnDiffSnapshot &) const = default;
};

struct ContextCompacted {
  bool operator==(const ContextCompacted &) const = default;
};

struct UndoStarted {
  std::optional<std::string> message;
  bool operator==(const UndoStarted &) const = default;
};

struct UndoCompleted {
  bool success = false;
  std::optional<std::string> message;
  bool operator==(const UndoCompleted &) const = default;
};

struct ThreadRolledBack {
  std::uint32_t num_turns = 0;
  bool operator==(const ThreadRolledBack &) const = default;
};

} // namespace event

using EventPayload =
    std::variant<event::SessionDelta, event::MessageAppended, event::MessageUpdated,
                 event::ApprovalRequested, event::TokensUpdated, event::SessionEnded,
                 event::TurnDiffSnapshot, event::ContextCompacted, event::UndoStarted,
                 event::UndoCompleted, event::ThreadRolledBack>;

[[nodiscard]] std::string_view payload_type(const EventPayload &payload);

/// Unit stored in the event log and delivered to subscribers.
struct SessionEvent {
  std::uint64_t revision = 0;
  std::string session_id;
  std::string timestamp;
  EventPayload payload;

  bool operator==(const SessionEvent &) const = default;
};

} // namespace orbitcore::session
