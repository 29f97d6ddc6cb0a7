#pragma once

#include "orbitcore/session/event.hpp"
#include "orbitcore/session/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orbitcore::session {

namespace persist {

/// Inserts the session row; written once when a session is created.
struct SessionCreate {
  std::string provider;
  std::string project_path;
  std::optional<std::string> project_name;
  std::optional<std::string> model;
  std::optional<std::string> approval_policy;
  std::optional<std::string> sandbox_mode;
  std::optional<std::string> forked_from;
  std::string started_at;
};

struct SessionUpdate {
  std::optional<SessionStatus> status;
  std::optional<WorkStatus> work_status;
  std::optional<std::string> last_activity_at;
};

struct SessionEnd {
  std::string reason;
  std::string ended_at;
};

struct Reactivate {
  std::string last_activity_at;
};

struct MessageAppend {
  Message message;
};

struct ToolCountIncrement {
  std::string last_activity_at;
};

struct MessageUpdate {
  std::string message_id;
  std::optional<std::string> content;
  std::optional<std::string> tool_output;
  std::optional<bool> is_error;
  std::optional<std::uint64_t> duration_ms;
};

struct TokensUpdate {
  TokenUsage usage;
};

struct TurnStateUpdate {
  std::optional<std::string> diff;
  std::optional<std::string> plan;
  std::optional<std::optional<std::string>> current_turn_id;
  std::optional<std::uint64_t> turn_count;
};

struct TurnDiffInsert {
  TurnDiff turn_diff;
};

struct SetCustomName {
  std::optional<std::string> custom_name;
};

struct SetSessionConfig {
  std::optional<std::string> approval_policy;
  std::optional<std::string> sandbox_mode;
};

struct ModelUpdate {
  std::string model;
};

struct EnvironmentUpdate {
  std::optional<std::string> cwd;
  std::optional<std::string> git_branch;
  std::optional<std::string> git_sha;
};

struct ApprovalRequested {
  ApprovalRequest request;
  std::optional<std::string> tool_name;
  std::optional<std::string> cwd;
};

struct ApprovalDecision {
  std::string request_id;
  ReviewDecision decision = ReviewDecision::Denied;
  std::string decided_at;
};

} // namespace persist

using PersistOp =
    std::variant<persist::SessionCreate, persist::SessionUpdate, persist::SessionEnd,
                 persist::Reactivate, persist::MessageAppend, persist::ToolCountIncrement,
                 persist::MessageUpdate,
                 persist::TokensUpdate, persist::TurnStateUpdate, persist::TurnDiffInsert,
                 persist::SetCustomName, persist::SetSessionConfig, persist::ModelUpdate,
                 persist::EnvironmentUpdate, persist::ApprovalRequested,
                 persist::ApprovalDecision>;

[[nodiscard]] std::string_view persist_op_name(const PersistOp &op);

namespace call {

struct SendMessage {
  std::string content;
  std::optional<std::string> model;
  std::optional<std::string> effort;
};

struct Steer {
  std::string content;
};

struct Approve {
  std::string request_id;
  ApprovalType approval_type = ApprovalType::Exec;
  ReviewDecision decision = ReviewDecision::Denied;
  std::optional<std::vector<std::string>> proposed_amendment;
};

struct AnswerQuestion {
  std::string request_id;
  std::string answer;
};

struct Interrupt {};

struct SetName {
  std::optional<std::string> name;
};

struct UpdateConfig {
  std::optional<std::string> approval_policy;
  std::optional<std::string> sandbox_mode;
};

struct Compact {};
struct Undo {};

struct Rollback {
  std::uint32_t num_turns = 0;
};

struct Shutdown {};
struct Resume {};

} // namespace call

using RuntimeCall =
    std::variant<call::SendMessage, call::Steer, call::Approve, call::AnswerQuestion,
                 call::Interrupt, call::SetName, call::UpdateConfig, call::Compact, call::Undo,
                 call::Rollback, call::Shutdown, call::Resume>;

[[nodiscard]] std::string_view runtime_call_name(const RuntimeCall &call);

struct PersistEffect {
  PersistOp op;
};

/// Carries the revision this emission produces and the step's timestamp.
struct EmitEffect {
  std::uint64_t revision = 0;
  std::string timestamp;
  EventPayload payload;
};

struct RuntimeCallEffect {
  RuntimeCall call;
};

using Effect = std::variant<PersistEffect, EmitEffect, RuntimeCallEffect>;

[[nodiscard]] std::string effect_name(const Effect &effect);

} // namespace orbitcore::session
