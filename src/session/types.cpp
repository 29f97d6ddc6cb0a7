#include "orbitcore/session/types.hpp"

#include <type_traits>

namespace orbitcore::session {

std::string_view to_string(const ApprovalType type) {
  switch (type) {
  case ApprovalType::Exec:
    return "exec";
  case ApprovalType::Patch:
    return "patch";
  case ApprovalType::Question:
    return "question";
  }
  return "exec";
}

std::string_view to_string(const ReviewDecision decision) {
  switch (decision) {
  case ReviewDecision::Approved:
    return "approved";
  case ReviewDecision::ApprovedForSession:
    return "approved_for_session";
  case ReviewDecision::Denied:
    return "denied";
  case ReviewDecision::Abort:
    return "abort";
  }
  return "denied";
}

std::string_view to_string(const MessageType type) {
  switch (type) {
  case MessageType::User:
    return "user";
  case MessageType::Assistant:
    return "assistant";
  case MessageType::Thinking:
    return "thinking";
  case MessageType::Tool:
    return "tool";
  case MessageType::ToolResult:
    return "tool_result";
  case MessageType::Steer:
    return "steer";
  }
  return "assistant";
}

std::string_view to_string(const WorkStatus status) {
  switch (status) {
  case WorkStatus::Waiting:
    return "waiting";
  case WorkStatus::Working:
    return "working";
  case WorkStatus::Permission:
    return "permission";
  case WorkStatus::Question:
    return "question";
  case WorkStatus::Ended:
    return "ended";
  }
  return "waiting";
}

std::string_view to_string(const SessionStatus status) {
  return status == SessionStatus::Active ? "active" : "ended";
}

std::optional<ApprovalType> parse_approval_type(const std::string_view value) {
  if (value == "exec") {
    return ApprovalType::Exec;
  }
  if (value == "patch") {
    return ApprovalType::Patch;
  }
  if (value == "question") {
    return ApprovalType::Question;
  }
  return std::nullopt;
}

std::optional<ReviewDecision> parse_review_decision(const std::string_view value) {
  if (value == "approved") {
    return ReviewDecision::Approved;
  }
  if (value == "approved_for_session") {
    return ReviewDecision::ApprovedForSession;
  }
  if (value == "denied") {
    return ReviewDecision::Denied;
  }
  if (value == "abort") {
    return ReviewDecision::Abort;
  }
  return std::nullopt;
}

std::optional<MessageType> parse_message_type(const std::string_view value) {
  for (const auto type : {MessageType::User, MessageType::Assistant, MessageType::Thinking,
                          MessageType::Tool, MessageType::ToolResult, MessageType::Steer}) {
    if (to_string(type) == value) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<WorkStatus> parse_work_status(const std::string_view value) {
  for (const auto status : {WorkStatus::Waiting, WorkStatus::Working, WorkStatus::Permission,
                            WorkStatus::Question, WorkStatus::Ended}) {
    if (to_string(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<SessionStatus> parse_session_status(const std::string_view value) {
  if (value == "active") {
    return SessionStatus::Active;
  }
  if (value == "ended") {
    return SessionStatus::Ended;
  }
  return std::nullopt;
}

bool is_approval(const ReviewDecision decision) {
  return decision == ReviewDecision::Approved || decision == ReviewDecision::ApprovedForSession;
}

WorkStatus to_work_status(const WorkPhase &phase) {
  return std::visit(
      [](const auto &p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, IdlePhase>) {
          return WorkStatus::Waiting;
        } else if constexpr (std::is_same_v<T, WorkingPhase>) {
          return WorkStatus::Working;
        } else if constexpr (std::is_same_v<T, AwaitingApprovalPhase>) {
          return p.approval_type == ApprovalType::Question ? WorkStatus::Question
                                                           : WorkStatus::Permission;
        } else {
          return WorkStatus::Ended;
        }
      },
      phase);
}

std::string_view phase_name(const WorkPhase &phase) {
  switch (phase.index()) {
  case 0:
    return "idle";
  case 1:
    return "working";
  case 2:
    return "awaiting_approval";
  default:
    return "ended";
  }
}

bool is_ended(const WorkPhase &phase) { return std::holds_alternative<EndedPhase>(phase); }

SessionSummary summarize(const SessionState &state) {
  return SessionSummary{
      .id = state.id,
      .provider = state.provider,
      .project_path = state.project_path,
      .project_name = state.project_name,
      .model = state.model,
      .custom_name = state.custom_name,
      .status = is_ended(state.phase) ? SessionStatus::Ended : SessionStatus::Active,
      .work_status = to_work_status(state.phase),
      .revision = state.revision,
      .message_count = state.messages.size(),
      .tool_count = state.tool_count,
      .started_at = state.started_at,
      .last_activity_at = state.last_activity_at,
  };
}

} // namespace orbitcore::session
