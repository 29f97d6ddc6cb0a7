#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orbitcore::session {

enum class ApprovalType { Exec, Patch, Question };
enum class ReviewDecision { Approved, ApprovedForSession, Denied, Abort };
enum class MessageType { User, Assistant, Thinking, Tool, ToolResult, Steer };
enum class WorkStatus { Waiting, Working, Permission, Question, Ended };
enum class SessionStatus { Active, Ended };

[[nodiscard]] std::string_view to_string(ApprovalType type);
[[nodiscard]] std::string_view to_string(ReviewDecision decision);
[[nodiscard]] std::string_view to_string(MessageType type);
[[nodiscard]] std::string_view to_string(WorkStatus status);
[[nodiscard]] std::string_view to_string(SessionStatus status);

[[nodiscard]] std::optional<ApprovalType> parse_approval_type(std::string_view value);
[[nodiscard]] std::optional<ReviewDecision> parse_review_decision(std::string_view value);
[[nodiscard]] std::optional<MessageType> parse_message_type(std::string_view value);
[[nodiscard]] std::optional<WorkStatus> parse_work_status(std::string_view value);
[[nodiscard]] std::optional<SessionStatus> parse_session_status(std::string_view value);

/// Approved and ApprovedForSession let the turn continue.
[[nodiscard]] bool is_approval(ReviewDecision decision);

struct IdlePhase {
  bool operator==(const IdlePhase &) const = default;
};

struct WorkingPhase {
  bool operator==(const WorkingPhase &) const = default;
};

struct AwaitingApprovalPhase {
  std::string request_id;
  ApprovalType approval_type = ApprovalType::Exec;
  std::optional<std::vector<std::string>> proposed_amendment;

  bool operator==(const AwaitingApprovalPhase &) const = default;
};

struct EndedPhase {
  std::string reason;

  bool operator==(const EndedPhase &) const = default;
};

using WorkPhase = std::variant<IdlePhase, WorkingPhase, AwaitingApprovalPhase, EndedPhase>;

[[nodiscard]] WorkStatus to_work_status(const WorkPhase &phase);
[[nodiscard]] std::string_view phase_name(const WorkPhase &phase);
[[nodiscard]] bool is_ended(const WorkPhase &phase);

struct TokenUsage {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  std::uint64_t cached_tokens = 0;
  std::uint64_t context_window = 0;

  bool operator==(const TokenUsage &) const = default;
};

struct Message {
  std::string id;
  std::string session_id;
  MessageType type = MessageType::Assistant;
  std::string content;
  std::optional<std::string> tool_name;
  std::optional<std::string> tool_input;
  std::optional<std::string> tool_output;
  bool is_error = false;
  std::string timestamp;
  std::optional<std::uint64_t> duration_ms;

  bool operator==(const Message &) const = default;
};

struct ApprovalRequest {
  std::string id;
  std::string session_id;
  ApprovalType approval_type = ApprovalType::Exec;
  std::optional<std::string> command;
  std::optional<std::string> file_path;
  std::optional<std::string> diff;
  std::optional<std::string> question;
  std::optional<std::vector<std::string>> proposed_amendment;

  bool operator==(const ApprovalRequest &) const = default;
};

struct TurnDiff {
  std::string turn_id;
  std::string diff;
  TokenUsage token_usage;

  bool operator==(const TurnDiff &) const = default;
};

struct SessionState {
  std::string id;
  std::uint64_t revision = 0;
  WorkPhase phase = IdlePhase{};
  std::vector<Message> messages;
  TokenUsage token_usage;

  std::string provider;
  std::string project_path;
  std::optional<std::string> project_name;
  std::optional<std::string> model;
  std::optional<std::string> custom_name;
  std::optional<std::string> approval_policy;
  std::optional<std::string> sandbox_mode;
  std::optional<std::string> forked_from;
  std::string started_at;
  std::optional<std::string> last_activity_at;
  std::optional<std::string> ended_at;

  std::optional<std::string> current_diff;
  std::optional<std::string> current_plan;
  std::optional<std::string> current_turn_id;
  std::uint64_t turn_count = 0;
  std::uint64_t tool_count = 0;
  std::vector<TurnDiff> turn_diffs;
  std::optional<ApprovalRequest> pending_approval;

  std::optional<std::string> current_cwd;
  std::optional<std::string> git_branch;
  std::optional<std::string> git_sha;

  bool operator==(const SessionState &) const = default;
};

/// Row shown in session lists; derived from a snapshot without touching the actor.
struct SessionSummary {
  std::string id;
  std::string provider;
  std::string project_path;
  std::optional<std::string> project_name;
  std::optional<std::string> model;
  std::optional<std::string> custom_name;
  SessionStatus status = SessionStatus::Active;
  WorkStatus work_status = WorkStatus::Waiting;
  std::uint64_t revision = 0;
  std::size_t message_count = 0;
  std::uint64_t tool_count = 0;
  std::string started_at;
  std::optional<std::string> last_activity_at;

  bool operator==(const SessionSummary &) const = default;
};

[[nodiscard]] SessionSummary summarize(const SessionState &state);

} // namespace orbitcore::session
