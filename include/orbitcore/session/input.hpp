#pragma once

#include "orbitcore/session/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orbitcore::session {

namespace input {

// Runtime-originated.

struct TurnStarted {};
struct TurnCompleted {};

struct TurnAborted {
  std::string reason;
};

struct MessageCreated {
  Message message;
};

struct MessageUpdated {
  std::string message_id;
  std::optional<std::string> content;
  std::optional<std::string> tool_output;
  std::optional<bool> is_error;
  std::optional<std::uint64_t> duration_ms;
};

struct ApprovalRequested {
  std::string request_id;
  ApprovalType approval_type = ApprovalType::Exec;
  std::optional<std::string> command;
  std::optional<std::string> file_path;
  std::optional<std::string> diff;
  std::optional<std::string> question;
  std::optional<std::vector<std::string>> proposed_amendment;
};

struct TokensUpdated {
  TokenUsage usage;
};

struct DiffUpdated {
  std::string diff;
};

struct PlanUpdated {
  std::string plan;
};

struct NameUpdated {
  std::string name;
};

struct SessionEnded {
  std::string reason;
};

struct ContextCompacted {};

struct UndoStarted {
  std::optional<std::string> message;
};

struct UndoCompleted {
  bool success = false;
  std::optional<std::string> message;
};

struct RolledBack {
  std::uint32_t num_turns = 0;
};

enum class ErrorOrigin { Runtime, Effect };

/// Effect-origin errors are produced by the actor when effect I/O fails.
struct Error {
  std::string message;
  ErrorOrigin origin = ErrorOrigin::Runtime;
};

struct ModelUpdated {
  std::string model;
};

struct EnvironmentChanged {
  std::optional<std::string> cwd;
  std::optional<std::string> git_branch;
  std::optional<std::string> git_sha;
};

// Client-originated.

struct UserSentMessage {
  std::string content;
  std::optional<std::string> model;
  std::optional<std::string> effort;
};

struct UserSteered {
  std::string content;
};

struct UserApproved {
  std::string request_id;
  ReviewDecision decision = ReviewDecision::Denied;
};

struct UserAnsweredQuestion {
  std::string request_id;
  std::string answer;
};

struct UserRenamed {
  std::optional<std::string> name;
};

struct UserChangedConfig {
  std::optional<std::string> approval_policy;
  std::optional<std::string> sandbox_mode;
};

struct UserInterrupted {};
struct UserCompacted {};
struct UserUndid {};

struct UserRolledBack {
  std::uint32_t num_turns = 0;
};

struct UserEnded {};
struct Resume {};

} // namespace input

using Input =
    std::variant<input::TurnStarted, input::TurnCompleted, input::TurnAborted,
                 input::MessageCreated, input::MessageUpdated, input::ApprovalRequested,
                 input::TokensUpdated, input::DiffUpdated, input::PlanUpdated,
                 input::NameUpdated, input::SessionEnded, input::ContextCompacted,
                 input::UndoStarted, input::UndoCompleted, input::RolledBack, input::Error,
                 input::ModelUpdated, input::EnvironmentChanged, input::UserSentMessage,
                 input::UserSteered, input::UserApproved, input::UserAnsweredQuestion,
                 input::UserRenamed, input::UserChangedConfig, input::UserInterrupted,
                 input::UserCompacted, input::UserUndid, input::UserRolledBack,
                 input::UserEnded, input::Resume>;

[[nodiscard]] std::string_view input_name(const Input &input);

} // namespace orbitcore::session
