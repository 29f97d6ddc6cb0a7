#include "orbitcore/gateway/protocol.hpp"

#include "orbitcore/session/codec.hpp"

#include <array>
#include <limits>

namespace orbitcore::gateway {

namespace {

using InputResult = common::Result<session::Input>;

constexpr std::array<const char *, 12> SESSION_COMMANDS = {
    "send_message",    "steer_turn",        "approve_tool",   "answer_question",
    "rename_session",  "update_session_config", "interrupt_session", "compact_context",
    "undo_last_turn",  "rollback_turns",    "end_session",    "resume_session",
};

InputResult missing(const std::string &type, const std::string &field) {
  return InputResult::failure(type + " requires " + field);
}

std::optional<std::uint32_t> turns_field(const common::JsonFields &fields) {
  const auto value = common::json_u64_field(fields, "num_turns");
  if (!value.has_value() || *value == 0 || *value > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*value);
}

std::optional<std::vector<std::string>> string_list_field(const common::JsonFields &fields,
                                                          const std::string &key) {
  const auto raw = common::json_raw_field(fields, key);
  if (!raw.has_value() || common::json_is_null(*raw)) {
    return std::nullopt;
  }
  return session::string_list_from_json(*raw);
}

} // namespace

common::Result<ClientMessage> parse_client_message(const std::string &line) {
  using R = common::Result<ClientMessage>;
  auto fields = common::json_parse_object(line);
  if (!fields.has_value()) {
    return R::failure("message is not a JSON object");
  }
  auto type = common::json_string_field(*fields, "type");
  if (!type.has_value() || type->empty()) {
    return R::failure("message type is required");
  }
  ClientMessage message;
  message.type = std::move(*type);
  message.id = common::json_string_field(*fields, "id");
  message.session_id = common::json_string_field(*fields, "session_id");
  message.fields = std::move(*fields);
  return R::success(std::move(message));
}

bool is_session_command(const std::string &type) {
  for (const auto *name : SESSION_COMMANDS) {
    if (type == name) {
      return true;
    }
  }
  return false;
}

common::Result<session::Input> command_to_input(const ClientMessage &message) {
  namespace in = session::input;
  const auto &f = message.fields;
  const auto &type = message.type;

  if (type == "send_message") {
    auto content = common::json_string_field(f, "content");
    if (!content.has_value() || content->empty()) {
      return missing(type, "content");
    }
    return InputResult::success(in::UserSentMessage{.content = std::move(*content),
                                                    .model = common::json_string_field(f, "model"),
                                                    .effort = common::json_string_field(f, "effort")});
  }
  if (type == "steer_turn") {
    auto content = common::json_string_field(f, "content");
    if (!content.has_value() || content->empty()) {
      return missing(type, "content");
    }
    return InputResult::success(in::UserSteered{.content = std::move(*content)});
  }
  if (type == "approve_tool") {
    auto request_id = common::json_string_field(f, "request_id");
    if (!request_id.has_value()) {
      return missing(type, "request_id");
    }
    const auto decision_name = common::json_string_field(f, "decision");
    if (!decision_name.has_value()) {
      return missing(type, "decision");
    }
    const auto decision = session::parse_review_decision(*decision_name);
    if (!decision.has_value()) {
      return InputResult::failure("unknown decision: " + *decision_name);
    }
    return InputResult::success(
        in::UserApproved{.request_id = std::move(*request_id), .decision = *decision});
  }
  if (type == "answer_question") {
    auto request_id = common::json_string_field(f, "request_id");
    if (!request_id.has_value()) {
      return missing(type, "request_id");
    }
    auto answer = common::json_string_field(f, "answer");
    if (!answer.has_value()) {
      return missing(type, "answer");
    }
    return InputResult::success(in::UserAnsweredQuestion{.request_id = std::move(*request_id),
                                                         .answer = std::move(*answer)});
  }
  if (type == "rename_session") {
    const auto raw = common::json_raw_field(f, "name");
    if (!raw.has_value()) {
      return missing(type, "name");
    }
    if (common::json_is_null(*raw)) {
      return InputResult::success(in::UserRenamed{.name = std::nullopt});
    }
    auto name = common::json_as_string(*raw);
    if (!name.has_value()) {
      return InputResult::failure("rename_session name must be a string or null");
    }
    return InputResult::success(in::UserRenamed{.name = std::move(name)});
  }
  if (type == "update_session_config") {
    auto policy = common::json_string_field(f, "approval_policy");
    auto sandbox = common::json_string_field(f, "sandbox_mode");
    if (!policy.has_value() && !sandbox.has_value()) {
      return missing(type, "approval_policy or sandbox_mode");
    }
    return InputResult::success(in::UserChangedConfig{.approval_policy = std::move(policy),
                                                      .sandbox_mode = std::move(sandbox)});
  }
  if (type == "interrupt_session") {
    return InputResult::success(in::UserInterrupted{});
  }
  if (type == "compact_context") {
    return InputResult::success(in::UserCompacted{});
  }
  if (type == "undo_last_turn") {
    return InputResult::success(in::UserUndid{});
  }
  if (type == "rollback_turns") {
    const auto turns = turns_field(f);
    if (!turns.has_value()) {
      return InputResult::failure("rollback_turns requires num_turns >= 1");
    }
    return InputResult::success(in::UserRolledBack{.num_turns = *turns});
  }
  if (type == "end_session") {
    return InputResult::success(in::UserEnded{});
  }
  if (type == "resume_session") {
    return InputResult::success(in::Resume{});
  }
  return InputResult::failure("unknown command: " + type);
}

common::Result<session::Input> runtime_event_to_input(const std::string &event_json) {
  namespace in = session::input;
  const auto parsed = common::json_parse_object(event_json);
  if (!parsed.has_value()) {
    return InputResult::failure("runtime event must be a JSON object");
  }
  const auto &f = *parsed;
  const auto kind = common::json_string_field(f, "kind");
  if (!kind.has_value()) {
    return InputResult::failure("runtime event kind is required");
  }

  if (*kind == "turn_started") {
    return InputResult::success(in::TurnStarted{});
  }
  if (*kind == "turn_completed") {
    return InputResult::success(in::TurnCompleted{});
  }
  if (*kind == "turn_aborted") {
    return InputResult::success(
        in::TurnAborted{.reason = common::json_string_field(f, "reason").value_or("")});
  }
  if (*kind == "message_created") {
    const auto raw = common::json_raw_field(f, "message");
    if (!raw.has_value()) {
      return missing(*kind, "message");
    }
    auto message = session::message_from_json(*raw);
    if (!message.ok()) {
      return InputResult::failure(message.error());
    }
    return InputResult::success(in::MessageCreated{.message = message.take()});
  }
  if (*kind == "message_updated") {
    auto message_id = common::json_string_field(f, "message_id");
    if (!message_id.has_value()) {
      return missing(*kind, "message_id");
    }
    return InputResult::success(
        in::MessageUpdated{.message_id = std::move(*message_id),
                           .content = common::json_string_field(f, "content"),
                           .tool_output = common::json_string_field(f, "tool_output"),
                           .is_error = common::json_bool_field(f, "is_error"),
                           .duration_ms = common::json_u64_field(f, "duration_ms")});
  }
  if (*kind == "approval_requested") {
    auto request_id = common::json_string_field(f, "request_id");
    if (!request_id.has_value() || request_id->empty()) {
      return missing(*kind, "request_id");
    }
    const auto type_name = common::json_string_field(f, "approval_type").value_or("exec");
    const auto approval_type = session::parse_approval_type(type_name);
    if (!approval_type.has_value()) {
      return InputResult::failure("unknown approval type: " + type_name);
    }
    return InputResult::success(
        in::ApprovalRequested{.request_id = std::move(*request_id),
                              .approval_type = *approval_type,
                              .command = common::json_string_field(f, "command"),
                              .file_path = common::json_string_field(f, "file_path"),
                              .diff = common::json_string_field(f, "diff"),
                              .question = common::json_string_field(f, "question"),
                              .proposed_amendment = string_list_field(f, "proposed_amendment")});
  }
  if (*kind == "tokens_updated") {
    const auto raw = common::json_raw_field(f, "usage");
    if (!raw.has_value()) {
      return missing(*kind, "usage");
    }
    auto usage = session::token_usage_from_json(*raw);
    if (!usage.ok()) {
      return InputResult::failure(usage.error());
    }
    return InputResult::success(in::TokensUpdated{.usage = usage.value()});
  }
  if (*kind == "diff_updated") {
    auto diff = common::json_string_field(f, "diff");
    if (!diff.has_value()) {
      return missing(*kind, "diff");
    }
    return InputResult::success(in::DiffUpdated{.diff = std::move(*diff)});
  }
  if (*kind == "plan_updated") {
    auto plan = common::json_string_field(f, "plan");
    if (!plan.has_value()) {
      return missing(*kind, "plan");
    }
    return InputResult::success(in::PlanUpdated{.plan = std::move(*plan)});
  }
  if (*kind == "name_updated") {
    auto name = common::json_string_field(f, "name");
    if (!name.has_value()) {
      return missing(*kind, "name");
    }
    return InputResult::success(in::NameUpdated{.name = std::move(*name)});
  }
  if (*kind == "session_ended") {
    return InputResult::success(
        in::SessionEnded{.reason = common::json_string_field(f, "reason").value_or("completed")});
  }
  if (*kind == "context_compacted") {
    return InputResult::success(in::ContextCompacted{});
  }
  if (*kind == "undo_started") {
    return InputResult::success(in::UndoStarted{.message = common::json_string_field(f, "message")});
  }
  if (*kind == "undo_completed") {
    return InputResult::success(
        in::UndoCompleted{.success = common::json_bool_field(f, "success").value_or(false),
                          .message = common::json_string_field(f, "message")});
  }
  if (*kind == "rolled_back") {
    const auto turns = turns_field(f);
    if (!turns.has_value()) {
      return InputResult::failure("rolled_back requires num_turns >= 1");
    }
    return InputResult::success(in::RolledBack{.num_turns = *turns});
  }
  if (*kind == "error") {
    return InputResult::success(
        in::Error{.message = common::json_string_field(f, "message").value_or(""),
                  .origin = in::ErrorOrigin::Runtime});
  }
  if (*kind == "model_updated") {
    auto model = common::json_string_field(f, "model");
    if (!model.has_value()) {
      return missing(*kind, "model");
    }
    return InputResult::success(in::ModelUpdated{.model = std::move(*model)});
  }
  if (*kind == "environment_changed") {
    return InputResult::success(
        in::EnvironmentChanged{.cwd = common::json_string_field(f, "cwd"),
                               .git_branch = common::json_string_field(f, "git_branch"),
                               .git_sha = common::json_string_field(f, "git_sha")});
  }
  return InputResult::failure("unknown runtime event kind: " + *kind);
}

std::string encode_session_snapshot(const session::SessionState &state) {
  return common::JsonObjectWriter()
      .add("type", "session_snapshot")
      .add("session_id", state.id)
      .add("revision", state.revision)
      .add_raw("session", session::to_json(state))
      .str();
}

std::string encode_replay(const std::string &session_id,
                          const std::vector<session::LoggedEventPtr> &events,
                          const std::uint64_t revision) {
  std::vector<std::string> raw;
  raw.reserve(events.size());
  for (const auto &event : events) {
    raw.push_back(event->json);
  }
  return common::JsonObjectWriter()
      .add("type", "replay")
      .add("session_id", session_id)
      .add("revision", revision)
      .add_raw("events", common::json_array(raw))
      .str();
}

std::string encode_event(const session::LoggedEvent &event) {
  return common::JsonObjectWriter()
      .add("type", "event")
      .add("session_id", event.event.session_id)
      .add("revision", event.event.revision)
      .add_raw("event", event.json)
      .str();
}

std::string encode_sessions_list(const std::vector<session::SessionSummary> &sessions) {
  std::vector<std::string> raw;
  raw.reserve(sessions.size());
  for (const auto &summary : sessions) {
    raw.push_back(session::to_json(summary));
  }
  return common::JsonObjectWriter()
      .add("type", "sessions_list")
      .add_raw("sessions", common::json_array(raw))
      .str();
}

std::string encode_session_list_event(const session::ListEvent &event) {
  return common::JsonObjectWriter()
      .add("type", "session_list_event")
      .add("kind", std::string(session::list_event_kind_name(event.kind)))
      .add_raw("session", session::to_json(event.summary))
      .str();
}

std::string encode_resync_required(const std::string &session_id, const std::string &reason) {
  return common::JsonObjectWriter()
      .add("type", "resync_required")
      .add("session_id", session_id)
      .add("reason", reason)
      .str();
}

std::string encode_ack(const std::string &type, const std::optional<std::string> &id,
                       const std::optional<std::string> &session_id) {
  return common::JsonObjectWriter()
      .add("type", "ack")
      .add("request_type", type)
      .add_optional("id", id)
      .add_optional("session_id", session_id)
      .str();
}

std::string encode_error(const std::string &code, const std::string &message,
                         const std::optional<std::string> &session_id,
                         const std::optional<std::string> &id) {
  return common::JsonObjectWriter()
      .add("type", "error")
      .add("code", code)
      .add("message", message)
      .add_optional("session_id", session_id)
      .add_optional("id", id)
      .str();
}

} // namespace orbitcore::gateway
