#include "orbitcore/session/codec.hpp"

#include <type_traits>

namespace orbitcore::session {

namespace {

using common::JsonObjectWriter;

std::string string_list_json(const std::vector<std::string> &values) {
  std::vector<std::string> quoted;
  quoted.reserve(values.size());
  for (const auto &value : values) {
    quoted.push_back(common::json_quote(value));
  }
  return common::json_array(quoted);
}

void add_amendment(JsonObjectWriter &writer,
                   const std::optional<std::vector<std::string>> &amendment) {
  if (amendment.has_value()) {
    writer.add_raw("proposed_amendment", string_list_json(*amendment));
  }
}

void add_payload_fields(JsonObjectWriter &writer, const EventPayload &payload) {
  std::visit(
      [&writer](const auto &p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, event::SessionDelta>) {
          writer.add_raw("changes", to_json(p.changes));
        } else if constexpr (std::is_same_v<T, event::MessageAppended>) {
          writer.add_raw("message", to_json(p.message));
        } else if constexpr (std::is_same_v<T, event::MessageUpdated>) {
          JsonObjectWriter changes;
          changes.add_optional("content", p.changes.content)
              .add_optional("tool_output", p.changes.tool_output)
              .add_optional_bool("is_error", p.changes.is_error)
              .add_optional("duration_ms", p.changes.duration_ms);
          writer.add("message_id", p.message_id).add_raw("changes", changes.str());
        } else if constexpr (std::is_same_v<T, event::ApprovalRequested>) {
          writer.add_raw("request", to_json(p.request));
        } else if constexpr (std::is_same_v<T, event::TokensUpdated>) {
          writer.add_raw("usage", to_json(p.usage));
        } else if constexpr (std::is_same_v<T, event::SessionEnded>) {
          writer.add("reason", p.reason);
        } else if constexpr (std::is_same_v<T, event::TurnDiffSnapshot>) {
          writer.add_raw("turn_diff", to_json(p.turn_diff));
        } else if constexpr (std::is_same_v<T, event::UndoStarted>) {
          writer.add_optional("message", p.message);
        } else if constexpr (std::is_same_v<T, event::UndoCompleted>) {
          writer.add_bool("success", p.success).add_optional("message", p.message);
        } else if constexpr (std::is_same_v<T, event::ThreadRolledBack>) {
          writer.add("num_turns", static_cast<std::uint64_t>(p.num_turns));
        }
      },
      payload);
}

} // namespace

std::string to_json(const TokenUsage &usage) {
  return JsonObjectWriter()
      .add("input_tokens", usage.input_tokens)
      .add("output_tokens", usage.output_tokens)
      .add("cached_tokens", usage.cached_tokens)
      .add("context_window", usage.context_window)
      .str();
}

std::string to_json(const Message &message) {
  return JsonObjectWriter()
      .add("id", message.id)
      .add("session_id", message.session_id)
      .add("type", std::string(to_string(message.type)))
      .add("content", message.content)
      .add_optional("tool_name", message.tool_name)
      .add_optional("tool_input", message.tool_input)
      .add_optional("tool_output", message.tool_output)
      .add_bool("is_error", message.is_error)
      .add("timestamp", message.timestamp)
      .add_optional("duration_ms", message.duration_ms)
      .str();
}

std::string to_json(const ApprovalRequest &request) {
  JsonObjectWriter writer;
  writer.add("id", request.id)
      .add("session_id", request.session_id)
      .add("approval_type", std::string(to_string(request.approval_type)))
      .add_optional("command", request.command)
      .add_optional("file_path", request.file_path)
      .add_optional("diff", request.diff)
      .add_optional("question", request.question);
  add_amendment(writer, request.proposed_amendment);
  return writer.str();
}

std::string to_json(const TurnDiff &turn_diff) {
  return JsonObjectWriter()
      .add("turn_id", turn_diff.turn_id)
      .add("diff", turn_diff.diff)
      .add_raw("token_usage", to_json(turn_diff.token_usage))
      .str();
}

std::string to_json(const StateChanges &changes) {
  JsonObjectWriter writer;
  if (changes.status.has_value()) {
    writer.add("status", std::string(to_string(*changes.status)));
  }
  if (changes.work_status.has_value()) {
    writer.add("work_status", std::string(to_string(*changes.work_status)));
  }
  writer.add_optional("last_activity_at", changes.last_activity_at)
      .add_nullable("ended_at", changes.ended_at)
      .add_nullable("current_turn_id", changes.current_turn_id)
      .add_optional("turn_count", changes.turn_count)
      .add_nullable("current_diff", changes.current_diff)
      .add_nullable("current_plan", changes.current_plan)
      .add_nullable("custom_name", changes.custom_name)
      .add_nullable("model", changes.model)
      .add_nullable("approval_policy", changes.approval_policy)
      .add_nullable("sandbox_mode", changes.sandbox_mode)
      .add_nullable("current_cwd", changes.current_cwd)
      .add_nullable("git_branch", changes.git_branch)
      .add_nullable("git_sha", changes.git_sha);
  if (changes.pending_approval.has_value()) {
    if (changes.pending_approval->has_value()) {
      writer.add_raw("pending_approval", to_json(**changes.pending_approval));
    } else {
      writer.add_null("pending_approval");
    }
  }
  return writer.str();
}

std::string to_json(const SessionSummary &summary) {
  return JsonObjectWriter()
      .add("id", summary.id)
      .add("provider", summary.provider)
      .add("project_path", summary.project_path)
      .add_optional("project_name", summary.project_name)
      .add_optional("model", summary.model)
      .add_optional("custom_name", summary.custom_name)
      .add("status", std::string(to_string(summary.status)))
      .add("work_status", std::string(to_string(summary.work_status)))
      .add("revision", summary.revision)
      .add("message_count", static_cast<std::uint64_t>(summary.message_count))
      .add("tool_count", summary.tool_count)
      .add("started_at", summary.started_at)
      .add_optional("last_activity_at", summary.last_activity_at)
      .str();
}

std::string to_json(const WorkPhase &phase) {
  JsonObjectWriter writer;
  writer.add("kind", std::string(phase_name(phase)));
  if (const auto *awaiting = std::get_if<AwaitingApprovalPhase>(&phase)) {
    writer.add("request_id", awaiting->request_id)
        .add("approval_type", std::string(to_string(awaiting->approval_type)));
    add_amendment(writer, awaiting->proposed_amendment);
  } else if (const auto *ended = std::get_if<EndedPhase>(&phase)) {
    writer.add("reason", ended->reason);
  }
  return writer.str();
}

std::string to_json(const SessionState &state) {
  std::vector<std::string> messages;
  messages.reserve(state.messages.size());
  for (const auto &message : state.messages) {
    messages.push_back(to_json(message));
  }
  std::vector<std::string> turn_diffs;
  turn_diffs.reserve(state.turn_diffs.size());
  for (const auto &turn_diff : state.turn_diffs) {
    turn_diffs.push_back(to_json(turn_diff));
  }

  JsonObjectWriter writer;
  writer.add("id", state.id)
      .add("revision", state.revision)
      .add("status", std::string(to_string(is_ended(state.phase) ? SessionStatus::Ended
                                                                  : SessionStatus::Active)))
      .add("work_status", std::string(to_string(to_work_status(state.phase))))
      .add_raw("phase", to_json(state.phase))
      .add("provider", state.provider)
      .add("project_path", state.project_path)
      .add_optional("project_name", state.project_name)
      .add_optional("model", state.model)
      .add_optional("custom_name", state.custom_name)
      .add_optional("approval_policy", state.approval_policy)
      .add_optional("sandbox_mode", state.sandbox_mode)
      .add_optional("forked_from", state.forked_from)
      .add("started_at", state.started_at)
      .add_optional("last_activity_at", state.last_activity_at)
      .add_optional("ended_at", state.ended_at)
      .add_raw("token_usage", to_json(state.token_usage))
      .add_optional("current_diff", state.current_diff)
      .add_optional("current_plan", state.current_plan)
      .add_optional("current_turn_id", state.current_turn_id)
      .add("turn_count", state.turn_count)
      .add("tool_count", state.tool_count)
      .add_optional("current_cwd", state.current_cwd)
      .add_optional("git_branch", state.git_branch)
      .add_optional("git_sha", state.git_sha);
  if (state.pending_approval.has_value()) {
    writer.add_raw("pending_approval", to_json(*state.pending_approval));
  }
  writer.add_raw("messages", common::json_array(messages))
      .add_raw("turn_diffs", common::json_array(turn_diffs));
  return writer.str();
}

std::string to_json(const SessionEvent &event) {
  JsonObjectWriter writer;
  writer.add("type", std::string(payload_type(event.payload)))
      .add("session_id", event.session_id)
      .add("revision", event.revision)
      .add("timestamp", event.timestamp);
  add_payload_fields(writer, event.payload);
  return writer.str();
}

common::Result<TokenUsage> token_usage_from_json(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  if (!fields.has_value()) {
    return common::Result<TokenUsage>::failure("token usage must be a JSON object");
  }
  TokenUsage usage;
  usage.input_tokens = common::json_u64_field(*fields, "input_tokens").value_or(0);
  usage.output_tokens = common::json_u64_field(*fields, "output_tokens").value_or(0);
  usage.cached_tokens = common::json_u64_field(*fields, "cached_tokens").value_or(0);
  usage.context_window = common::json_u64_field(*fields, "context_window").value_or(0);
  return common::Result<TokenUsage>::success(usage);
}

common::Result<Message> message_from_json(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  if (!fields.has_value()) {
    return common::Result<Message>::failure("message must be a JSON object");
  }
  const auto type_name = common::json_string_field(*fields, "type");
  if (!type_name.has_value()) {
    return common::Result<Message>::failure("message.type is required");
  }
  const auto type = parse_message_type(*type_name);
  if (!type.has_value()) {
    return common::Result<Message>::failure("unknown message type: " + *type_name);
  }

  Message message;
  message.id = common::json_string_field(*fields, "id").value_or("");
  message.session_id = common::json_string_field(*fields, "session_id").value_or("");
  message.type = *type;
  message.content = common::json_string_field(*fields, "content").value_or("");
  message.tool_name = common::json_string_field(*fields, "tool_name");
  message.tool_input = common::json_string_field(*fields, "tool_input");
  message.tool_output = common::json_string_field(*fields, "tool_output");
  message.is_error = common::json_bool_field(*fields, "is_error").value_or(false);
  message.timestamp = common::json_string_field(*fields, "timestamp").value_or("");
  message.duration_ms = common::json_u64_field(*fields, "duration_ms");
  return common::Result<Message>::success(std::move(message));
}

std::optional<std::vector<std::string>> string_list_from_json(const std::string &json) {
  const auto elements = common::json_split_array(json);
  if (!elements.has_value()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  out.reserve(elements->size());
  for (const auto &element : *elements) {
    auto value = common::json_as_string(element);
    if (!value.has_value()) {
      return std::nullopt;
    }
    out.push_back(std::move(*value));
  }
  return out;
}

} // namespace orbitcore::session
