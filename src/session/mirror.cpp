#include "orbitcore/session/mirror.hpp"

#include <algorithm>
#include <type_traits>

namespace orbitcore::session {

namespace {

template <typename T>
void assign_if(std::optional<T> &field, const std::optional<std::optional<T>> &change) {
  if (change.has_value()) {
    field = *change;
  }
}

WorkPhase phase_for(const WorkStatus status, const std::optional<ApprovalRequest> &pending,
                    const WorkPhase &current) {
  switch (status) {
  case WorkStatus::Waiting:
    return IdlePhase{};
  case WorkStatus::Working:
    return WorkingPhase{};
  case WorkStatus::Permission:
  case WorkStatus::Question:
    if (pending.has_value()) {
      return AwaitingApprovalPhase{.request_id = pending->id,
                                   .approval_type = pending->approval_type,
                                   .proposed_amendment = pending->proposed_amendment};
    }
    return current;
  case WorkStatus::Ended:
    return current;
  }
  return current;
}

} // namespace

common::Status SessionMirror::apply(const SessionEvent &event) {
  if (event.revision <= state_.revision) {
    return common::Status::success();
  }
  if (event.revision != state_.revision + 1) {
    return common::Status::error("revision gap: have " + std::to_string(state_.revision) +
                                 ", got " + std::to_string(event.revision));
  }

  std::visit(
      [&](const auto &payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, event::SessionDelta>) {
          apply_changes(payload.changes);
        } else if constexpr (std::is_same_v<T, event::MessageAppended>) {
          state_.messages.push_back(payload.message);
          if (payload.message.type == MessageType::Tool) {
            state_.tool_count += 1;
          }
        } else if constexpr (std::is_same_v<T, event::MessageUpdated>) {
          auto it = std::find_if(state_.messages.begin(), state_.messages.end(),
                                 [&](const Message &m) { return m.id == payload.message_id; });
          if (it != state_.messages.end()) {
            const auto &c = payload.changes;
            if (c.content.has_value()) {
              it->content = *c.content;
            }
            if (c.tool_output.has_value()) {
              it->tool_output = c.tool_output;
            }
            if (c.is_error.has_value()) {
              it->is_error = *c.is_error;
            }
            if (c.duration_ms.has_value()) {
              it->duration_ms = c.duration_ms;
            }
          }
        } else if constexpr (std::is_same_v<T, event::ApprovalRequested>) {
          state_.pending_approval = payload.request;
          state_.phase =
              AwaitingApprovalPhase{.request_id = payload.request.id,
                                    .approval_type = payload.request.approval_type,
                                    .proposed_amendment = payload.request.proposed_amendment};
        } else if constexpr (std::is_same_v<T, event::TokensUpdated>) {
          state_.token_usage = payload.usage;
        } else if constexpr (std::is_same_v<T, event::SessionEnded>) {
          state_.phase = EndedPhase{.reason = payload.reason};
          state_.ended_at = event.timestamp;
          state_.pending_approval.reset();
        } else if constexpr (std::is_same_v<T, event::TurnDiffSnapshot>) {
          state_.turn_diffs.push_back(payload.turn_diff);
        }
        // Compaction, undo and rollback notices carry no state.
      },
      event.payload);

  state_.revision = event.revision;
  state_.last_activity_at = event.timestamp;
  return common::Status::success();
}

void SessionMirror::apply_changes(const StateChanges &changes) {
  assign_if(state_.ended_at, changes.ended_at);
  assign_if(state_.current_turn_id, changes.current_turn_id);
  if (changes.turn_count.has_value()) {
    state_.turn_count = *changes.turn_count;
  }
  assign_if(state_.current_diff, changes.current_diff);
  assign_if(state_.current_plan, changes.current_plan);
  assign_if(state_.custom_name, changes.custom_name);
  assign_if(state_.model, changes.model);
  assign_if(state_.approval_policy, changes.approval_policy);
  assign_if(state_.sandbox_mode, changes.sandbox_mode);
  assign_if(state_.current_cwd, changes.current_cwd);
  assign_if(state_.git_branch, changes.git_branch);
  assign_if(state_.git_sha, changes.git_sha);
  assign_if(state_.pending_approval, changes.pending_approval);
  if (changes.work_status.has_value()) {
    state_.phase = phase_for(*changes.work_status, state_.pending_approval, state_.phase);
  } else if (changes.status == SessionStatus::Active && is_ended(state_.phase)) {
    state_.phase = IdlePhase{};
  }
}

} // namespace orbitcore::session
