#include "orbitcore/session/transition.hpp"

#include "orbitcore/common/ids.hpp"

#include <algorithm>
#include <type_traits>

namespace orbitcore::session {

namespace {

constexpr std::size_t USER_ECHO_WINDOW = 5;

/// Accumulates effects for one step. Emitting stamps the next revision.
class Step {
public:
  Step(SessionState state, const std::string &now) : state_(std::move(state)), now_(now) {}

  SessionState &state() { return state_; }
  [[nodiscard]] const std::string &now() const { return now_; }

  void persist(PersistOp op) { effects_.push_back(PersistEffect{.op = std::move(op)}); }

  void call(RuntimeCall call) {
    effects_.push_back(RuntimeCallEffect{.call = std::move(call)});
  }

  void emit(EventPayload payload) {
    state_.last_activity_at = now_;
    state_.revision += 1;
    effects_.push_back(
        EmitEffect{.revision = state_.revision, .timestamp = now_, .payload = std::move(payload)});
  }

  TransitionResult finish() {
    return TransitionResult{
        .state = std::move(state_), .effects = std::move(effects_), .rejection = std::nullopt};
  }

private:
  SessionState state_;
  const std::string &now_;
  std::vector<Effect> effects_;
};

bool pending_request_matches(const WorkPhase &phase, const std::string &request_id) {
  const auto *awaiting = std::get_if<AwaitingApprovalPhase>(&phase);
  return awaiting != nullptr && awaiting->request_id == request_id;
}

std::optional<std::string> check_allowed(const WorkPhase &phase, const Input &input) {
  const bool idle = std::holds_alternative<IdlePhase>(phase);
  const bool working = std::holds_alternative<WorkingPhase>(phase);
  const bool awaiting = std::holds_alternative<AwaitingApprovalPhase>(phase);
  const bool ended = is_ended(phase);

  const std::string reason =
      std::string(input_name(input)) + " is not valid in phase " + std::string(phase_name(phase));

  if (std::holds_alternative<input::Resume>(input)) {
    return ended ? std::nullopt : std::optional<std::string>(reason);
  }
  if (ended) {
    return reason;
  }

  const bool allowed = std::visit(
      [&](const auto &in) -> bool {
        using T = std::decay_t<decltype(in)>;
        if constexpr (std::is_same_v<T, input::TurnStarted> ||
                      std::is_same_v<T, input::UndoStarted> ||
                      std::is_same_v<T, input::UndoCompleted> ||
                      std::is_same_v<T, input::RolledBack> ||
                      std::is_same_v<T, input::UserSteered>) {
          return idle || working;
        } else if constexpr (std::is_same_v<T, input::TurnCompleted>) {
          return working;
        } else if constexpr (std::is_same_v<T, input::TurnAborted> ||
                             std::is_same_v<T, input::UserInterrupted>) {
          return working || awaiting;
        } else if constexpr (std::is_same_v<T, input::ApprovalRequested>) {
          return working && !in.request_id.empty();
        } else if constexpr (std::is_same_v<T, input::UserApproved>) {
          return pending_request_matches(phase, in.request_id);
        } else if constexpr (std::is_same_v<T, input::UserAnsweredQuestion>) {
          const auto *p = std::get_if<AwaitingApprovalPhase>(&phase);
          return p != nullptr && p->approval_type == ApprovalType::Question &&
                 p->request_id == in.request_id;
        } else if constexpr (std::is_same_v<T, input::UserSentMessage> ||
                             std::is_same_v<T, input::UserCompacted> ||
                             std::is_same_v<T, input::UserUndid> ||
                             std::is_same_v<T, input::UserRolledBack>) {
          return idle;
        } else {
          // Error, end, metadata and message inputs apply in any live phase.
          return true;
        }
      },
      input);

  if (allowed) {
    return std::nullopt;
  }
  return reason;
}

/// Moves to `phase`, persisting the new work status and emitting one delta.
void set_phase(Step &step, WorkPhase phase, StateChanges changes = {}) {
  auto &state = step.state();
  state.phase = std::move(phase);
  const WorkStatus status = to_work_status(state.phase);
  changes.work_status = status;
  changes.last_activity_at = step.now();
  step.persist(persist::SessionUpdate{
      .status = std::nullopt, .work_status = status, .last_activity_at = step.now()});
  step.emit(event::SessionDelta{.changes = std::move(changes)});
}

void append_message(Step &step, Message message) {
  step.state().messages.push_back(message);
  step.persist(persist::MessageAppend{.message = message});
  step.emit(event::MessageAppended{.message = std::move(message)});
}

Message user_message(Step &step, const MessageType type, const std::string &content) {
  const auto &state = step.state();
  return Message{
      .id = derive_message_id(state.id, state.revision, step.now(), content),
      .session_id = state.id,
      .type = type,
      .content = content,
      .timestamp = step.now(),
  };
}

bool is_user_echo(const SessionState &state, const Message &message) {
  if (message.type != MessageType::User) {
    return false;
  }
  std::size_t seen = 0;
  for (auto it = state.messages.rbegin(); it != state.messages.rend() && seen < USER_ECHO_WINDOW;
       ++it, ++seen) {
    if (it->type == MessageType::User && it->content == message.content) {
      return true;
    }
  }
  return false;
}

void end_session(Step &step, const std::string &reason) {
  auto &state = step.state();
  state.phase = EndedPhase{.reason = reason};
  state.ended_at = step.now();
  state.pending_approval.reset();
  step.persist(persist::SessionEnd{.reason = reason, .ended_at = step.now()});
  step.emit(event::SessionEnded{.reason = reason});
}

std::string tool_name_for(const ApprovalType type) {
  switch (type) {
  case ApprovalType::Exec:
    return "Bash";
  case ApprovalType::Patch:
    return "Edit";
  case ApprovalType::Question:
    return "Question";
  }
  return "Bash";
}

/// Clears the pending approval and reports the clear in `changes`.
void clear_pending_approval(SessionState &state, StateChanges &changes) {
  if (state.pending_approval.has_value() ||
      std::holds_alternative<AwaitingApprovalPhase>(state.phase)) {
    state.pending_approval.reset();
    changes.pending_approval = std::optional<ApprovalRequest>{};
  }
}

class Applier {
public:
  explicit Applier(Step &step) : step_(step), state_(step.state()) {}

  void operator()(const input::TurnStarted &) {
    state_.turn_count += 1;
    const std::string turn_id = "turn-" + std::to_string(state_.turn_count);
    state_.current_turn_id = turn_id;
    step_.persist(persist::TurnStateUpdate{
        .current_turn_id = std::optional<std::string>(turn_id), .turn_count = state_.turn_count});
    set_phase(step_, WorkingPhase{},
              StateChanges{.current_turn_id = std::optional<std::string>(turn_id),
                           .turn_count = state_.turn_count});
  }

  void operator()(const input::TurnCompleted &) {
    if (state_.current_turn_id.has_value() && state_.current_diff.has_value()) {
      TurnDiff snapshot{.turn_id = *state_.current_turn_id,
                        .diff = *state_.current_diff,
                        .token_usage = state_.token_usage};
      state_.turn_diffs.push_back(snapshot);
      step_.persist(persist::TurnDiffInsert{.turn_diff = snapshot});
      step_.emit(event::TurnDiffSnapshot{.turn_diff = std::move(snapshot)});
    }
    finish_turn();
  }

  void operator()(const input::TurnAborted &) { finish_turn(); }

  void operator()(const input::MessageCreated &in) {
    Message message = in.message;
    message.session_id = state_.id;
    if (message.timestamp.empty()) {
      message.timestamp = step_.now();
    }
    if (message.id.empty()) {
      message.id = derive_message_id(state_.id, state_.revision, step_.now(), message.content);
    }
    if (is_user_echo(state_, message)) {
      return;
    }
    const bool is_tool = message.type == MessageType::Tool;
    state_.messages.push_back(message);
    step_.persist(persist::MessageAppend{.message = message});
    if (is_tool) {
      state_.tool_count += 1;
      step_.persist(persist::ToolCountIncrement{.last_activity_at = step_.now()});
    }
    step_.emit(event::MessageAppended{.message = std::move(message)});
  }

  void operator()(const input::MessageUpdated &in) {
    auto it = std::find_if(state_.messages.begin(), state_.messages.end(),
                           [&](const Message &m) { return m.id == in.message_id; });
    if (it != state_.messages.end()) {
      if (in.content.has_value()) {
        it->content = *in.content;
      }
      if (in.tool_output.has_value()) {
        it->tool_output = in.tool_output;
      }
      if (in.is_error.has_value()) {
        it->is_error = *in.is_error;
      }
      if (in.duration_ms.has_value()) {
        it->duration_ms = in.duration_ms;
      }
    }
    step_.persist(persist::MessageUpdate{.message_id = in.message_id,
                                         .content = in.content,
                                         .tool_output = in.tool_output,
                                         .is_error = in.is_error,
                                         .duration_ms = in.duration_ms});
    step_.emit(event::MessageUpdated{.message_id = in.message_id,
                                     .changes = MessageChanges{.content = in.content,
                                                               .tool_output = in.tool_output,
                                                               .is_error = in.is_error,
                                                               .duration_ms = in.duration_ms}});
  }

  void operator()(const input::ApprovalRequested &in) {
    ApprovalRequest request{.id = in.request_id,
                            .session_id = state_.id,
                            .approval_type = in.approval_type,
                            .command = in.command,
                            .file_path = in.file_path,
                            .diff = in.diff,
                            .question = in.question,
                            .proposed_amendment = in.proposed_amendment};
    state_.phase = AwaitingApprovalPhase{.request_id = in.request_id,
                                         .approval_type = in.approval_type,
                                         .proposed_amendment = in.proposed_amendment};
    state_.pending_approval = request;

    step_.persist(persist::ApprovalRequested{
        .request = request,
        .tool_name = tool_name_for(in.approval_type),
        .cwd = state_.current_cwd.has_value() ? state_.current_cwd
                                              : std::optional<std::string>(state_.project_path)});
    step_.persist(persist::SessionUpdate{.status = std::nullopt,
                                         .work_status = to_work_status(state_.phase),
                                         .last_activity_at = step_.now()});
    step_.emit(event::ApprovalRequested{.request = std::move(request)});
  }

  void operator()(const input::TokensUpdated &in) {
    state_.token_usage = in.usage;
    step_.persist(persist::TokensUpdate{.usage = in.usage});
    step_.emit(event::TokensUpdated{.usage = in.usage});
  }

  void operator()(const input::DiffUpdated &in) {
    state_.current_diff = in.diff;
    step_.persist(persist::TurnStateUpdate{.diff = in.diff});
    step_.emit(event::SessionDelta{
        .changes = StateChanges{.current_diff = std::optional<std::string>(in.diff)}});
  }

  void operator()(const input::PlanUpdated &in) {
    state_.current_plan = in.plan;
    step_.persist(persist::TurnStateUpdate{.plan = in.plan});
    step_.emit(event::SessionDelta{
        .changes = StateChanges{.current_plan = std::optional<std::string>(in.plan)}});
  }

  void operator()(const input::NameUpdated &in) {
    state_.custom_name = in.name;
    step_.persist(persist::SetCustomName{.custom_name = in.name});
    step_.emit(event::SessionDelta{
        .changes = StateChanges{.custom_name = std::optional<std::string>(in.name)}});
  }

  void operator()(const input::SessionEnded &in) { end_session(step_, in.reason); }

  void operator()(const input::ContextCompacted &) { step_.emit(event::ContextCompacted{}); }

  void operator()(const input::UndoStarted &in) {
    set_phase(step_, WorkingPhase{});
    step_.emit(event::UndoStarted{.message = in.message});
  }

  void operator()(const input::UndoCompleted &in) {
    set_phase(step_, IdlePhase{});
    step_.emit(event::UndoCompleted{.success = in.success, .message = in.message});
  }

  void operator()(const input::RolledBack &in) {
    set_phase(step_, IdlePhase{});
    step_.emit(event::ThreadRolledBack{.num_turns = in.num_turns});
  }

  void operator()(const input::Error &) {
    StateChanges changes;
    clear_pending_approval(state_, changes);
    set_phase(step_, IdlePhase{}, std::move(changes));
  }

  void operator()(const input::ModelUpdated &in) {
    state_.model = in.model;
    step_.persist(persist::ModelUpdate{.model = in.model});
    step_.emit(event::SessionDelta{
        .changes = StateChanges{.model = std::optional<std::string>(in.model)}});
  }

  void operator()(const input::EnvironmentChanged &in) {
    bool changed = false;
    const auto update = [&changed](std::optional<std::string> &field,
                                   const std::optional<std::string> &value) {
      if (value.has_value() && value != field) {
        field = value;
        changed = true;
      }
    };
    update(state_.current_cwd, in.cwd);
    update(state_.git_branch, in.git_branch);
    update(state_.git_sha, in.git_sha);
    if (!changed) {
      return;
    }
    step_.persist(persist::EnvironmentUpdate{
        .cwd = state_.current_cwd, .git_branch = state_.git_branch, .git_sha = state_.git_sha});
    step_.emit(event::SessionDelta{.changes = StateChanges{.current_cwd = state_.current_cwd,
                                                           .git_branch = state_.git_branch,
                                                           .git_sha = state_.git_sha}});
  }

  void operator()(const input::UserSentMessage &in) {
    append_message(step_, user_message(step_, MessageType::User, in.content));
    StateChanges changes;
    if (in.model.has_value() && in.model != state_.model) {
      state_.model = in.model;
      step_.persist(persist::ModelUpdate{.model = *in.model});
      changes.model = in.model;
    }
    set_phase(step_, WorkingPhase{}, std::move(changes));
    step_.call(call::SendMessage{.content = in.content, .model = in.model, .effort = in.effort});
  }

  void operator()(const input::UserSteered &in) {
    if (std::holds_alternative<IdlePhase>(state_.phase)) {
      append_message(step_, user_message(step_, MessageType::User, in.content));
      set_phase(step_, WorkingPhase{});
      step_.call(call::SendMessage{.content = in.content});
      return;
    }
    append_message(step_, user_message(step_, MessageType::Steer, in.content));
    step_.call(call::Steer{.content = in.content});
  }

  void operator()(const input::UserApproved &in) {
    const auto pending = std::get<AwaitingApprovalPhase>(state_.phase);
    StateChanges changes;
    clear_pending_approval(state_, changes);
    step_.persist(persist::ApprovalDecision{
        .request_id = in.request_id, .decision = in.decision, .decided_at = step_.now()});
    if (is_approval(in.decision)) {
      set_phase(step_, WorkingPhase{}, std::move(changes));
    } else {
      set_phase(step_, IdlePhase{}, std::move(changes));
    }
    step_.call(call::Approve{.request_id = in.request_id,
                             .approval_type = pending.approval_type,
                             .decision = in.decision,
                             .proposed_amendment = pending.proposed_amendment});
  }

  void operator()(const input::UserAnsweredQuestion &in) {
    StateChanges changes;
    clear_pending_approval(state_, changes);
    step_.persist(persist::ApprovalDecision{.request_id = in.request_id,
                                            .decision = ReviewDecision::Approved,
                                            .decided_at = step_.now()});
    set_phase(step_, WorkingPhase{}, std::move(changes));
    step_.call(call::AnswerQuestion{.request_id = in.request_id, .answer = in.answer});
  }

  void operator()(const input::UserRenamed &in) {
    state_.custom_name = in.name;
    step_.persist(persist::SetCustomName{.custom_name = in.name});
    step_.call(call::SetName{.name = in.name});
    step_.emit(event::SessionDelta{.changes = StateChanges{.custom_name = in.name}});
  }

  void operator()(const input::UserChangedConfig &in) {
    StateChanges changes;
    if (in.approval_policy.has_value()) {
      state_.approval_policy = in.approval_policy;
      changes.approval_policy = in.approval_policy;
    }
    if (in.sandbox_mode.has_value()) {
      state_.sandbox_mode = in.sandbox_mode;
      changes.sandbox_mode = in.sandbox_mode;
    }
    step_.persist(persist::SetSessionConfig{.approval_policy = in.approval_policy,
                                            .sandbox_mode = in.sandbox_mode});
    step_.call(call::UpdateConfig{.approval_policy = in.approval_policy,
                                  .sandbox_mode = in.sandbox_mode});
    step_.emit(event::SessionDelta{.changes = std::move(changes)});
  }

  void operator()(const input::UserInterrupted &) { step_.call(call::Interrupt{}); }

  void operator()(const input::UserCompacted &) {
    set_phase(step_, WorkingPhase{});
    step_.call(call::Compact{});
  }

  void operator()(const input::UserUndid &) {
    set_phase(step_, WorkingPhase{});
    step_.call(call::Undo{});
  }

  void operator()(const input::UserRolledBack &in) {
    set_phase(step_, WorkingPhase{});
    step_.call(call::Rollback{.num_turns = in.num_turns});
  }

  void operator()(const input::UserEnded &) {
    end_session(step_, "user_requested");
    step_.call(call::Shutdown{});
  }

  void operator()(const input::Resume &) {
    state_.phase = IdlePhase{};
    state_.ended_at.reset();
    step_.persist(persist::Reactivate{.last_activity_at = step_.now()});
    step_.emit(event::SessionDelta{.changes = StateChanges{
                                       .status = SessionStatus::Active,
                                       .work_status = WorkStatus::Waiting,
                                       .last_activity_at = step_.now(),
                                       .ended_at = std::optional<std::string>{},
                                   }});
    step_.call(call::Resume{});
  }

private:
  void finish_turn() {
    StateChanges changes{.current_turn_id = std::optional<std::string>{}};
    state_.current_turn_id.reset();
    clear_pending_approval(state_, changes);
    step_.persist(persist::TurnStateUpdate{.current_turn_id = std::optional<std::string>{}});
    set_phase(step_, IdlePhase{}, std::move(changes));
  }

  Step &step_;
  SessionState &state_;
};

} // namespace

TransitionResult transition(SessionState state, const Input &input, const std::string &now) {
  if (auto rejection = check_allowed(state.phase, input); rejection.has_value()) {
    return TransitionResult{
        .state = std::move(state), .effects = {}, .rejection = std::move(rejection)};
  }

  Step step(std::move(state), now);
  std::visit(Applier(step), input);
  return step.finish();
}

std::string derive_message_id(const std::string &session_id, const std::uint64_t revision,
                              const std::string &now, const std::string &content) {
  const std::string material =
      session_id + "\n" + std::to_string(revision) + "\n" + now + "\n" + content;
  return "msg-" + common::sha256_hex(material).substr(0, 32);
}

std::size_t count_emits(const std::vector<Effect> &effects) {
  return static_cast<std::size_t>(
      std::count_if(effects.begin(), effects.end(),
                    [](const Effect &e) { return std::holds_alternative<EmitEffect>(e); }));
}

} // namespace orbitcore::session
