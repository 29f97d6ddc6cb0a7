#include "test_framework.hpp"

#include "orbitcore/session/transition.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <optional>
#include <string>
#include <vector>

namespace {

namespace ss = orbitcore::session;
namespace in = orbitcore::session::input;

template <typename T> bool has_persist(const std::vector<ss::Effect> &effects) {
  for (const auto &effect : effects) {
    if (const auto *persist = std::get_if<ss::PersistEffect>(&effect)) {
      if (std::holds_alternative<T>(persist->op)) {
        return true;
      }
    }
  }
  return false;
}

template <typename T> std::optional<T> find_call(const std::vector<ss::Effect> &effects) {
  for (const auto &effect : effects) {
    if (const auto *call = std::get_if<ss::RuntimeCallEffect>(&effect)) {
      if (const auto *typed = std::get_if<T>(&call->call)) {
        return *typed;
      }
    }
  }
  return std::nullopt;
}

std::vector<ss::EmitEffect> emits(const std::vector<ss::Effect> &effects) {
  std::vector<ss::EmitEffect> out;
  for (const auto &effect : effects) {
    if (const auto *emit = std::get_if<ss::EmitEffect>(&effect)) {
      out.push_back(*emit);
    }
  }
  return out;
}

ss::SessionState apply(ss::SessionState state, const ss::Input &input, const std::string &now) {
  auto result = ss::transition(std::move(state), input, now);
  orbitcore::tests::require(result.accepted(),
                            "expected input to be accepted: " + result.rejection.value_or(""));
  return std::move(result.state);
}

ss::SessionState working_state() {
  return apply(orbitcore::testing::make_state("s-1"), in::TurnStarted{},
               orbitcore::testing::fixed_time(1));
}

ss::SessionState awaiting_state(const ss::ApprovalType type) {
  return apply(working_state(),
               in::ApprovalRequested{.request_id = "req-1",
                                     .approval_type = type,
                                     .command = std::string("rm -rf build"),
                                     .question = type == ss::ApprovalType::Question
                                                     ? std::optional<std::string>("continue?")
                                                     : std::nullopt},
               orbitcore::testing::fixed_time(2));
}

} // namespace

void register_transition_tests(std::vector<orbitcore::tests::TestCase> &tests) {
  using orbitcore::tests::require;
  using orbitcore::testing::fixed_time;
  using orbitcore::testing::make_message;
  using orbitcore::testing::make_state;

  tests.push_back({"transition_user_message_from_idle_starts_work", [] {
                     const auto state = make_state("s-1");
                     const auto result =
                         ss::transition(state, in::UserSentMessage{.content = "fix bug"},
                                        fixed_time(5));
                     require(result.accepted(), "message should be accepted when idle");
                     require(std::holds_alternative<ss::WorkingPhase>(result.state.phase),
                             "phase should be working");
                     require(has_persist<ss::persist::MessageAppend>(result.effects),
                             "message should be persisted");
                     const auto call = find_call<ss::call::SendMessage>(result.effects);
                     require(call.has_value(), "runtime should be asked to send");
                     require(call->content == "fix bug", "content should be forwarded");
                     require(result.state.messages.size() == 1, "one message expected");
                     require(result.state.messages[0].type == ss::MessageType::User,
                             "message should be a user message");
                     require(result.state.messages[0].id.rfind("msg-", 0) == 0,
                             "synthesized id should be prefixed");
                   }});

  tests.push_back({"transition_denied_approval_returns_to_idle", [] {
                     const auto awaiting = awaiting_state(ss::ApprovalType::Exec);
                     const auto *phase = std::get_if<ss::AwaitingApprovalPhase>(&awaiting.phase);
                     require(phase != nullptr, "phase should await approval");
                     require(phase->request_id == "req-1", "request id should be kept");
                     require(awaiting.pending_approval.has_value(), "pending approval expected");

                     const auto result = ss::transition(
                         awaiting,
                         in::UserApproved{.request_id = "req-1",
                                          .decision = ss::ReviewDecision::Denied},
                         fixed_time(3));
                     require(result.accepted(), "matching approval should be accepted");
                     require(std::holds_alternative<ss::IdlePhase>(result.state.phase),
                             "denial should return to idle");
                     require(!result.state.pending_approval.has_value(),
                             "pending approval should be cleared");
                     const auto call = find_call<ss::call::Approve>(result.effects);
                     require(call.has_value(), "approve call expected");
                     require(call->decision == ss::ReviewDecision::Denied, "decision mismatch");
                     require(has_persist<ss::persist::ApprovalDecision>(result.effects),
                             "decision should be persisted");
                   }});

  tests.push_back({"transition_approved_resumes_work", [] {
                     const auto result = ss::transition(
                         awaiting_state(ss::ApprovalType::Patch),
                         in::UserApproved{.request_id = "req-1",
                                          .decision = ss::ReviewDecision::ApprovedForSession},
                         fixed_time(3));
                     require(result.accepted(), "approval should be accepted");
                     require(std::holds_alternative<ss::WorkingPhase>(result.state.phase),
                             "approval should resume work");
                     const auto call = find_call<ss::call::Approve>(result.effects);
                     require(call.has_value() && call->approval_type == ss::ApprovalType::Patch,
                             "approval type should come from the pending request");
                   }});

  tests.push_back({"transition_is_deterministic", [] {
                     const auto state = working_state();
                     const ss::Input input = in::MessageCreated{
                         .message = make_message("", ss::MessageType::Assistant, "done")};
                     const auto a = ss::transition(state, input, fixed_time(9));
                     const auto b = ss::transition(state, input, fixed_time(9));
                     require(a.state == b.state, "states should match");
                     require(a.effects.size() == b.effects.size(), "effect counts should match");
                     for (std::size_t i = 0; i < a.effects.size(); ++i) {
                       require(ss::effect_name(a.effects[i]) == ss::effect_name(b.effects[i]),
                               "effect order should match");
                     }
                     const auto ea = emits(a.effects);
                     const auto eb = emits(b.effects);
                     require(ea.size() == eb.size(), "emit counts should match");
                     for (std::size_t i = 0; i < ea.size(); ++i) {
                       require(ea[i].revision == eb[i].revision, "emit revision mismatch");
                       require(ea[i].payload == eb[i].payload, "emit payload mismatch");
                     }
                   }});

  tests.push_back({"transition_revision_advances_by_emit_count", [] {
                     std::vector<ss::Input> inputs = {
                         in::UserSentMessage{.content = "hello"},
                         in::TurnStarted{},
                         in::MessageCreated{.message = make_message(
                                                "m-1", ss::MessageType::Assistant, "hi")},
                         in::DiffUpdated{.diff = "+a"},
                         in::TokensUpdated{.usage = ss::TokenUsage{.input_tokens = 10}},
                         in::ApprovalRequested{.request_id = "r-1"},
                         in::UserApproved{.request_id = "r-1",
                                          .decision = ss::ReviewDecision::Approved},
                         in::TurnCompleted{},
                         in::UserEnded{},
                         in::Resume{},
                     };
                     auto state = make_state("s-1");
                     std::uint64_t t = 10;
                     for (const auto &input : inputs) {
                       const auto before = state.revision;
                       auto result = ss::transition(state, input, fixed_time(t++));
                       require(result.accepted(), std::string("rejected ") +
                                                      std::string(ss::input_name(input)));
                       const auto emitted = emits(result.effects);
                       require(result.state.revision == before + emitted.size(),
                               "revision must advance by the emit count");
                       for (std::size_t i = 0; i < emitted.size(); ++i) {
                         require(emitted[i].revision == before + i + 1,
                                 "emits must carry consecutive revisions");
                       }
                       state = std::move(result.state);
                     }
                     require(std::holds_alternative<ss::IdlePhase>(state.phase),
                             "resume should leave the session idle");
                     require(state.turn_diffs.size() == 1, "turn diff should be snapshotted");
                   }});

  tests.push_back({"transition_invalid_input_is_a_no_op", [] {
                     const auto state = make_state("s-1");
                     const auto result = ss::transition(state, in::TurnCompleted{}, fixed_time(1));
                     require(!result.accepted(), "turn completed is invalid while idle");
                     require(result.effects.empty(), "no effects on rejection");
                     require(result.state == state, "state must not change");
                     require(result.rejection->find("turn_completed") != std::string::npos,
                             "rejection should name the input");
                   }});

  tests.push_back({"transition_ended_accepts_only_resume", [] {
                     const auto ended = apply(make_state("s-1"),
                                              in::SessionEnded{.reason = "completed"},
                                              fixed_time(1));
                     require(ss::is_ended(ended.phase), "session should be ended");
                     require(ended.ended_at.has_value(), "ended_at should be set");

                     const std::vector<ss::Input> refused = {
                         in::UserSentMessage{.content = "x"}, in::TurnStarted{},
                         in::Error{.message = "boom"}, in::NameUpdated{.name = "n"}};
                     for (const auto &input : refused) {
                       const auto result = ss::transition(ended, input, fixed_time(2));
                       require(!result.accepted(), std::string(ss::input_name(input)) +
                                                       " should be refused after end");
                     }

                     const auto resumed = ss::transition(ended, in::Resume{}, fixed_time(3));
                     require(resumed.accepted(), "resume should be accepted");
                     require(std::holds_alternative<ss::IdlePhase>(resumed.state.phase),
                             "resume should go idle");
                     require(!resumed.state.ended_at.has_value(), "ended_at should be cleared");
                     require(find_call<ss::call::Resume>(resumed.effects).has_value(),
                             "runtime should be resumed");
                     require(!ss::transition(make_state("s-2"), in::Resume{}, fixed_time(4))
                                  .accepted(),
                             "resume on a live session is invalid");
                   }});

  tests.push_back({"transition_approval_request_needs_id_and_matching_reply", [] {
                     const auto working = working_state();
                     require(!ss::transition(working, in::ApprovalRequested{.request_id = ""},
                                             fixed_time(2))
                                  .accepted(),
                             "empty request id must be refused");
                     const auto awaiting = awaiting_state(ss::ApprovalType::Exec);
                     require(!ss::transition(awaiting,
                                             in::UserApproved{.request_id = "req-2",
                                                              .decision =
                                                                  ss::ReviewDecision::Approved},
                                             fixed_time(3))
                                  .accepted(),
                             "approval for another request must be refused");
                     require(!ss::transition(awaiting,
                                             in::UserAnsweredQuestion{.request_id = "req-1",
                                                                      .answer = "yes"},
                                             fixed_time(3))
                                  .accepted(),
                             "answers only apply to questions");
                   }});

  tests.push_back({"transition_answer_question_resumes_work", [] {
                     const auto awaiting = awaiting_state(ss::ApprovalType::Question);
                     const auto result = ss::transition(
                         awaiting, in::UserAnsweredQuestion{.request_id = "req-1", .answer = "yes"},
                         fixed_time(3));
                     require(result.accepted(), "answer should be accepted");
                     require(std::holds_alternative<ss::WorkingPhase>(result.state.phase),
                             "answer should resume work");
                     const auto call = find_call<ss::call::AnswerQuestion>(result.effects);
                     require(call.has_value() && call->answer == "yes", "answer call expected");
                   }});

  tests.push_back({"transition_error_clears_pending_approval", [] {
                     const auto result = ss::transition(awaiting_state(ss::ApprovalType::Exec),
                                                        in::Error{.message = "runtime died"},
                                                        fixed_time(3));
                     require(result.accepted(), "error applies in any live phase");
                     require(std::holds_alternative<ss::IdlePhase>(result.state.phase),
                             "error should recover to idle");
                     require(!result.state.pending_approval.has_value(),
                             "pending approval should be cleared");
                     const auto emitted = emits(result.effects);
                     require(emitted.size() == 1, "one delta expected");
                     const auto *delta = std::get_if<ss::event::SessionDelta>(&emitted[0].payload);
                     require(delta != nullptr, "delta payload expected");
                     require(delta->changes.pending_approval.has_value() &&
                                 !delta->changes.pending_approval->has_value(),
                             "delta should report the cleared approval");
                   }});

  tests.push_back({"transition_steer_while_working_keeps_phase", [] {
                     const auto result = ss::transition(
                         working_state(), in::UserSteered{.content = "use tabs"}, fixed_time(3));
                     require(result.accepted(), "steer should be accepted while working");
                     require(std::holds_alternative<ss::WorkingPhase>(result.state.phase),
                             "phase should stay working");
                     require(result.state.messages.back().type == ss::MessageType::Steer,
                             "steer message expected");
                     require(find_call<ss::call::Steer>(result.effects).has_value(),
                             "steer call expected");
                   }});

  tests.push_back({"transition_tool_message_counts_tools", [] {
                     const auto state = working_state();
                     const auto result = ss::transition(
                         state,
                         in::MessageCreated{.message = make_message("t-1", ss::MessageType::Tool,
                                                                    "ls")},
                         fixed_time(5));
                     require(result.accepted(), "tool message should be accepted");
                     std::vector<std::string> names;
                     for (const auto &effect : result.effects) {
                       names.push_back(ss::effect_name(effect));
                     }
                     require(names == std::vector<std::string>({"persist.message_append",
                                                                "persist.tool_count_increment",
                                                                "emit.message_appended"}),
                             "append, increment, then emit");
                     require(result.state.tool_count == state.tool_count + 1, "tool counted");
                     require(ss::summarize(result.state).tool_count == 1, "summary carries count");

                     const auto plain = ss::transition(
                         result.state,
                         in::MessageCreated{.message = make_message(
                                                "a-1", ss::MessageType::Assistant, "done")},
                         fixed_time(6));
                     require(!has_persist<ss::persist::ToolCountIncrement>(plain.effects),
                             "assistant messages are not tools");
                     require(plain.state.tool_count == 1, "count unchanged");
                   }});

  tests.push_back({"transition_drops_recent_user_echo", [] {
                     auto state = apply(make_state("s-1"), in::UserSentMessage{.content = "hello"},
                                        fixed_time(1));
                     const auto count = state.messages.size();
                     const auto result = ss::transition(
                         state,
                         in::MessageCreated{.message = make_message("", ss::MessageType::User,
                                                                    "hello")},
                         fixed_time(2));
                     require(result.accepted(), "echo is accepted");
                     require(result.state.messages.size() == count, "echo should not be appended");
                     require(result.effects.empty(), "echo produces no effects");
                   }});

  tests.push_back({"transition_turn_completed_snapshots_diff", [] {
                     auto state = apply(working_state(), in::DiffUpdated{.diff = "+line"},
                                        fixed_time(2));
                     const auto result = ss::transition(state, in::TurnCompleted{}, fixed_time(3));
                     require(result.accepted(), "turn completion should be accepted");
                     require(result.state.turn_diffs.size() == 1, "turn diff expected");
                     require(result.state.turn_diffs[0].turn_id == "turn-1", "turn id mismatch");
                     require(has_persist<ss::persist::TurnDiffInsert>(result.effects),
                             "turn diff should be persisted");
                     require(!result.state.current_turn_id.has_value(),
                             "current turn should be cleared");
                   }});

  tests.push_back({"transition_user_end_requests_shutdown", [] {
                     const auto result =
                         ss::transition(working_state(), in::UserEnded{}, fixed_time(2));
                     require(result.accepted(), "end should be accepted");
                     const auto *ended = std::get_if<ss::EndedPhase>(&result.state.phase);
                     require(ended != nullptr && ended->reason == "user_requested",
                             "ended phase with reason expected");
                     require(find_call<ss::call::Shutdown>(result.effects).has_value(),
                             "shutdown call expected");
                     require(has_persist<ss::persist::SessionEnd>(result.effects),
                             "end should be persisted");
                   }});
}
