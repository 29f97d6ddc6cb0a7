#include "test_framework.hpp"

#include "orbitcore/persistence/store.hpp"
#include "orbitcore/persistence/writer.hpp"
#include "orbitcore/session/transition.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <vector>

namespace {

namespace ss = orbitcore::session;
namespace in = orbitcore::session::input;
namespace ps = orbitcore::persistence;
using orbitcore::tests::require;

std::unique_ptr<ps::SqliteSessionStore> open_store(const std::filesystem::path &path) {
  auto opened = ps::SqliteSessionStore::open(path);
  require(opened.ok(), "store should open: " + (opened.ok() ? std::string() : opened.error()));
  return opened.take();
}

ps::PersistCommand create_command(const ss::SessionState &state) {
  return ps::PersistCommand{.session_id = state.id,
                            .revision = state.revision,
                            .op = ss::persist::SessionCreate{.provider = state.provider,
                                                             .project_path = state.project_path,
                                                             .project_name = state.project_name,
                                                             .model = state.model,
                                                             .approval_policy = std::nullopt,
                                                             .sandbox_mode = std::nullopt,
                                                             .forked_from = std::nullopt,
                                                             .started_at = state.started_at}};
}

/// Runs `inputs` through the transition and writes every persist effect to
/// `store`, the way the actor and writer would.
ss::SessionState drive(ps::SqliteSessionStore &store, ss::SessionState state,
                       const std::vector<ss::Input> &inputs) {
  std::uint64_t tick = 1;
  for (const auto &input : inputs) {
    auto result = ss::transition(std::move(state), input, orbitcore::testing::fixed_time(tick++));
    require(result.accepted(), "input should be accepted: " + result.rejection.value_or(""));
    std::vector<ps::PersistCommand> commands;
    for (const auto &effect : result.effects) {
      if (const auto *persist = std::get_if<ss::PersistEffect>(&effect)) {
        commands.push_back(ps::PersistCommand{
            .session_id = result.state.id, .revision = result.state.revision, .op = persist->op});
      }
    }
    const auto status = store.apply_batch(commands);
    require(status.ok(), "batch should apply: " + (status.ok() ? std::string() : status.error()));
    state = std::move(result.state);
  }
  return state;
}

} // namespace

void register_persistence_tests(std::vector<orbitcore::tests::TestCase> &tests) {
  using orbitcore::testing::make_message;

  tests.push_back({"store_round_trips_a_finished_turn", [] {
                     orbitcore::testing::TempWorkspace workspace;
                     auto store = open_store(workspace.db_path());
                     const auto initial = orbitcore::testing::make_state("s-1");
                     require(store->apply(create_command(initial)).ok(), "create should apply");

                     const auto final_state = drive(
                         *store, initial,
                         {in::UserSentMessage{.content = "refactor"}, in::TurnStarted{},
                          in::MessageCreated{
                              .message = make_message("t-1", ss::MessageType::Tool, "rg TODO")},
                          in::MessageCreated{
                              .message = make_message("m-1", ss::MessageType::Assistant, "done")},
                          in::TokensUpdated{.usage = ss::TokenUsage{.input_tokens = 50,
                                                                    .output_tokens = 7}},
                          in::DiffUpdated{.diff = "+line"}, in::TurnCompleted{},
                          in::UserRenamed{.name = std::string("refactor work")}});

                     auto loaded = store->load_session("s-1");
                     require(loaded.ok() && loaded.value().has_value(), "session should load");
                     const auto &state = *loaded.value();
                     require(state.revision == final_state.revision, "revision persisted");
                     require(std::holds_alternative<ss::IdlePhase>(state.phase), "idle restored");
                     require(state.messages == final_state.messages, "messages persisted in order");
                     require(state.token_usage == final_state.token_usage, "tokens persisted");
                     require(state.turn_diffs == final_state.turn_diffs, "turn diffs persisted");
                     require(state.turn_count == final_state.turn_count, "turn count persisted");
                     require(state.tool_count == 1 && final_state.tool_count == 1,
                             "tool count persisted");
                     auto listed = store->list_sessions();
                     require(listed.ok() && listed.value().size() == 1 &&
                                 listed.value()[0].tool_count == 1,
                             "summary lists tool count");
                     require(state.custom_name == final_state.custom_name, "name persisted");
                     require(!state.current_turn_id.has_value(), "no turn in progress");
                   }});

  tests.push_back({"store_restores_pending_approval", [] {
                     orbitcore::testing::TempWorkspace workspace;
                     ss::SessionState final_state;
                     {
                       auto store = open_store(workspace.db_path());
                       const auto initial = orbitcore::testing::make_state("s-1");
                       require(store->apply(create_command(initial)).ok(), "create should apply");
                       final_state = drive(*store, initial,
                                           {in::UserSentMessage{.content = "deploy"},
                                            in::TurnStarted{},
                                            in::ApprovalRequested{
                                                .request_id = "req-9",
                                                .approval_type = ss::ApprovalType::Exec,
                                                .command = std::string("rm -rf build")}});
                     }
                     auto reopened = open_store(workspace.db_path());
                     auto active = reopened->load_active_sessions();
                     require(active.ok() && active.value().size() == 1, "one active session");
                     const auto &state = active.value()[0];
                     const auto *awaiting = std::get_if<ss::AwaitingApprovalPhase>(&state.phase);
                     require(awaiting != nullptr, "should come back awaiting approval");
                     require(awaiting->request_id == "req-9", "same request id");
                     require(state.pending_approval.has_value() &&
                                 state.pending_approval == final_state.pending_approval,
                             "pending approval restored");
                   }});

  tests.push_back({"store_restores_decided_work_as_idle", [] {
                     orbitcore::testing::TempWorkspace workspace;
                     auto store = open_store(workspace.db_path());
                     const auto initial = orbitcore::testing::make_state("s-1");
                     require(store->apply(create_command(initial)).ok(), "create should apply");
                     (void)drive(*store, initial,
                                 {in::UserSentMessage{.content = "x"}, in::TurnStarted{},
                                  in::ApprovalRequested{.request_id = "req-1"},
                                  in::UserApproved{.request_id = "req-1",
                                                   .decision = ss::ReviewDecision::Approved}});
                     auto loaded = store->load_session("s-1");
                     require(loaded.ok() && loaded.value().has_value(), "session should load");
                     const auto &state = *loaded.value();
                     require(std::holds_alternative<ss::IdlePhase>(state.phase),
                             "an interrupted turn comes back idle");
                     require(!state.pending_approval.has_value(), "no pending approval");
                     require(!state.current_turn_id.has_value(), "turn id cleared");
                   }});

  tests.push_back({"store_keeps_ended_sessions_out_of_active", [] {
                     orbitcore::testing::TempWorkspace workspace;
                     auto store = open_store(workspace.db_path());
                     for (const char *id : {"s-1", "s-2"}) {
                       const auto initial = orbitcore::testing::make_state(id);
                       require(store->apply(create_command(initial)).ok(), "create should apply");
                     }
                     (void)drive(*store, orbitcore::testing::make_state("s-2"),
                                 {in::SessionEnded{.reason = "user_requested"}});

                     auto active = store->load_active_sessions();
                     require(active.ok() && active.value().size() == 1, "one active session");
                     require(active.value()[0].id == "s-1", "s-1 stays active");

                     auto ended = store->load_session("s-2");
                     require(ended.ok() && ended.value().has_value(), "ended session loads");
                     const auto *phase = std::get_if<ss::EndedPhase>(&ended.value()->phase);
                     require(phase != nullptr && phase->reason == "user_requested",
                             "end reason restored");

                     auto missing = store->load_session("nope");
                     require(missing.ok() && !missing.value().has_value(), "missing is empty");
                   }});

  tests.push_back({"store_lists_most_recent_first", [] {
                     auto store = open_store(":memory:");
                     for (const char *id : {"s-1", "s-2", "s-3"}) {
                       require(store->apply(create_command(orbitcore::testing::make_state(id))).ok(),
                               "create should apply");
                     }
                     require(store
                                 ->apply(ps::PersistCommand{
                                     .session_id = "s-2",
                                     .revision = 4,
                                     .op = ss::persist::SessionUpdate{
                                         .status = std::nullopt,
                                         .work_status = ss::WorkStatus::Working,
                                         .last_activity_at = orbitcore::testing::fixed_time(500)}})
                                 .ok(),
                             "update should apply");
                     auto listed = store->list_sessions();
                     require(listed.ok() && listed.value().size() == 3, "three sessions listed");
                     require(listed.value()[0].id == "s-2", "most recent first");
                     require(listed.value()[0].revision == 4, "revision raised by the command");
                     require(listed.value()[0].work_status == ss::WorkStatus::Working,
                             "work status stored");
                   }});

  tests.push_back({"store_revision_never_moves_backwards", [] {
                     auto store = open_store(":memory:");
                     const auto initial = orbitcore::testing::make_state("s-1");
                     require(store->apply(create_command(initial)).ok(), "create should apply");
                     require(store
                                 ->apply(ps::PersistCommand{
                                     .session_id = "s-1",
                                     .revision = 9,
                                     .op = ss::persist::ModelUpdate{.model = "gpt-5"}})
                                 .ok(),
                             "model update applies");
                     require(store
                                 ->apply(ps::PersistCommand{
                                     .session_id = "s-1",
                                     .revision = 3,
                                     .op = ss::persist::ModelUpdate{.model = "gpt-5-mini"}})
                                 .ok(),
                             "late command applies");
                     auto loaded = store->load_session("s-1");
                     require(loaded.ok() && loaded.value().has_value(), "session loads");
                     require(loaded.value()->revision == 9, "revision keeps the maximum");
                     require(loaded.value()->model == std::optional<std::string>("gpt-5-mini"),
                             "fields take the last write");
                   }});

  tests.push_back({"writer_batches_in_the_background", [] {
                     orbitcore::testing::ObserverGuard guard;
                     auto store = open_store(":memory:");
                     const auto initial = orbitcore::testing::make_state("s-1");
                     require(store->apply(create_command(initial)).ok(), "create should apply");

                     ps::PersistenceWriter writer(*store, ps::WriterOptions{
                                                              .queue_capacity = 100,
                                                              .batch_size = 3,
                                                              .flush_interval =
                                                                  std::chrono::milliseconds(10)});
                     require(writer.start().ok(), "writer should start");
                     for (std::uint64_t i = 1; i <= 10; ++i) {
                       auto message = make_message("m-" + std::to_string(i),
                                                   ss::MessageType::Assistant, "part");
                       message.session_id = "s-1";
                       message.timestamp = orbitcore::testing::fixed_time(i);
                       require(writer.submit("s-1", i, ss::persist::MessageAppend{.message = message})
                                   .ok(),
                               "submit should be accepted");
                     }
                     require(orbitcore::testing::wait_until([&] { return writer.written() == 10; }),
                             "all commands should be written");
                     writer.stop();

                     auto loaded = store->load_session("s-1");
                     require(loaded.ok() && loaded.value().has_value(), "session loads");
                     require(loaded.value()->messages.size() == 10, "ten messages stored");
                     require(loaded.value()->messages.front().id == "m-1" &&
                                 loaded.value()->messages.back().id == "m-10",
                             "messages keep submission order");
                     require(loaded.value()->revision == 10, "revision follows the commands");
                     const auto flushes = guard.observer()
                         .events_of<orbitcore::observability::PersistenceFlushEvent>();
                     require(!flushes.empty(), "flushes should be recorded");
                     for (const auto &flush : flushes) {
                       require(flush.commands <= 3 && flush.success, "batches respect the limit");
                     }
                     require(writer.failed_batches() == 0, "no failed batches");
                   }});

  tests.push_back({"writer_reports_full_queue_and_stopped", [] {
                     auto store = open_store(":memory:");
                     ps::PersistenceWriter writer(*store, ps::WriterOptions{.queue_capacity = 2,
                                                                            .batch_size = 10,
                                                                            .flush_interval =
                                                                                std::chrono::seconds(
                                                                                    10)});
                     const ss::PersistOp op = ss::persist::ModelUpdate{.model = "m"};
                     require(writer.submit("s-1", 1, op).ok(), "first accepted");
                     require(writer.submit("s-1", 2, op).ok(), "second accepted");
                     const auto full = writer.submit("s-1", 3, op);
                     require(!full.ok() && full.error() == "persistence queue is full",
                             "third should hit the bound");
                     require(writer.queued() == 2, "two commands queued");
                     writer.stop();
                     require(writer.queued() == 0, "stop drains the queue");
                     const auto stopped = writer.submit("s-1", 4, op);
                     require(!stopped.ok() && stopped.error() == "persistence writer is stopped",
                             "submits after stop are refused");
                   }});
}
