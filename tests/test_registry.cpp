#include "test_framework.hpp"

#include "orbitcore/runtime/connector.hpp"
#include "orbitcore/runtime/scheduler.hpp"
#include "orbitcore/session/registry.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

namespace {

namespace ss = orbitcore::session;
namespace in = orbitcore::session::input;
namespace rt = orbitcore::runtime;
using orbitcore::tests::require;

struct RegistryFixture {
  explicit RegistryFixture(ss::RegistryOptions options = {.shards = 4,
                                                          .list_queue_capacity = 64,
                                                          .subscribe_timeout =
                                                              std::chrono::milliseconds(2'000)},
                           bool start_scheduler = true)
      : scheduler(2), registry(options) {
    if (start_scheduler) {
      require(scheduler.start().ok(), "scheduler should start");
    }
  }

  ~RegistryFixture() {
    for (const auto &handle : registry.handles()) {
      ss::ShutdownRequest request;
      auto done = request.done.get_future();
      if (handle->shutdown(std::move(request)) == ss::PushResult::Accepted &&
          scheduler.running()) {
        done.wait_for(std::chrono::seconds(2));
      }
    }
    scheduler.stop();
  }

  ss::SessionHandle spawn(const std::string &id, ss::ActorOptions options = {}) {
    auto handle = ss::SessionActor::create(
        orbitcore::testing::make_state(id), options,
        ss::SessionActor::Dependencies{
            .scheduler = &scheduler,
            .persist = &sink,
            .connector = &connector,
            .clock = orbitcore::testing::stepping_clock(),
        });
    require(registry.register_session(handle), "registration should succeed");
    return handle;
  }

  rt::ActorScheduler scheduler;
  orbitcore::testing::RecordingPersistSink sink;
  rt::RecordingRuntimeConnector connector;
  ss::SessionRegistry registry;
};

} // namespace

void register_registry_tests(std::vector<orbitcore::tests::TestCase> &tests) {
  using orbitcore::testing::wait_until;

  tests.push_back({"registry_routes_to_the_owning_actor", [] {
                     RegistryFixture f;
                     f.spawn("s-1");
                     f.spawn("s-2");
                     require(f.registry.send("s-2", in::UserSentMessage{.content = "hi"}).ok(),
                             "send should be accepted");
                     require(wait_until([&] {
                               return std::holds_alternative<ss::WorkingPhase>(
                                   f.registry.snapshot("s-2")->phase);
                             }),
                             "s-2 should start working");
                     require(std::holds_alternative<ss::IdlePhase>(
                                 f.registry.snapshot("s-1")->phase),
                             "s-1 must be untouched");
                     const auto calls = f.connector.calls_for("s-2");
                     require(calls.size() == 1, "one call for s-2");
                     require(f.connector.calls_for("s-1").empty(), "no calls for s-1");
                   }});

  tests.push_back({"registry_unknown_session_is_reported", [] {
                     orbitcore::testing::ObserverGuard guard;
                     RegistryFixture f;
                     const auto status = f.registry.send("missing", in::UserInterrupted{});
                     require(!status.ok(), "send must fail");
                     require(status.error() == ss::RouteError::UnknownSession, "unknown expected");
                     require(ss::route_error_code(status.error()) == "unknown_session",
                             "code should be unknown_session");
                     const auto outcome = f.registry.subscribe("missing", std::nullopt);
                     require(!outcome.status.ok() && !outcome.reply.has_value(),
                             "subscribe must fail");
                     require(f.registry.snapshot("missing") == nullptr, "no snapshot expected");
                     const auto rejected = guard.observer()
                         .events_of<orbitcore::observability::RouteRejectedEvent>();
                     require(rejected.size() == 1 && rejected[0].reason == "unknown_session",
                             "rejection should be recorded");
                   }});

  tests.push_back({"registry_full_inbox_is_busy_without_blocking", [] {
                     RegistryFixture f({.shards = 2,
                                        .list_queue_capacity = 16,
                                        .subscribe_timeout = std::chrono::milliseconds(50)},
                                       false);
                     f.spawn("s-1", ss::ActorOptions{.inbox_capacity = 2});
                     require(f.registry.send("s-1", in::PlanUpdated{.plan = "a"}).ok(), "first");
                     require(f.registry.send("s-1", in::PlanUpdated{.plan = "b"}).ok(), "second");
                     const auto started = std::chrono::steady_clock::now();
                     const auto status = f.registry.send("s-1", in::PlanUpdated{.plan = "c"});
                     require(std::chrono::steady_clock::now() - started <
                                 std::chrono::milliseconds(500),
                             "busy must be reported immediately");
                     require(!status.ok() && status.error() == ss::RouteError::Busy,
                             "third send should be busy");
                     const auto outcome = f.registry.subscribe("s-1", std::nullopt);
                     require(!outcome.status.ok() && outcome.status.error() == ss::RouteError::Busy,
                             "subscribe on a full inbox is busy");
                   }});

  tests.push_back({"registry_subscribe_times_out_as_busy", [] {
                     RegistryFixture f({.shards = 2,
                                        .list_queue_capacity = 16,
                                        .subscribe_timeout = std::chrono::milliseconds(50)},
                                       false);
                     f.spawn("s-1");
                     const auto outcome = f.registry.subscribe("s-1", std::nullopt);
                     require(!outcome.status.ok(), "unanswered subscribe must fail");
                     require(outcome.status.error() == ss::RouteError::Busy, "timeout is busy");
                   }});

  tests.push_back({"registry_ended_session_accepts_only_resume", [] {
                     RegistryFixture f;
                     f.spawn("s-1");
                     require(f.registry.send("s-1", in::SessionEnded{.reason = "completed"}).ok(),
                             "end should be accepted");
                     require(wait_until([&] {
                               return ss::is_ended(f.registry.snapshot("s-1")->phase);
                             }),
                             "session should end");
                     const auto refused = f.registry.send("s-1", in::UserSentMessage{.content = "x"});
                     require(!refused.ok() && refused.error() == ss::RouteError::Ended,
                             "ended sessions refuse commands");
                     require(f.registry.send("s-1", in::Resume{}).ok(), "resume is allowed");
                     require(wait_until([&] {
                               return std::holds_alternative<ss::IdlePhase>(
                                   f.registry.snapshot("s-1")->phase);
                             }),
                             "resume returns to idle");
                   }});

  tests.push_back({"registry_stopped_actor_is_closed", [] {
                     RegistryFixture f;
                     auto handle = f.spawn("s-1");
                     ss::ShutdownRequest request;
                     auto done = request.done.get_future();
                     require(handle->shutdown(std::move(request)) == ss::PushResult::Accepted,
                             "shutdown accepted");
                     require(done.wait_for(std::chrono::seconds(2)) == std::future_status::ready,
                             "shutdown completes");
                     const auto status = f.registry.send("s-1", in::UserInterrupted{});
                     require(!status.ok() && status.error() == ss::RouteError::Closed,
                             "stopped actor should be closed");
                     const auto outcome = f.registry.subscribe("s-1", std::nullopt);
                     require(!outcome.status.ok() &&
                                 outcome.status.error() == ss::RouteError::Closed,
                             "subscribe to stopped actor is closed");
                   }});

  tests.push_back({"registry_rejects_duplicate_ids_and_removes", [] {
                     orbitcore::testing::ObserverGuard guard;
                     RegistryFixture f;
                     auto first = f.spawn("s-1");
                     auto duplicate = ss::SessionActor::create(
                         orbitcore::testing::make_state("s-1"), {},
                         ss::SessionActor::Dependencies{.scheduler = &f.scheduler});
                     require(!f.registry.register_session(duplicate), "duplicate must be refused");
                     require(f.registry.find("s-1") == first, "original stays registered");
                     require(f.registry.size() == 1, "one session");
                     require(f.registry.remove("s-1") == first, "remove returns the handle");
                     require(f.registry.remove("s-1") == nullptr, "second remove is a no-op");
                     require(f.registry.size() == 0, "registry should be empty");
                     const auto counts = guard.observer()
                         .metrics_of<orbitcore::observability::ActiveSessionsMetric>();
                     require(!counts.empty() && counts.back().count == 0,
                             "active count should drop to zero");
                     ss::ShutdownRequest request;
                     auto done = request.done.get_future();
                     if (first->shutdown(std::move(request)) == ss::PushResult::Accepted) {
                       done.wait_for(std::chrono::seconds(2));
                     }
                   }});

  tests.push_back({"registry_spreads_sessions_over_shards", [] {
                     RegistryFixture f;
                     require(f.registry.shard_count() == 4, "four shards configured");
                     std::vector<std::thread> writers;
                     for (int t = 0; t < 4; ++t) {
                       writers.emplace_back([&f, t] {
                         for (int i = 0; i < 25; ++i) {
                           f.spawn("s-" + std::to_string(t) + "-" + std::to_string(i));
                         }
                       });
                     }
                     for (auto &writer : writers) {
                       writer.join();
                     }
                     require(f.registry.size() == 100, "all sessions registered");
                     const auto ids = f.registry.ids();
                     require(std::is_sorted(ids.begin(), ids.end()), "ids are sorted");
                     require(std::set<std::string>(ids.begin(), ids.end()).size() == 100,
                             "ids are unique");
                     require(f.registry.list().size() == 100, "list covers every session");
                   }});

  tests.push_back({"registry_list_updates_come_from_the_scan", [] {
                     RegistryFixture f;
                     f.spawn("s-1");
                     f.spawn("s-2");
                     auto list = f.registry.subscribe_list();
                     require(f.registry.publish_list_updates() == 0, "nothing changed yet");

                     require(f.registry.send("s-1", in::PlanUpdated{.plan = "a"}).ok(), "plan a");
                     require(f.registry.send("s-1", in::PlanUpdated{.plan = "b"}).ok(), "plan b");
                     require(wait_until([&] {
                               return f.registry.snapshot("s-1")->current_plan ==
                                      std::optional<std::string>("b");
                             }),
                             "plans applied");
                     require(list.live.pending() == 0, "actors publish nothing to the list");
                     require(f.registry.publish_list_updates() == 1,
                             "several steps collapse into one update");
                     auto updated = list.live.try_recv();
                     require(updated.has_value() && updated->summary.id == "s-1" &&
                                 updated->summary.revision == f.registry.snapshot("s-1")->revision,
                             "update carries the latest revision");
                     require(f.registry.publish_list_updates() == 0, "unchanged after publish");

                     require(f.registry.send("s-2", in::PlanUpdated{.plan = "c"}).ok(), "plan c");
                     require(wait_until([&] { return f.registry.snapshot("s-2")->revision > 0; }),
                             "plan c applied");
                     auto removed_handle = f.registry.remove("s-2");
                     require(f.registry.publish_list_updates() == 0,
                             "removed sessions are not updated");
                     auto removed = list.live.try_recv();
                     require(removed.has_value() && removed->kind == ss::ListEvent::Kind::Removed,
                             "removal announced");
                     require(!list.live.try_recv().has_value(), "nothing after removal");
                     ss::ShutdownRequest request;
                     auto done = request.done.get_future();
                     if (removed_handle->shutdown(std::move(request)) == ss::PushResult::Accepted) {
                       done.wait_for(std::chrono::seconds(2));
                     }
                   }});

  tests.push_back({"registry_list_subscription_sees_changes", [] {
                     RegistryFixture f;
                     f.spawn("s-1");
                     auto list = f.registry.subscribe_list();
                     require(list.sessions.size() == 1 && list.sessions[0].id == "s-1",
                             "initial listing");

                     f.spawn("s-2");
                     auto created = list.live.recv_for(std::chrono::seconds(2));
                     require(created.has_value(), "created event expected");
                     require(created->kind == ss::ListEvent::Kind::Created &&
                                 created->summary.id == "s-2",
                             "s-2 created");

                     require(f.registry.send("s-2", in::UserRenamed{.name = std::string("x")}).ok(),
                             "rename accepted");
                     require(wait_until([&] {
                               return f.registry.snapshot("s-2")->custom_name ==
                                      std::optional<std::string>("x");
                             }),
                             "rename applied");
                     require(f.registry.publish_list_updates() == 1, "one session changed");
                     auto updated = list.live.recv_for(std::chrono::seconds(2));
                     require(updated.has_value() && updated->kind == ss::ListEvent::Kind::Updated,
                             "updated event expected");
                     require(updated->summary.custom_name == std::optional<std::string>("x"),
                             "summary carries the new name");

                     auto removed_handle = f.registry.remove("s-2");
                     auto removed = list.live.recv_for(std::chrono::seconds(2));
                     require(removed.has_value() && removed->kind == ss::ListEvent::Kind::Removed,
                             "removed event expected");
                     require(ss::list_event_kind_name(removed->kind) == "removed", "kind name");
                     ss::ShutdownRequest request;
                     auto done = request.done.get_future();
                     if (removed_handle->shutdown(std::move(request)) == ss::PushResult::Accepted) {
                       done.wait_for(std::chrono::seconds(2));
                     }
                   }});
}
