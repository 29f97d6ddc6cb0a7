#include "test_framework.hpp"

#include "orbitcore/observability/factory.hpp"
#include "orbitcore/observability/global.hpp"
#include "orbitcore/observability/log_observer.hpp"
#include "orbitcore/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<orbitcore::tests::TestCase> &tests) {
  using orbitcore::tests::require;
  namespace obs = orbitcore::observability;

  tests.push_back({"observability_factory_picks_backend", [] {
                     auto config = orbitcore::testing::test_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log,noop";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "lists become multi");
                     require(static_cast<obs::MultiObserver *>(multi.get())->size() == 2,
                             "both backends added");
                   }});

  tests.push_back({"observability_log_observer_filters_levels", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Warn, &out);
                     observer.record_event(obs::SessionSpawnedEvent{.session_id = "s-1",
                                                                    .provider = "codex"});
                     observer.record_event(obs::InvalidTransitionEvent{
                         .session_id = "s-1", .phase = "idle", .input = "turn_completed"});
                     observer.record_event(obs::EffectFailedEvent{.session_id = "s-1",
                                                                  .effect = "persist.session_update",
                                                                  .message = "queue full",
                                                                  .fed_back = false});
                     observer.record_metric(obs::ActiveSessionsMetric{.count = 3});
                     observer.flush();
                     const auto text = out.str();
                     require(text.find("session.spawned") == std::string::npos,
                             "info lines filtered");
                     require(text.find("[WARN] session.invalid_transition id=s-1 phase=idle "
                                       "input=turn_completed") != std::string::npos,
                             "warn line written");
                     require(text.find("[ERROR] session.effect_failed") != std::string::npos &&
                                 text.find("fed_back=false") != std::string::npos,
                             "error line written");
                     require(text.find("metric.") == std::string::npos, "debug metrics filtered");
                   }});

  tests.push_back({"observability_parses_levels", [] {
                     require(obs::parse_log_level(" Warning ", obs::LogLevel::Info) ==
                                 obs::LogLevel::Warn,
                             "warning alias");
                     require(obs::parse_log_level("debug", obs::LogLevel::Info) ==
                                 obs::LogLevel::Debug,
                             "debug");
                     require(obs::parse_log_level("chatty", obs::LogLevel::Error) ==
                                 obs::LogLevel::Error,
                             "fallback used");
                     require(obs::log_level_name(obs::LogLevel::Info) == "INFO", "level name");
                   }});

  tests.push_back({"observability_global_helpers_reach_installed_observer", [] {
                     {
                       orbitcore::testing::ObserverGuard guard;
                       obs::record_session_ended("s-1", "completed");
                       obs::record_route_rejected("s-2", "busy");
                       obs::record_error("service", "boom");
                       const auto ended = guard.observer().events_of<obs::SessionEndedEvent>();
                       require(ended.size() == 1 && ended[0].reason == "completed",
                               "ended recorded");
                       const auto rejected = guard.observer().events_of<obs::RouteRejectedEvent>();
                       require(rejected.size() == 1 && rejected[0].reason == "busy",
                               "rejection recorded");
                       const auto errors = guard.observer().events_of<obs::ErrorEvent>();
                       require(errors.size() == 1 && errors[0].component == "service",
                               "error recorded");
                     }
                     require(obs::get_global_observer() == nullptr, "guard uninstalls");
                     obs::record_error("service", "dropped quietly");
                   }});
}
