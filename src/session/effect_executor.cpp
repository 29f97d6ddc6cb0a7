#include "orbitcore/session/effect_executor.hpp"

#include "orbitcore/observability/global.hpp"

#include <type_traits>

namespace orbitcore::session {

EffectExecutor::EffectExecutor(std::string session_id, IPersistSink *persist,
                               runtime::IRuntimeConnector *connector, EventLog &log,
                               BroadcastChannel<LoggedEventPtr> &channel)
    : session_id_(std::move(session_id)), persist_(persist), connector_(connector), log_(log),
      channel_(channel) {}

common::Status EffectExecutor::execute(const Effect &effect, const std::uint64_t step_revision) {
  return std::visit(
      [&](const auto &e) -> common::Status {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PersistEffect>) {
          if (persist_ == nullptr) {
            return common::Status::success();
          }
          return persist_->submit(session_id_, step_revision, e.op);
        } else if constexpr (std::is_same_v<T, EmitEffect>) {
          return emit(e);
        } else {
          if (connector_ == nullptr) {
            return common::Status::error("no runtime connector attached");
          }
          return connector_->dispatch(session_id_, e.call);
        }
      },
      effect);
}

common::Status EffectExecutor::emit(const EmitEffect &effect) {
  auto logged = make_logged_event(SessionEvent{.revision = effect.revision,
                                               .session_id = session_id_,
                                               .timestamp = effect.timestamp,
                                               .payload = effect.payload});
  if (!log_.append(logged)) {
    return common::Status::error("event revision " + std::to_string(effect.revision) +
                                 " does not follow " + std::to_string(log_.newest_revision()));
  }
  const auto published = channel_.publish(logged);
  for (std::size_t i = 0; i < published.dropped; ++i) {
    observability::record_subscriber_dropped(session_id_, "subscriber queue full");
  }
  return common::Status::success();
}

} // namespace orbitcore::session
