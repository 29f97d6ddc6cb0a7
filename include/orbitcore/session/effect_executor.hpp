#pragma once

#include "orbitcore/common/result.hpp"
#include "orbitcore/runtime/connector.hpp"
#include "orbitcore/session/broadcast.hpp"
#include "orbitcore/session/effect.hpp"
#include "orbitcore/session/event_log.hpp"

#include <cstdint>
#include <string>

namespace orbitcore::session {

/// Destination for persist effects. submit() must return immediately; a
/// saturated or stopped sink reports an error instead of waiting.
class IPersistSink {
public:
  virtual ~IPersistSink() = default;

  [[nodiscard]] virtual common::Status submit(const std::string &session_id,
                                              std::uint64_t revision, const PersistOp &op) = 0;
};

/// Performs the I/O an effect describes, on behalf of one session's actor.
class EffectExecutor {
public:
  EffectExecutor(std::string session_id, IPersistSink *persist,
                 runtime::IRuntimeConnector *connector, EventLog &log,
                 BroadcastChannel<LoggedEventPtr> &channel);

  /// `step_revision` is the session revision after the step that produced the effect.
  [[nodiscard]] common::Status execute(const Effect &effect, std::uint64_t step_revision);

private:
  [[nodiscard]] common::Status emit(const EmitEffect &effect);

  std::string session_id_;
  IPersistSink *persist_;
  runtime::IRuntimeConnector *connector_;
  EventLog &log_;
  BroadcastChannel<LoggedEventPtr> &channel_;
};

} // namespace orbitcore::session
