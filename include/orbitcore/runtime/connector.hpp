#pragma once

#include "orbitcore/common/result.hpp"
#include "orbitcore/session/effect.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orbitcore::runtime {

/// Outbound side of an agent runtime. dispatch() must not block: a connector
/// hands the call to its own I/O and feeds results back as session inputs
/// through the registry.
class IRuntimeConnector {
public:
  virtual ~IRuntimeConnector() = default;

  [[nodiscard]] virtual common::Status dispatch(const std::string &session_id,
                                                const session::RuntimeCall &call) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

struct DispatchedCall {
  std::string session_id;
  session::RuntimeCall call;
};

/// Keeps every dispatched call; can be told to fail the next dispatches.
class RecordingRuntimeConnector final : public IRuntimeConnector {
public:
  [[nodiscard]] common::Status dispatch(const std::string &session_id,
                                        const session::RuntimeCall &call) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  void fail_next(std::size_t count, std::string message = "runtime unavailable");
  [[nodiscard]] std::vector<DispatchedCall> calls() const;
  [[nodiscard]] std::vector<DispatchedCall> calls_for(const std::string &session_id) const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<DispatchedCall> calls_;
  std::size_t failures_left_ = 0;
  std::string failure_message_;
};

/// Logs calls and accepts them; used by the stdio server when runtime events
/// are injected by the client.
class LoopbackRuntimeConnector final : public IRuntimeConnector {
public:
  [[nodiscard]] common::Status dispatch(const std::string &session_id,
                                        const session::RuntimeCall &call) override;
  [[nodiscard]] std::string_view name() const override { return "loopback"; }
};

} // namespace orbitcore::runtime
