#pragma once

#include "orbitcore/common/json_util.hpp"
#include "orbitcore/common/result.hpp"
#include "orbitcore/session/event_log.hpp"
#include "orbitcore/session/input.hpp"
#include "orbitcore/session/registry.hpp"
#include "orbitcore/session/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orbitcore::gateway {

/// One line received from a viewer. `fields` keeps every member as raw JSON.
struct ClientMessage {
  std::string type;
  std::optional<std::string> id;
  std::optional<std::string> session_id;
  common::JsonFields fields;
};

[[nodiscard]] common::Result<ClientMessage> parse_client_message(const std::string &line);

/// True for message types that become a session Input (send_message, approve_tool, ...).
[[nodiscard]] bool is_session_command(const std::string &type);

[[nodiscard]] common::Result<session::Input> command_to_input(const ClientMessage &message);

/// Decodes an injected runtime event object, e.g. {"kind":"turn_started"}.
[[nodiscard]] common::Result<session::Input> runtime_event_to_input(const std::string &event_json);

[[nodiscard]] std::string encode_session_snapshot(const session::SessionState &state);
[[nodiscard]] std::string encode_replay(const std::string &session_id,
                                        const std::vector<session::LoggedEventPtr> &events,
                                        std::uint64_t revision);
[[nodiscard]] std::string encode_event(const session::LoggedEvent &event);
[[nodiscard]] std::string encode_sessions_list(const std::vector<session::SessionSummary> &sessions);
[[nodiscard]] std::string encode_session_list_event(const session::ListEvent &event);
[[nodiscard]] std::string encode_resync_required(const std::string &session_id,
                                                 const std::string &reason);
[[nodiscard]] std::string encode_ack(const std::string &type, const std::optional<std::string> &id,
                                     const std::optional<std::string> &session_id);
[[nodiscard]] std::string encode_error(const std::string &code, const std::string &message,
                                       const std::optional<std::string> &session_id,
                                       const std::optional<std::string> &id = std::nullopt);

} // namespace orbitcore::gateway
