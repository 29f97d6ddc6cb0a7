#pragma once

#include "orbitcore/common/json_util.hpp"
#include "orbitcore/common/result.hpp"
#include "orbitcore/session/event.hpp"
#include "orbitcore/session/types.hpp"

#include <string>

namespace orbitcore::session {

// JSON encoders used by the event log, the wire protocol and the store.

[[nodiscard]] std::string to_json(const TokenUsage &usage);
[[nodiscard]] std::string to_json(const Message &message);
[[nodiscard]] std::string to_json(const ApprovalRequest &request);
[[nodiscard]] std::string to_json(const TurnDiff &turn_diff);
[[nodiscard]] std::string to_json(const StateChanges &changes);
[[nodiscard]] std::string to_json(const SessionSummary &summary);
[[nodiscard]] std::string to_json(const WorkPhase &phase);

/// Full snapshot, including messages and turn diffs.
[[nodiscard]] std::string to_json(const SessionState &state);

/// {"type":..,"session_id":..,"revision":..,"timestamp":..,<payload fields>}
[[nodiscard]] std::string to_json(const SessionEvent &event);

[[nodiscard]] common::Result<TokenUsage> token_usage_from_json(const std::string &json);
[[nodiscard]] common::Result<Message> message_from_json(const std::string &json);
[[nodiscard]] std::optional<std::vector<std::string>>
string_list_from_json(const std::string &json);

} // namespace orbitcore::session
