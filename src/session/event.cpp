#include "orbitcore/session/event.hpp"

#include <array>

namespace orbitcore::session {

namespace {

constexpr std::array<std::string_view, 11> PAYLOAD_TYPES = {
    "session_delta",   "message_appended",   "message_updated", "approval_requested",
    "tokens_updated",  "session_ended",      "turn_diff_snapshot", "context_compacted",
    "undo_started",    "undo_completed",     "thread_rolled_back",
};

static_assert(PAYLOAD_TYPES.size() == std::variant_size_v<EventPayload>);

} // namespace

std::string_view payload_type(const EventPayload &payload) {
  return PAYLOAD_TYPES[payload.index()];
}

} // namespace orbitcore::session
