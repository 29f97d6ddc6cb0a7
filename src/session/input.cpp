#include "orbitcore/session/input.hpp"

#include <array>

namespace orbitcore::session {

namespace {

constexpr std::array<std::string_view, 30> INPUT_NAMES = {
    "turn_started",       "turn_completed",      "turn_aborted",
    "message_created",    "message_updated",     "approval_requested",
    "tokens_updated",     "diff_updated",        "plan_updated",
    "name_updated",       "session_ended",       "context_compacted",
    "undo_started",       "undo_completed",      "rolled_back",
    "error",              "model_updated",       "environment_changed",
    "user_sent_message",  "user_steered",        "user_approved",
    "user_answered_question", "user_renamed",    "user_changed_config",
    "user_interrupted",   "user_compacted",      "user_undid",
    "user_rolled_back",   "user_ended",          "resume",
};

static_assert(INPUT_NAMES.size() == std::variant_size_v<Input>);

} // namespace

std::string_view input_name(const Input &input) { return INPUT_NAMES[input.index()]; }

} // namespace orbitcore::session
