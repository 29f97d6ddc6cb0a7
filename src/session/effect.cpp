#include "orbitcore/session/effect.hpp"

#include <array>
#include <type_traits>

namespace orbitcore::session {

namespace {

constexpr std::array<std::string_view, 16> PERSIST_OP_NAMES = {
    "session_create",    "session_update",      "session_end",
    "reactivate",        "message_append",      "tool_count_increment",
    "message_update",
    "tokens_update",     "turn_state_update",   "turn_diff_insert",
    "set_custom_name",   "set_session_config",  "model_update",
    "environment_update", "approval_requested", "approval_decision",
};

constexpr std::array<std::string_view, 12> RUNTIME_CALL_NAMES = {
    "send_message", "steer",   "approve", "answer_question", "interrupt", "set_name",
    "update_config", "compact", "undo",   "rollback",        "shutdown",  "resume",
};

static_assert(PERSIST_OP_NAMES.size() == std::variant_size_v<PersistOp>);
static_assert(RUNTIME_CALL_NAMES.size() == std::variant_size_v<RuntimeCall>);

} // namespace

std::string_view persist_op_name(const PersistOp &op) { return PERSIST_OP_NAMES[op.index()]; }

std::string_view runtime_call_name(const RuntimeCall &call) {
  return RUNTIME_CALL_NAMES[call.index()];
}

std::string effect_name(const Effect &effect) {
  return std::visit(
      [](const auto &e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PersistEffect>) {
          return "persist." + std::string(persist_op_name(e.op));
        } else if constexpr (std::is_same_v<T, EmitEffect>) {
          return "emit." + std::string(payload_type(e.payload));
        } else {
          return "runtime." + std::string(runtime_call_name(e.call));
        }
      },
      effect);
}

} // namespace orbitcore::session
