#pragma once

#include "orbitcore/session/effect.hpp"
#include "orbitcore/session/input.hpp"
#include "orbitcore/session/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orbitcore::session {

struct TransitionResult {
  SessionState state;
  std::vector<Effect> effects;
  /// Set when the (phase, input) pair is not in the transition table. The
  /// state is then returned unchanged and effects is empty.
  std::optional<std::string> rejection;

  [[nodiscard]] bool accepted() const { return !rejection.has_value(); }
};

/// Pure transition: the same (state, input, now) always yields the same result.
/// Every Emit effect raises the revision by one and carries the revision it
/// produces, so a step moves the revision from r to r + (number of emits).
[[nodiscard]] TransitionResult transition(SessionState state, const Input &input,
                                          const std::string &now);

/// Deterministic id for messages the transition synthesizes.
[[nodiscard]] std::string derive_message_id(const std::string &session_id, std::uint64_t revision,
                                            const std::string &now, const std::string &content);

[[nodiscard]] std::size_t count_emits(const std::vector<Effect> &effects);

} // namespace orbitcore::session
