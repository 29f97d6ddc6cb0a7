#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace orbitcore::common {

/// UTC timestamp with millisecond precision, e.g. 2026-01-02T03:04:05.678Z.
[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string to_rfc3339(std::chrono::system_clock::time_point time);
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_rfc3339(const std::string &value);

} // namespace orbitcore::common
