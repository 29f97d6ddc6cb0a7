#pragma once

#include "orbitcore/common/result.hpp"

#include <cstddef>
#include <string>

namespace orbitcore::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

/// New session identifier in 8-4-4-4-12 hex form.
[[nodiscard]] Result<std::string> new_session_id();

} // namespace orbitcore::common
