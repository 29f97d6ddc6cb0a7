#include "orbitcore/common/ids.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace orbitcore::common {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, sizeof(digest));
}

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed");
  }
  return Result<std::string>::success(to_hex(data.data(), data.size()));
}

Result<std::string> new_session_id() {
  auto hex = random_hex(16);
  if (!hex.ok()) {
    return hex;
  }
  const std::string &h = hex.value();
  return Result<std::string>::success(h.substr(0, 8) + "-" + h.substr(8, 4) + "-" +
                                      h.substr(12, 4) + "-" + h.substr(16, 4) + "-" +
                                      h.substr(20, 12));
}

} // namespace orbitcore::common
