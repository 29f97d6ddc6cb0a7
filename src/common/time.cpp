#include "orbitcore/common/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace orbitcore::common {

std::string now_rfc3339() { return to_rfc3339(std::chrono::system_clock::now()); }

std::string to_rfc3339(const std::chrono::system_clock::time_point time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() %
      1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }
  const std::time_t seconds = timegm(&tm);
  auto point = std::chrono::system_clock::from_time_t(seconds);

  if (in.peek() == '.') {
    in.get();
    int millis = 0;
    int digits = 0;
    while (digits < 3 && std::isdigit(in.peek()) != 0) {
      millis = millis * 10 + (in.get() - '0');
      ++digits;
    }
    while (digits > 0 && digits < 3) {
      millis *= 10;
      ++digits;
    }
    point += std::chrono::milliseconds(millis);
  }
  return point;
}

} // namespace orbitcore::common
