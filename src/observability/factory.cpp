#include "orbitcore/observability/factory.hpp"

#include "orbitcore/common/fs.hpp"
#include "orbitcore/observability/log_observer.hpp"
#include "orbitcore/observability/multi_observer.hpp"
#include "orbitcore/observability/noop_observer.hpp"

namespace orbitcore::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.level, LogLevel::Info);
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    for (const auto &part : common::split(backend, ',')) {
      if (part == "log") {
        multi->add(std::make_unique<LogObserver>(level));
      } else if (part == "noop" || part == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(level);
}

} // namespace orbitcore::observability
