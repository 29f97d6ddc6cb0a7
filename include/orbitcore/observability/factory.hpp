#pragma once

#include "orbitcore/config/schema.hpp"
#include "orbitcore/observability/observer.hpp"

#include <memory>

namespace orbitcore::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace orbitcore::observability
