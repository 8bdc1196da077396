#pragma once

#include "gardener/config/schema.hpp"
#include "gardener/observability/observer.hpp"

#include <memory>

namespace gardener::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace gardener::observability
