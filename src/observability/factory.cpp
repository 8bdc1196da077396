#include "gardener/observability/factory.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/observability/log_observer.hpp"
#include "gardener/observability/noop_observer.hpp"

namespace gardener::observability {

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  // Unknown backends are reported by validate_config and still get logging.
  return std::make_unique<LogObserver>(config.verbose);
}

} // namespace gardener::observability
