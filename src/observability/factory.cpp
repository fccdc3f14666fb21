#include "playwarden/observability/factory.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/observability/log_observer.hpp"

namespace playwarden::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace playwarden::observability
