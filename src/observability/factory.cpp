#include "cursorhist/observability/factory.hpp"

#include "cursorhist/common/fs.hpp"
#include "cursorhist/observability/log_observer.hpp"
#include "cursorhist/observability/noop_observer.hpp"

namespace cursorhist::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  return std::make_unique<LogObserver>(config.observability.verbose);
}

} // namespace cursorhist::observability
