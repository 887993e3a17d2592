#pragma once

#include "cursorhist/config/schema.hpp"
#include "cursorhist/observability/observer.hpp"

#include <memory>

namespace cursorhist::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace cursorhist::observability
