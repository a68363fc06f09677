#pragma once

#include "parley/config/schema.hpp"
#include "parley/observability/observer.hpp"

#include <memory>

namespace parley::observability {

/// Builds the observer named by `observability.backend`; a comma list builds a MultiObserver.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace parley::observability
