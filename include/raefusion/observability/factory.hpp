#pragma once

#include "raefusion/config/schema.hpp"
#include "raefusion/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace raefusion::observability {

/// Known backend names in `backends` (comma separated), lowercased, in first
/// occurrence order. `none` is an alias of `noop`.
[[nodiscard]] std::vector<std::string> parse_backend_list(const std::string &backends);

/// Builds the observer for `[observability] backend`. One known backend yields
/// that backend; several yield a MultiObserver; none yields a NoopObserver.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

/// Installs `create_observer(config)` as the process observer.
void install_observer(const config::Config &config);

} // namespace raefusion::observability
