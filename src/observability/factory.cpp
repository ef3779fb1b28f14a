#include "raefusion/observability/factory.hpp"

#include "raefusion/common/strings.hpp"
#include "raefusion/observability/global.hpp"
#include "raefusion/observability/log_observer.hpp"
#include "raefusion/observability/multi_observer.hpp"

#include <algorithm>

namespace raefusion::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

std::vector<std::string> parse_backend_list(const std::string &backends) {
  std::vector<std::string> out;
  for (const auto &part : common::split(common::to_lower(backends), ',')) {
    std::string name = common::trim(part);
    if (name == "none") {
      name = "noop";
    }
    if (name != "log" && name != "noop") {
      continue;
    }
    if (std::find(out.begin(), out.end(), name) == out.end()) {
      out.push_back(std::move(name));
    }
  }
  return out;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto backends = parse_backend_list(config.observability.backend);
  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backends.size() == 1) {
    return create_single(backends.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &backend : backends) {
    multi->add(create_single(backend));
  }
  return multi;
}

void install_observer(const config::Config &config) {
  set_global_observer(create_observer(config));
}

} // namespace raefusion::observability
