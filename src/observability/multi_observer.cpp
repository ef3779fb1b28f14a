#include "raefusion/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace raefusion::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

std::vector<std::string> MultiObserver::names() const {
  std::vector<std::string> out;
  out.reserve(observers_.size());
  for (const auto &observer : observers_) {
    out.emplace_back(observer->name());
  }
  return out;
}

template <typename Fn> void MultiObserver::for_each_backend(const char *what, Fn &&fn) {
  for (auto &observer : observers_) {
    try {
      fn(*observer);
    } catch (const std::exception &ex) {
      // Reporting through the observer chain would recurse into the failing backend.
      std::cerr << "[error] observer " << observer->name() << " failed to " << what << ": "
                << ex.what() << "\n";
    }
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_backend("record event", [&](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_backend("record metric", [&](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_backend("flush", [](IObserver &observer) { observer.flush(); });
}

} // namespace raefusion::observability
