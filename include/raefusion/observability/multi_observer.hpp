#pragma once

#include "raefusion/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace raefusion::observability {

/// Fans events out to several backends. A backend that throws is reported on
/// stderr and the remaining backends still receive the event.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] std::vector<std::string> names() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void for_each_backend(const char *what, Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace raefusion::observability
