#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace raefusion::observability {

struct RetrievalEvent {
  std::string label;
  std::string profile;
  std::string status;
  std::size_t result_count = 0;
  std::chrono::milliseconds duration{0};
};

struct SourceCallEvent {
  std::string engine;
  std::chrono::milliseconds duration{0};
  std::size_t result_count = 0;
  bool success = false;
  bool cached = false;
};

struct SourceUnavailableEvent {
  std::string engine;
  std::string reason;
};

struct EarlyExitEvent {
  std::vector<std::string> skipped_engines;
  std::size_t primary_count = 0;
};

struct MissEvent {
  std::string label;
  std::string profile;
  double top_score = 0.0;
  std::string fingerprint;
};

struct ProfileFallbackEvent {
  std::string rejected_profile;
  std::string fallback_profile;
  std::string reason;
};

struct TunerRetuneEvent {
  std::string weights;
  std::size_t feedback_applied = 0;
  std::uint64_t version = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RetrievalEvent, SourceCallEvent, SourceUnavailableEvent, EarlyExitEvent,
                 MissEvent, ProfileFallbackEvent, TunerRetuneEvent, ErrorEvent>;

struct RetrievalLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TopScoreMetric {
  double score = 0.0;
};

struct MissRateMetric {
  double rate = 0.0;
};

struct PendingFeedbackMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric =
    std::variant<RetrievalLatencyMetric, TopScoreMetric, MissRateMetric, PendingFeedbackMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Backend `noop` (alias `none`): drops everything.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace raefusion::observability
