#include "raefusion/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace raefusion::observability {

namespace {

std::string format_double(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << value;
  return out.str();
}

std::string join(const std::vector<std::string> &values) {
  std::string out;
  for (const auto &value : values) {
    if (!out.empty()) {
      out += ",";
    }
    out += value;
  }
  return out;
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RetrievalEvent>) {
          log_line("INFO", "retrieval.done label=" + evt.label + " profile=" + evt.profile +
                               " status=" + evt.status +
                               " results=" + std::to_string(evt.result_count) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SourceCallEvent>) {
          log_line("DEBUG", "source.call engine=" + evt.engine +
                                " results=" + std::to_string(evt.result_count) +
                                " success=" + (evt.success ? std::string("true")
                                                           : std::string("false")) +
                                " cached=" + (evt.cached ? std::string("true")
                                                         : std::string("false")) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SourceUnavailableEvent>) {
          log_line("WARN", "source.unavailable engine=" + evt.engine + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, EarlyExitEvent>) {
          log_line("DEBUG", "early_exit skipped=" + join(evt.skipped_engines) +
                                " primary_count=" + std::to_string(evt.primary_count));
        } else if constexpr (std::is_same_v<T, MissEvent>) {
          log_line("INFO", "miss label=" + evt.label + " profile=" + evt.profile +
                               " top_score=" + format_double(evt.top_score) +
                               " query=" + evt.fingerprint.substr(0, 12));
        } else if constexpr (std::is_same_v<T, ProfileFallbackEvent>) {
          log_line("WARN", "profile.fallback rejected=" + evt.rejected_profile +
                               " fallback=" + evt.fallback_profile + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, TunerRetuneEvent>) {
          log_line("INFO", "tuner.retune weights=" + evt.weights +
                               " feedback=" + std::to_string(evt.feedback_applied) +
                               " version=" + std::to_string(evt.version));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RetrievalLatencyMetric>) {
          log_line("DEBUG", "metric.retrieval_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TopScoreMetric>) {
          log_line("DEBUG", "metric.top_score=" + format_double(m.score));
        } else if constexpr (std::is_same_v<T, MissRateMetric>) {
          log_line("DEBUG", "metric.miss_rate=" + format_double(m.rate));
        } else if constexpr (std::is_same_v<T, PendingFeedbackMetric>) {
          log_line("DEBUG", "metric.pending_feedback=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace raefusion::observability
