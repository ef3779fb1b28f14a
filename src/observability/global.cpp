#include "raefusion/observability/global.hpp"

#include <mutex>

namespace raefusion::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> replacement(std::move(observer));
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer.swap(replacement);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_retrieval(const std::string &label, const std::string &profile,
                      const std::string &status, const std::size_t result_count,
                      const std::chrono::milliseconds duration) {
  record_event(RetrievalEvent{.label = label,
                              .profile = profile,
                              .status = status,
                              .result_count = result_count,
                              .duration = duration});
  record_metric(RetrievalLatencyMetric{.latency = duration});
}

void record_source_call(const std::string &engine, const std::chrono::milliseconds duration,
                        const std::size_t result_count, const bool success, const bool cached) {
  record_event(SourceCallEvent{.engine = engine,
                               .duration = duration,
                               .result_count = result_count,
                               .success = success,
                               .cached = cached});
}

void record_source_unavailable(const std::string &engine, const std::string &reason) {
  record_event(SourceUnavailableEvent{.engine = engine, .reason = reason});
}

void record_early_exit(const std::vector<std::string> &skipped, const std::size_t primary_count) {
  record_event(EarlyExitEvent{.skipped_engines = skipped, .primary_count = primary_count});
}

void record_miss(const std::string &label, const std::string &profile, const double top_score,
                 const std::string &fingerprint) {
  record_event(MissEvent{
      .label = label, .profile = profile, .top_score = top_score, .fingerprint = fingerprint});
}

void record_profile_fallback(const std::string &rejected, const std::string &fallback,
                             const std::string &reason) {
  record_event(ProfileFallbackEvent{
      .rejected_profile = rejected, .fallback_profile = fallback, .reason = reason});
}

void record_retune(const std::string &weights, const std::size_t feedback_applied,
                   const std::uint64_t version) {
  record_event(TunerRetuneEvent{
      .weights = weights, .feedback_applied = feedback_applied, .version = version});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace raefusion::observability
