#pragma once

#include "raefusion/observability/observer.hpp"

#include <memory>

namespace raefusion::observability {

/// Replaces the process observer. Threads already inside a `record_*` call
/// finish against the observer they started with.
void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_retrieval(const std::string &label, const std::string &profile,
                      const std::string &status, std::size_t result_count,
                      std::chrono::milliseconds duration);
void record_source_call(const std::string &engine, std::chrono::milliseconds duration,
                        std::size_t result_count, bool success, bool cached);
void record_source_unavailable(const std::string &engine, const std::string &reason);
void record_early_exit(const std::vector<std::string> &skipped, std::size_t primary_count);
void record_miss(const std::string &label, const std::string &profile, double top_score,
                 const std::string &fingerprint);
void record_profile_fallback(const std::string &rejected, const std::string &fallback,
                             const std::string &reason);
void record_retune(const std::string &weights, std::size_t feedback_applied,
                   std::uint64_t version);
void record_error(const std::string &component, const std::string &message);

} // namespace raefusion::observability
