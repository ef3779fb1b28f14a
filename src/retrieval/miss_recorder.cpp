#include "raefusion/retrieval/miss_recorder.hpp"

#include "raefusion/common/hash.hpp"
#include "raefusion/common/strings.hpp"
#include "raefusion/observability/global.hpp"

namespace raefusion::retrieval {

MissRecorder::MissRecorder(config::MissConfig config)
    : config_(std::move(config)), worker_([this]() { worker_loop(); }) {}

MissRecorder::~MissRecorder() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void MissRecorder::add_sink(std::shared_ptr<IReflectionSink> sink) {
  if (sink == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

double MissRecorder::floor_for(const FusionStrategy strategy) const {
  return strategy == FusionStrategy::Rrf ? config_.rrf_relevance_floor : config_.relevance_floor;
}

bool MissRecorder::is_miss(const std::vector<FusedResult> &results,
                           const FusionStrategy strategy) const {
  if (results.empty()) {
    return true;
  }
  return results.front().score < floor_for(strategy);
}

std::optional<FailureEvent> MissRecorder::inspect(const std::vector<FusedResult> &results,
                                                  const QueryClassification &classification,
                                                  const WeightProfile &profile,
                                                  const MissContext &context) {
  // Infrastructure failure and cancellation are reported elsewhere.
  if (context.cancelled || context.status == RetrievalStatus::Unavailable) {
    return std::nullopt;
  }
  if (!is_miss(results, context.strategy.value_or(profile.strategy))) {
    return std::nullopt;
  }

  FailureEvent event;
  event.classification = classification;
  event.engines_queried = context.engines_queried;
  event.timestamp = common::now_rfc3339();
  event.profile = profile;
  event.top_score = results.empty() ? 0.0 : results.front().score;
  event.query_fingerprint = common::sha256_hex(context.query_text);

  ++recorded_;
  observability::record_miss(std::string(label_to_string(classification.label)), profile.name,
                             event.top_score, event.query_fingerprint);
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(event);
  }
  queue_cv_.notify_one();
  return event;
}

void MissRecorder::flush() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && !delivering_; });
}

void MissRecorder::worker_loop() {
  while (true) {
    FailureEvent event;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
      delivering_ = true;
    }

    deliver(event);

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      delivering_ = false;
    }
    idle_cv_.notify_all();
  }
}

void MissRecorder::deliver(const FailureEvent &event) {
  std::vector<std::shared_ptr<IReflectionSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks = sinks_;
  }
  for (const auto &sink : sinks) {
    try {
      sink->on_failure(event);
    } catch (const std::exception &ex) {
      observability::record_error("miss_recorder",
                                  std::string(sink->name()) + " rejected event: " + ex.what());
    } catch (...) {
      observability::record_error("miss_recorder", std::string(sink->name()) +
                                                       " rejected event: non-standard exception");
    }
  }
}

} // namespace raefusion::retrieval
