#include "raefusion/retrieval/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace raefusion::retrieval {

RetrievalMetrics::RetrievalMetrics(const std::size_t window) : window_(std::max<std::size_t>(1, window)) {}

void RetrievalMetrics::record_query(const RetrievalStatus status, const double top_score,
                                    const bool miss, const double score_ceiling) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++queries_;
  if (miss) {
    ++misses_;
  }
  if (status == RetrievalStatus::Degraded) {
    ++degraded_;
  } else if (status == RetrievalStatus::Unavailable) {
    ++unavailable_;
    // Outages say nothing about ranking quality.
    return;
  }

  const double score = std::isfinite(top_score) ? top_score : 0.0;
  const double fraction =
      std::isfinite(score_ceiling) && score_ceiling > 0.0 ? score / score_ceiling : score;
  samples_.push_back(Sample{.top_score = score, .fraction = fraction, .miss = miss});
  while (samples_.size() > window_) {
    samples_.pop_front();
  }
}

void RetrievalMetrics::record_feedback(const std::size_t rank, const Relevance relevance) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++feedback_count_;
  if (relevance == Relevance::Relevant) {
    reciprocal_rank_sum_ += 1.0 / static_cast<double>(std::max<std::size_t>(1, rank));
  }
}

MetricsSnapshot RetrievalMetrics::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot out;
  out.queries = queries_;
  out.misses = misses_;
  out.degraded = degraded_;
  out.unavailable = unavailable_;
  out.window_size = samples_.size();
  out.feedback_count = feedback_count_;
  out.mrr = feedback_count_ == 0
                ? 0.0
                : reciprocal_rank_sum_ / static_cast<double>(feedback_count_);

  if (samples_.empty()) {
    return out;
  }

  std::size_t window_misses = 0;
  double score_sum = 0.0;
  for (const auto &sample : samples_) {
    if (sample.miss) {
      ++window_misses;
    }
    score_sum += sample.top_score;
    const double clamped = std::clamp(sample.fraction, 0.0, 1.0);
    const auto bucket = std::min<std::size_t>(
        SCORE_BUCKETS - 1, static_cast<std::size_t>(clamped * static_cast<double>(SCORE_BUCKETS)));
    ++out.score_histogram[bucket];
  }
  const auto n = static_cast<double>(samples_.size());
  out.miss_rate = static_cast<double>(window_misses) / n;
  out.mean_top_score = score_sum / n;
  return out;
}

} // namespace raefusion::retrieval
