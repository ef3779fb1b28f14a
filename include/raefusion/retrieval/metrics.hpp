#pragma once

#include "raefusion/retrieval/types.hpp"

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace raefusion::retrieval {

inline constexpr std::size_t SCORE_BUCKETS = 10;

struct MetricsSnapshot {
  std::shared_ptr<const WeightProfile> tuned_profile;
  std::uint64_t queries = 0;
  std::uint64_t misses = 0;
  std::uint64_t degraded = 0;
  std::uint64_t unavailable = 0;
  std::size_t window_size = 0;
  double miss_rate = 0.0;
  double mean_top_score = 0.0;
  std::array<std::uint64_t, SCORE_BUCKETS> score_histogram{};
  std::uint64_t feedback_count = 0;
  double mrr = 0.0;
  std::size_t pending_feedback = 0;
};

/// Rolling view over recent queries plus cumulative feedback MRR.
class RetrievalMetrics {
public:
  explicit RetrievalMetrics(std::size_t window = 200);

  /// `score_ceiling` is the best composite the strategy could produce; the
  /// histogram buckets `top_score / score_ceiling`.
  void record_query(RetrievalStatus status, double top_score, bool miss,
                    double score_ceiling = 1.0);
  void record_feedback(std::size_t rank, Relevance relevance);

  [[nodiscard]] MetricsSnapshot snapshot() const;

private:
  struct Sample {
    double top_score = 0.0;
    double fraction = 0.0;
    bool miss = false;
  };

  std::size_t window_;
  mutable std::mutex mutex_;
  std::deque<Sample> samples_;
  std::uint64_t queries_ = 0;
  std::uint64_t misses_ = 0;
  std::uint64_t degraded_ = 0;
  std::uint64_t unavailable_ = 0;
  std::uint64_t feedback_count_ = 0;
  double reciprocal_rank_sum_ = 0.0;
};

} // namespace raefusion::retrieval
