#pragma once

#include "raefusion/common/result.hpp"
#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

namespace raefusion::retrieval {

struct FusionOutput {
  std::vector<FusedResult> results;
  RetrievalStatus status = RetrievalStatus::Normal;
  common::ErrorCode error = common::ErrorCode::None;
  std::shared_ptr<const WeightProfile> profile;
  FusionStrategy strategy = FusionStrategy::Rrf;
  bool profile_fallback = false;
  std::size_t pruned = 0;
};

/// Merges per-engine candidate lists into one ranking.
///
/// RRF:   score = sum_e w[e] / (k + rank[e])           (raw weights)
/// Score: score = sum_e w[e] / W * minmax(raw[e])      (weights normalized)
///
/// Items seen by more than one engine are multiplied by the synergy boost,
/// then V-Clip caps scores at the band maximum and drops the tail below the
/// band minimum. Output is a pure function of the inputs and the profile.
class FusionEngine {
public:
  explicit FusionEngine(config::FusionConfig config = {});

  [[nodiscard]] FusionOutput fuse(const CandidateLists &lists, const WeightProfile &profile,
                                  std::optional<FusionStrategy> strategy_override = std::nullopt) const;

  /// Highest composite `fuse` can assign under `profile` and `strategy`.
  [[nodiscard]] double score_ceiling(const WeightProfile &profile, FusionStrategy strategy) const;

  [[nodiscard]] std::shared_ptr<const WeightProfile> last_known_good() const {
    return last_good_.load();
  }
  [[nodiscard]] const config::FusionConfig &config() const { return config_; }

private:
  [[nodiscard]] std::shared_ptr<const WeightProfile> resolve_profile(const WeightProfile &profile,
                                                                     bool &fallback) const;

  config::FusionConfig config_;
  mutable std::atomic<std::shared_ptr<const WeightProfile>> last_good_;
};

} // namespace raefusion::retrieval
