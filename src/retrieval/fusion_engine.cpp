#include "raefusion/retrieval/fusion_engine.hpp"

#include "raefusion/observability/global.hpp"
#include "raefusion/retrieval/weight_policy.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace raefusion::retrieval {

namespace {

struct MinMax {
  double min = std::numeric_limits<double>::infinity();
  double max = -std::numeric_limits<double>::infinity();

  [[nodiscard]] double normalize(const double value) const {
    if (!std::isfinite(value) || !std::isfinite(min)) {
      return 0.0;
    }
    if (max - min <= 0.0) {
      return 1.0;
    }
    return (value - min) / (max - min);
  }
};

MinMax score_range(const std::vector<CandidateResult> &candidates) {
  MinMax range;
  for (const auto &candidate : candidates) {
    if (!std::isfinite(candidate.raw_score)) {
      continue;
    }
    range.min = std::min(range.min, candidate.raw_score);
    range.max = std::max(range.max, candidate.raw_score);
  }
  return range;
}

EngineId dominant_engine(const WeightProfile &profile) {
  EngineId best = ALL_ENGINES.front();
  double best_weight = -1.0;
  for (const auto engine : ALL_ENGINES) {
    const double w = profile.weight(engine);
    if (w > best_weight) {
      best = engine;
      best_weight = w;
    }
  }
  return best;
}

std::size_t rank_in(const FusedResult &result, const EngineId engine) {
  for (const auto &contribution : result.contributions) {
    if (contribution.engine == engine) {
      return contribution.rank;
    }
  }
  return std::numeric_limits<std::size_t>::max();
}

} // namespace

FusionEngine::FusionEngine(config::FusionConfig config) : config_(config) {}

std::shared_ptr<const WeightProfile> FusionEngine::resolve_profile(const WeightProfile &profile,
                                                                   bool &fallback) const {
  const auto status = validate_profile(profile);
  if (status.ok()) {
    auto snapshot = std::make_shared<const WeightProfile>(profile);
    last_good_.store(snapshot);
    fallback = false;
    return snapshot;
  }

  fallback = true;
  auto replacement = last_good_.load();
  if (replacement == nullptr) {
    replacement = std::make_shared<const WeightProfile>(builtin_profiles()[1]);
  }
  observability::record_profile_fallback(profile.name, replacement->name, status.error());
  return replacement;
}

FusionOutput FusionEngine::fuse(const CandidateLists &lists, const WeightProfile &profile,
                                const std::optional<FusionStrategy> strategy_override) const {
  FusionOutput out;
  out.profile = resolve_profile(profile, out.profile_fallback);
  out.strategy = strategy_override.value_or(out.profile->strategy);

  std::size_t available = 0;
  for (const auto &[engine, source] : lists) {
    (void)engine;
    if (source.available) {
      ++available;
    }
  }
  if (!lists.empty() && available == 0) {
    out.status = RetrievalStatus::Unavailable;
    out.error = common::ErrorCode::AllSourcesUnavailable;
    return out;
  }
  if (available < lists.size()) {
    out.status = RetrievalStatus::Degraded;
  }

  const WeightProfile &active = *out.profile;
  const double total_weight = active.total_weight();
  const double rrf_k = config_.rrf_k;

  std::unordered_map<std::string, FusedResult> merged;
  for (const auto &[engine, source] : lists) {
    if (!source.available) {
      continue;
    }
    const double raw_weight = active.weight(engine);
    const double weight =
        out.strategy == FusionStrategy::Score ? raw_weight / total_weight : raw_weight;
    const MinMax range = score_range(source.candidates);

    for (const auto &candidate : source.candidates) {
      const double signal = out.strategy == FusionStrategy::Rrf
                                ? 1.0 / (rrf_k + static_cast<double>(candidate.rank))
                                : range.normalize(candidate.raw_score);
      const double weighted = weight * signal;

      auto &row = merged[candidate.item_id];
      row.item_id = candidate.item_id;
      // Adapters dedupe, but a hand-built list may not: keep the best rank.
      const auto existing =
          std::find_if(row.contributions.begin(), row.contributions.end(),
                       [&](const Contribution &c) { return c.engine == engine; });
      if (existing != row.contributions.end()) {
        if (candidate.rank < existing->rank) {
          row.score += weighted - existing->weighted;
          *existing = Contribution{.engine = engine,
                                   .raw_score = candidate.raw_score,
                                   .rank = candidate.rank,
                                   .weighted = weighted};
        }
        continue;
      }
      row.score += weighted;
      row.contributions.push_back(Contribution{.engine = engine,
                                               .raw_score = candidate.raw_score,
                                               .rank = candidate.rank,
                                               .weighted = weighted});
    }
  }

  const bool lenient = active.clip == ClipMode::Lenient;
  const double clip_min = lenient ? config_.lenient_clip_min : config_.strict_clip_min;
  const double clip_max = lenient ? config_.lenient_clip_max : config_.strict_clip_max;

  out.results.reserve(merged.size());
  for (auto &[item_id, row] : merged) {
    (void)item_id;
    if (row.contributions.size() > 1) {
      row.score *= config_.synergy_boost;
    }
    row.score = std::min(row.score, clip_max);
    if (row.score < clip_min) {
      ++out.pruned;
      continue;
    }
    std::sort(row.contributions.begin(), row.contributions.end(),
              [](const Contribution &lhs, const Contribution &rhs) {
                if (lhs.weighted != rhs.weighted) {
                  return lhs.weighted > rhs.weighted;
                }
                return lhs.engine < rhs.engine;
              });
    out.results.push_back(std::move(row));
  }

  const EngineId tie_engine = dominant_engine(active);
  std::sort(out.results.begin(), out.results.end(),
            [tie_engine](const FusedResult &lhs, const FusedResult &rhs) {
              if (lhs.score != rhs.score) {
                return lhs.score > rhs.score;
              }
              const auto lhs_rank = rank_in(lhs, tie_engine);
              const auto rhs_rank = rank_in(rhs, tie_engine);
              if (lhs_rank != rhs_rank) {
                return lhs_rank < rhs_rank;
              }
              return lhs.item_id < rhs.item_id;
            });

  return out;
}

double FusionEngine::score_ceiling(const WeightProfile &profile,
                                   const FusionStrategy strategy) const {
  const double boost = std::max(1.0, config_.synergy_boost);
  const double best = strategy == FusionStrategy::Rrf
                          ? profile.total_weight() * boost / (config_.rrf_k + 1.0)
                          : boost;
  const bool lenient = profile.clip == ClipMode::Lenient;
  return std::min(best, lenient ? config_.lenient_clip_max : config_.strict_clip_max);
}

} // namespace raefusion::retrieval
