#include "raefusion/retrieval/early_exit.hpp"

#include <algorithm>

namespace raefusion::retrieval {

EarlyExitGuard::EarlyExitGuard(const config::EarlyExitConfig &config)
    : enabled_(config.enabled), threshold_(config.threshold) {
  if (const auto primary = engine_from_string(config.primary_engine); primary.has_value()) {
    primary_ = *primary;
  }
  for (const auto &name : config.expensive_engines) {
    if (const auto engine = engine_from_string(name); engine.has_value() && *engine != primary_) {
      expensive_.insert(*engine);
    }
  }
}

bool EarlyExitGuard::should_skip(const std::vector<EngineId> &remaining,
                                 const CandidateLists &results_so_far,
                                 const QueryClassification &classification) const {
  if (!enabled_ || threshold_ == 0) {
    return false;
  }
  if (classification.label == QueryLabel::Abstract) {
    return false;
  }
  if (std::none_of(remaining.begin(), remaining.end(),
                   [this](const EngineId engine) { return is_expensive(engine); })) {
    return false;
  }

  const auto it = results_so_far.find(primary_);
  if (it == results_so_far.end() || !it->second.available) {
    return false;
  }
  const std::size_t count = it->second.candidates.size();
  return count > 0 && count < threshold_;
}

} // namespace raefusion::retrieval
