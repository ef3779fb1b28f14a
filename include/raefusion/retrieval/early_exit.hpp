#pragma once

#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/types.hpp"

#include <set>
#include <vector>

namespace raefusion::retrieval {

/// Decides whether the expensive engines can be skipped once the cheap ones
/// have answered. A small, non-empty primary result set means the query was
/// specific enough; a full one (count >= threshold) never skips.
class EarlyExitGuard {
public:
  explicit EarlyExitGuard(const config::EarlyExitConfig &config = {});

  [[nodiscard]] bool should_skip(const std::vector<EngineId> &remaining,
                                 const CandidateLists &results_so_far,
                                 const QueryClassification &classification) const;

  [[nodiscard]] bool is_expensive(EngineId engine) const { return expensive_.contains(engine); }
  [[nodiscard]] EngineId primary_engine() const { return primary_; }
  [[nodiscard]] std::size_t threshold() const { return threshold_; }

private:
  bool enabled_;
  std::size_t threshold_;
  EngineId primary_ = EngineId::Lexical;
  std::set<EngineId> expensive_;
};

} // namespace raefusion::retrieval
