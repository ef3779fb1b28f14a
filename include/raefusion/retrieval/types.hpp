#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raefusion::retrieval {

enum class EngineId { Vector, Lexical, Graph };

inline constexpr std::array<EngineId, 3> ALL_ENGINES = {EngineId::Vector, EngineId::Lexical,
                                                        EngineId::Graph};

enum class FusionStrategy { Rrf, Score };

enum class ClipMode { Strict, Lenient };

enum class QueryLabel { IdentifierLike, Factual, Abstract };

enum class RetrievalStatus { Normal, Degraded, Unavailable };

enum class Relevance { Relevant, NotRelevant };

[[nodiscard]] std::string_view engine_to_string(EngineId engine);
[[nodiscard]] std::optional<EngineId> engine_from_string(const std::string &value);
[[nodiscard]] std::string_view strategy_to_string(FusionStrategy strategy);
[[nodiscard]] std::optional<FusionStrategy> strategy_from_string(const std::string &value);
[[nodiscard]] std::string_view clip_to_string(ClipMode clip);
[[nodiscard]] std::optional<ClipMode> clip_from_string(const std::string &value);
[[nodiscard]] std::string_view label_to_string(QueryLabel label);
[[nodiscard]] std::string_view status_to_string(RetrievalStatus status);

struct Query {
  std::string text;
  std::map<std::string, std::string> filters;
  std::optional<std::uint32_t> traversal_depth;
};

struct QueryClassification {
  double resonance = 0.0;
  QueryLabel label = QueryLabel::IdentifierLike;
  double entropy = 0.0;
  double structural_ratio = 0.0;
  double semantic_mass = 0.0;
};

/// One hit as returned by an external engine, best first.
struct ScoredItem {
  std::string item_id;
  double score = 0.0;
};

struct CandidateResult {
  EngineId engine = EngineId::Vector;
  std::string item_id;
  double raw_score = 0.0;
  std::size_t rank = 1;
};

struct Contribution {
  EngineId engine = EngineId::Vector;
  double raw_score = 0.0;
  std::size_t rank = 1;
  double weighted = 0.0;
};

struct FusedResult {
  std::string item_id;
  double score = 0.0;
  std::vector<Contribution> contributions;
};

struct WeightProfile {
  std::string name;
  std::map<EngineId, double> weights;
  FusionStrategy strategy = FusionStrategy::Rrf;
  ClipMode clip = ClipMode::Strict;
  std::uint64_t version = 0;

  [[nodiscard]] double weight(EngineId engine) const;
  [[nodiscard]] double total_weight() const;
};

struct SourceResult {
  std::vector<CandidateResult> candidates;
  bool available = true;
  std::string error;
};

using CandidateLists = std::map<EngineId, SourceResult>;

struct Feedback {
  std::string item_id;
  std::vector<Contribution> contributions;
  std::size_t rank = 1;
  Relevance relevance = Relevance::Relevant;
};

struct FailureEvent {
  QueryClassification classification;
  std::vector<EngineId> engines_queried;
  std::string timestamp;
  WeightProfile profile;
  double top_score = 0.0;
  std::string query_fingerprint;
};

/// "vector=1.000,lexical=2.000,graph=0.250"
[[nodiscard]] std::string describe_weights(const WeightProfile &profile);

} // namespace raefusion::retrieval
