#include "raefusion/retrieval/types.hpp"

#include "raefusion/common/strings.hpp"

#include <iomanip>
#include <sstream>

namespace raefusion::retrieval {

std::string_view engine_to_string(const EngineId engine) {
  switch (engine) {
  case EngineId::Vector:
    return "vector";
  case EngineId::Lexical:
    return "lexical";
  case EngineId::Graph:
    return "graph";
  }
  return "vector";
}

std::optional<EngineId> engine_from_string(const std::string &value) {
  const std::string v = common::to_lower(common::trim(value));
  if (v == "vector") {
    return EngineId::Vector;
  }
  if (v == "lexical") {
    return EngineId::Lexical;
  }
  if (v == "graph") {
    return EngineId::Graph;
  }
  return std::nullopt;
}

std::string_view strategy_to_string(const FusionStrategy strategy) {
  return strategy == FusionStrategy::Rrf ? "rrf" : "score";
}

std::optional<FusionStrategy> strategy_from_string(const std::string &value) {
  const std::string v = common::to_lower(common::trim(value));
  if (v == "rrf") {
    return FusionStrategy::Rrf;
  }
  if (v == "score") {
    return FusionStrategy::Score;
  }
  return std::nullopt;
}

std::string_view clip_to_string(const ClipMode clip) {
  return clip == ClipMode::Strict ? "strict" : "lenient";
}

std::optional<ClipMode> clip_from_string(const std::string &value) {
  const std::string v = common::to_lower(common::trim(value));
  if (v == "strict") {
    return ClipMode::Strict;
  }
  if (v == "lenient") {
    return ClipMode::Lenient;
  }
  return std::nullopt;
}

std::string_view label_to_string(const QueryLabel label) {
  switch (label) {
  case QueryLabel::IdentifierLike:
    return "identifier_like";
  case QueryLabel::Factual:
    return "factual";
  case QueryLabel::Abstract:
    return "abstract";
  }
  return "factual";
}

std::string_view status_to_string(const RetrievalStatus status) {
  switch (status) {
  case RetrievalStatus::Normal:
    return "normal";
  case RetrievalStatus::Degraded:
    return "degraded";
  case RetrievalStatus::Unavailable:
    return "unavailable";
  }
  return "normal";
}

double WeightProfile::weight(const EngineId engine) const {
  const auto it = weights.find(engine);
  return it == weights.end() ? 0.0 : it->second;
}

double WeightProfile::total_weight() const {
  double total = 0.0;
  for (const auto &[engine, value] : weights) {
    (void)engine;
    total += value;
  }
  return total;
}

std::string describe_weights(const WeightProfile &profile) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3);
  bool first = true;
  for (const auto engine : ALL_ENGINES) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << engine_to_string(engine) << "=" << profile.weight(engine);
  }
  return out.str();
}

} // namespace raefusion::retrieval
