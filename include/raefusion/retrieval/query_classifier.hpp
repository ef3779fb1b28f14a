#pragma once

#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/types.hpp"

#include <string>

namespace raefusion::retrieval {

/// Scores how "semantic" a query reads.
///
/// resonance = (1 - structural_ratio) * (0.4 + 0.3 * semantic_mass + 0.3 * entropy)
///
/// Identifier-heavy text (ticket numbers, error codes, paths) lands low and is
/// routed to lexical matching; long natural-language questions land high.
class QueryClassifier {
public:
  explicit QueryClassifier(config::ClassifierConfig config = {});

  [[nodiscard]] QueryClassification classify(const Query &query) const;
  [[nodiscard]] QueryClassification classify(const std::string &text) const;

  [[nodiscard]] static bool is_identifier_token(const std::string &token);
  [[nodiscard]] static double normalized_entropy(const std::string &text);

private:
  config::ClassifierConfig config_;
};

} // namespace raefusion::retrieval
