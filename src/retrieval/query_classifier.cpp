#include "raefusion/retrieval/query_classifier.hpp"

#include "raefusion/common/strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace raefusion::retrieval {

namespace {

constexpr double ENTROPY_CEILING_BITS = 6.0; // log2(64)
constexpr double SEMANTIC_MASS_WORDS = 10.0;
constexpr std::string_view STRUCTURAL_CHARS = "#_/:.@-";

bool has_letter(const std::string &token) {
  return std::any_of(token.begin(), token.end(),
                     [](unsigned char c) { return std::isalpha(c) != 0; });
}

} // namespace

QueryClassifier::QueryClassifier(config::ClassifierConfig config) : config_(config) {}

bool QueryClassifier::is_identifier_token(const std::string &token) {
  if (token.empty()) {
    return false;
  }

  std::size_t letters = 0;
  std::size_t upper = 0;
  for (std::size_t i = 0; i < token.size(); ++i) {
    const auto c = static_cast<unsigned char>(token[i]);
    if (std::isdigit(c) != 0) {
      return true;
    }
    // Trailing punctuation is sentence structure, not an identifier.
    if (i + 1 < token.size() && STRUCTURAL_CHARS.find(token[i]) != std::string_view::npos) {
      return true;
    }
    if (std::isalpha(c) != 0) {
      ++letters;
      if (std::isupper(c) != 0) {
        ++upper;
      }
    }
    if (i > 0 && std::isupper(c) != 0 &&
        std::islower(static_cast<unsigned char>(token[i - 1])) != 0) {
      return true;
    }
  }

  return letters >= 2 && upper == letters;
}

double QueryClassifier::normalized_entropy(const std::string &text) {
  std::array<std::size_t, 256> counts{};
  std::size_t total = 0;
  for (const char ch : common::to_lower(text)) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isspace(c) != 0) {
      continue;
    }
    ++counts[c];
    ++total;
  }
  if (total == 0) {
    return 0.0;
  }

  double bits = 0.0;
  for (const auto count : counts) {
    if (count == 0) {
      continue;
    }
    const double p = static_cast<double>(count) / static_cast<double>(total);
    bits -= p * std::log2(p);
  }
  return std::clamp(bits / ENTROPY_CEILING_BITS, 0.0, 1.0);
}

QueryClassification QueryClassifier::classify(const Query &query) const {
  return classify(query.text);
}

QueryClassification QueryClassifier::classify(const std::string &text) const {
  QueryClassification out;
  const auto tokens = common::split_whitespace(text);
  if (tokens.empty()) {
    out.label = QueryLabel::IdentifierLike;
    return out;
  }

  std::size_t structural = 0;
  std::size_t words = 0;
  for (const auto &token : tokens) {
    if (is_identifier_token(token)) {
      ++structural;
    } else if (has_letter(token)) {
      ++words;
    }
  }

  out.structural_ratio = static_cast<double>(structural) / static_cast<double>(tokens.size());
  out.semantic_mass = std::min(1.0, static_cast<double>(words) / SEMANTIC_MASS_WORDS);
  out.entropy = normalized_entropy(text);
  out.resonance = std::clamp((1.0 - out.structural_ratio) *
                                 (0.4 + 0.3 * out.semantic_mass + 0.3 * out.entropy),
                             0.0, 1.0);

  if (out.resonance < config_.identifier_threshold) {
    out.label = QueryLabel::IdentifierLike;
  } else if (out.resonance > config_.abstract_threshold) {
    out.label = QueryLabel::Abstract;
  } else {
    out.label = QueryLabel::Factual;
  }
  return out;
}

} // namespace raefusion::retrieval
