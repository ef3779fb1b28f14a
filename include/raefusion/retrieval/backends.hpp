#pragma once

#include "raefusion/common/cancellation.hpp"
#include "raefusion/common/result.hpp"
#include "raefusion/retrieval/types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace raefusion::retrieval {

using Filters = std::map<std::string, std::string>;
using ScoredItems = std::vector<ScoredItem>;

/// Dense-vector similarity index. Results best first.
class IVectorBackend {
public:
  virtual ~IVectorBackend() = default;

  [[nodiscard]] virtual common::Result<ScoredItems>
  search(const std::string &text, const Filters &filters, std::size_t limit,
         const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Full-text index. Results best first.
class ILexicalBackend {
public:
  virtual ~ILexicalBackend() = default;

  [[nodiscard]] virtual common::Result<ScoredItems>
  search(const std::string &text, const Filters &filters, std::size_t limit,
         const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Graph store. Expands the neighborhood of seed items up to `depth` hops.
class IGraphBackend {
public:
  virtual ~IGraphBackend() = default;

  [[nodiscard]] virtual common::Result<ScoredItems>
  traverse(const std::vector<std::string> &seed_items, std::uint32_t depth, std::size_t limit,
           const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Receives miss events for offline analysis.
class IReflectionSink {
public:
  virtual ~IReflectionSink() = default;

  virtual void on_failure(const FailureEvent &event) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace raefusion::retrieval
