#pragma once

#include "raefusion/common/cancellation.hpp"
#include "raefusion/common/result.hpp"
#include "raefusion/retrieval/backends.hpp"
#include "raefusion/retrieval/result_cache.hpp"
#include "raefusion/retrieval/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace raefusion::retrieval {

struct SourceRequest {
  std::string text;
  Filters filters;
  std::size_t limit = 20;
  std::uint32_t depth = 2;
  std::vector<std::string> seeds;
  bool use_cache = true;
};

struct SourceOptions {
  std::uint32_t failure_threshold = 3;
  std::chrono::milliseconds cooldown{30'000};
};

/// Uniform, fail-open wrapper around one external engine.
///
/// `fetch` never throws: backend errors, exceptions, timeouts and an open
/// circuit all come back as `ErrorCode::SourceUnavailable`. Candidates keep the
/// backend's order and receive 1-based ranks by position.
class CandidateSource {
public:
  CandidateSource(EngineId engine, SourceOptions options, std::shared_ptr<ResultCache> cache);
  virtual ~CandidateSource() = default;

  CandidateSource(const CandidateSource &) = delete;
  CandidateSource &operator=(const CandidateSource &) = delete;

  [[nodiscard]] EngineId engine() const { return engine_; }

  [[nodiscard]] common::Result<std::vector<CandidateResult>>
  fetch(const SourceRequest &request, std::chrono::milliseconds timeout,
        const common::CancellationToken &cancel);

  [[nodiscard]] bool circuit_open() const;
  [[nodiscard]] std::uint32_t consecutive_failures() const;

protected:
  using BackendCall = std::function<common::Result<ScoredItems>()>;

  /// Builds a self-contained call. It may outlive this adapter, so it must own
  /// everything it touches.
  [[nodiscard]] virtual BackendCall make_call(const SourceRequest &request,
                                              const common::CancellationToken &cancel) const = 0;

  /// Requests that need no backend round-trip (e.g. traversal without seeds).
  [[nodiscard]] virtual bool is_trivially_empty(const SourceRequest &) const { return false; }

private:
  [[nodiscard]] std::string cache_key(const SourceRequest &request) const;
  [[nodiscard]] std::vector<CandidateResult> to_candidates(const ScoredItems &items,
                                                           std::size_t limit) const;
  void record_success();
  void record_failure();

  EngineId engine_;
  SourceOptions options_;
  std::shared_ptr<ResultCache> cache_;
  mutable std::mutex state_mutex_;
  std::uint32_t failure_count_ = 0;
  std::chrono::steady_clock::time_point open_until_{};
};

class VectorSource final : public CandidateSource {
public:
  VectorSource(std::shared_ptr<IVectorBackend> backend, SourceOptions options,
               std::shared_ptr<ResultCache> cache = nullptr);

protected:
  [[nodiscard]] BackendCall make_call(const SourceRequest &request,
                                      const common::CancellationToken &cancel) const override;

private:
  std::shared_ptr<IVectorBackend> backend_;
};

class LexicalSource final : public CandidateSource {
public:
  LexicalSource(std::shared_ptr<ILexicalBackend> backend, SourceOptions options,
                std::shared_ptr<ResultCache> cache = nullptr);

protected:
  [[nodiscard]] BackendCall make_call(const SourceRequest &request,
                                      const common::CancellationToken &cancel) const override;

private:
  std::shared_ptr<ILexicalBackend> backend_;
};

class GraphSource final : public CandidateSource {
public:
  GraphSource(std::shared_ptr<IGraphBackend> backend, SourceOptions options,
              std::shared_ptr<ResultCache> cache = nullptr);

protected:
  [[nodiscard]] BackendCall make_call(const SourceRequest &request,
                                      const common::CancellationToken &cancel) const override;
  [[nodiscard]] bool is_trivially_empty(const SourceRequest &request) const override {
    return request.seeds.empty();
  }

private:
  std::shared_ptr<IGraphBackend> backend_;
};

} // namespace raefusion::retrieval
