#pragma once

#include "raefusion/common/cancellation.hpp"
#include "raefusion/common/result.hpp"
#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/adaptive_tuner.hpp"
#include "raefusion/retrieval/backends.hpp"
#include "raefusion/retrieval/candidate_source.hpp"
#include "raefusion/retrieval/early_exit.hpp"
#include "raefusion/retrieval/failure_journal.hpp"
#include "raefusion/retrieval/fusion_engine.hpp"
#include "raefusion/retrieval/metrics.hpp"
#include "raefusion/retrieval/miss_recorder.hpp"
#include "raefusion/retrieval/query_classifier.hpp"
#include "raefusion/retrieval/result_cache.hpp"
#include "raefusion/retrieval/weight_policy.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace raefusion::retrieval {

struct RetrieveOptions {
  std::optional<std::size_t> limit;
  std::optional<std::uint32_t> traversal_depth;
  std::optional<FusionStrategy> strategy;
  std::optional<std::string> profile;
  bool use_cache = true;
};

struct SourceFailure {
  EngineId engine = EngineId::Vector;
  common::ErrorCode code = common::ErrorCode::SourceUnavailable;
  std::string message;
};

struct RetrievalResponse {
  std::vector<FusedResult> results;
  RetrievalStatus status = RetrievalStatus::Normal;
  QueryClassification classification;
  std::shared_ptr<const WeightProfile> profile;
  FusionStrategy strategy = FusionStrategy::Rrf;
  std::vector<EngineId> engines_queried;
  std::vector<EngineId> engines_skipped;
  std::vector<SourceFailure> failures;
  std::optional<FailureEvent> miss;
  bool profile_fallback = false;
  bool cancelled = false;
  std::chrono::milliseconds duration{0};
};

struct EngineBackends {
  std::shared_ptr<IVectorBackend> vector;
  std::shared_ptr<ILexicalBackend> lexical;
  std::shared_ptr<IGraphBackend> graph;
  std::vector<std::shared_ptr<IReflectionSink>> reflection_sinks;
};

/// Query entry point: classify, dispatch, fuse, inspect, learn.
///
/// Cheap engines run in parallel first; expensive engines (graph traversal)
/// run second, seeded from the first stage's best items, unless the
/// early-exit guard says the first stage was already specific enough.
class RetrievalEngine {
public:
  /// Also installs the configured `[observability]` backend as the process
  /// observer.
  [[nodiscard]] static common::Result<std::unique_ptr<RetrievalEngine>>
  create(const config::Config &config, EngineBackends backends);

  ~RetrievalEngine();

  RetrievalEngine(const RetrievalEngine &) = delete;
  RetrievalEngine &operator=(const RetrievalEngine &) = delete;

  [[nodiscard]] RetrievalResponse retrieve(const Query &query, const RetrieveOptions &options = {},
                                           const common::CancellationToken &cancel = {});

  /// Feedback on an item served in `context`; its rank and contributions are
  /// read from the response.
  [[nodiscard]] common::Status submit_feedback(const std::string &item_id,
                                               const RetrievalResponse &context,
                                               Relevance relevance);
  [[nodiscard]] common::Status submit_feedback(Feedback feedback);

  [[nodiscard]] MetricsSnapshot metrics() const;

  /// Starts and stops background tuning.
  void start();
  void stop();

  [[nodiscard]] WeightPolicyStore &policy() { return *store_; }
  [[nodiscard]] AdaptiveTuner &tuner() { return *tuner_; }
  [[nodiscard]] MissRecorder &miss_recorder() { return *recorder_; }
  [[nodiscard]] const FusionEngine &fusion() const { return fusion_; }
  [[nodiscard]] std::shared_ptr<ResultCache> cache() const { return cache_; }
  [[nodiscard]] std::shared_ptr<FailureJournal> journal() const { return journal_; }

private:
  RetrievalEngine(config::Config config, std::shared_ptr<WeightPolicyStore> store);

  struct DispatchOutcome {
    EngineId engine;
    common::Result<std::vector<CandidateResult>> result;
  };

  [[nodiscard]] std::vector<DispatchOutcome>
  dispatch(const std::vector<CandidateSource *> &sources, const SourceRequest &request,
           std::chrono::steady_clock::time_point deadline,
           const common::CancellationToken &cancel) const;

  [[nodiscard]] bool collect(std::vector<DispatchOutcome> outcomes, CandidateLists &lists,
                             RetrievalResponse &response) const;

  [[nodiscard]] std::vector<std::string> graph_seeds(const CandidateLists &lists,
                                                     const WeightProfile &profile,
                                                     std::optional<FusionStrategy> strategy) const;

  [[nodiscard]] std::shared_ptr<const WeightProfile>
  select_profile(const QueryClassification &classification, const RetrieveOptions &options,
                 bool &fallback) const;

  config::Config config_;
  std::shared_ptr<WeightPolicyStore> store_;
  QueryClassifier classifier_;
  FusionEngine fusion_;
  EarlyExitGuard guard_;
  std::shared_ptr<ResultCache> cache_;
  std::vector<std::unique_ptr<CandidateSource>> sources_;
  std::shared_ptr<AdaptiveTuner> tuner_;
  std::shared_ptr<FailureJournal> journal_;
  std::unique_ptr<MissRecorder> recorder_;
  RetrievalMetrics metrics_;
};

} // namespace raefusion::retrieval
