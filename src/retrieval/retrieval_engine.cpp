#include "raefusion/retrieval/retrieval_engine.hpp"

#include "raefusion/common/strings.hpp"
#include "raefusion/config/config.hpp"
#include "raefusion/observability/factory.hpp"
#include "raefusion/observability/global.hpp"

#include <algorithm>
#include <future>

namespace raefusion::retrieval {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

std::vector<std::string> engine_names(const std::vector<EngineId> &engines) {
  std::vector<std::string> names;
  names.reserve(engines.size());
  for (const auto engine : engines) {
    names.emplace_back(engine_to_string(engine));
  }
  return names;
}

} // namespace

RetrievalEngine::RetrievalEngine(config::Config config, std::shared_ptr<WeightPolicyStore> store)
    : config_(std::move(config)), store_(std::move(store)), classifier_(config_.classifier),
      fusion_(config_.fusion), guard_(config_.early_exit), metrics_(config_.metrics.window) {}

RetrievalEngine::~RetrievalEngine() { stop(); }

common::Result<std::unique_ptr<RetrievalEngine>>
RetrievalEngine::create(const config::Config &config, EngineBackends backends) {
  using EngineResult = common::Result<std::unique_ptr<RetrievalEngine>>;

  const auto validation = config::validate_config(config);
  if (!validation.ok()) {
    return EngineResult::failure(common::ErrorCode::InvalidConfig, validation.error());
  }
  if (backends.vector == nullptr && backends.lexical == nullptr && backends.graph == nullptr) {
    return EngineResult::failure(common::ErrorCode::InvalidConfig,
                                 "at least one retrieval backend is required");
  }

  auto store = WeightPolicyStore::from_config(config.profiles);
  if (!store.ok()) {
    return EngineResult::failure(store.status());
  }
  observability::install_observer(config);

  std::unique_ptr<RetrievalEngine> engine(new RetrievalEngine(config, store.value()));
  const auto &cfg = engine->config_;

  if (cfg.cache.enabled && cfg.cache.ttl_seconds > 0 && cfg.cache.max_entries > 0) {
    engine->cache_ = std::make_shared<ResultCache>(
        std::chrono::seconds(cfg.cache.ttl_seconds), cfg.cache.max_entries);
  }

  const SourceOptions source_options{.failure_threshold = cfg.sources.failure_threshold,
                                     .cooldown = std::chrono::milliseconds(cfg.sources.cooldown_ms)};
  if (backends.lexical != nullptr) {
    engine->sources_.push_back(
        std::make_unique<LexicalSource>(backends.lexical, source_options, engine->cache_));
  }
  if (backends.vector != nullptr) {
    engine->sources_.push_back(
        std::make_unique<VectorSource>(backends.vector, source_options, engine->cache_));
  }
  if (backends.graph != nullptr) {
    engine->sources_.push_back(
        std::make_unique<GraphSource>(backends.graph, source_options, engine->cache_));
  }

  engine->tuner_ = std::make_shared<AdaptiveTuner>(engine->store_, cfg.tuner);
  engine->recorder_ = std::make_unique<MissRecorder>(cfg.miss);
  if (cfg.tuner.enabled) {
    engine->recorder_->add_sink(engine->tuner_);
  }

  if (cfg.miss.journal_enabled) {
    auto journal =
        std::make_shared<FailureJournal>(std::filesystem::path(common::expand_path(cfg.miss.journal_path)));
    if (!journal->is_open()) {
      return EngineResult::failure(common::ErrorCode::Storage,
                                   "failure journal unavailable: " + journal->open_error());
    }
    engine->journal_ = journal;
    engine->recorder_->add_sink(journal);
  }

  for (auto &sink : backends.reflection_sinks) {
    engine->recorder_->add_sink(std::move(sink));
  }

  return EngineResult::success(std::move(engine));
}

void RetrievalEngine::start() { tuner_->start(); }

void RetrievalEngine::stop() {
  if (tuner_ != nullptr) {
    tuner_->stop();
  }
}

std::shared_ptr<const WeightProfile>
RetrievalEngine::select_profile(const QueryClassification &classification,
                                const RetrieveOptions &options, bool &fallback) const {
  auto selected = store_->current_profile(classification);
  if (!options.profile.has_value()) {
    return selected;
  }

  if (auto forced = store_->profile(*options.profile); forced != nullptr) {
    return forced;
  }
  fallback = true;
  observability::record_profile_fallback(*options.profile, selected->name, "unknown profile");
  return selected;
}

std::vector<RetrievalEngine::DispatchOutcome>
RetrievalEngine::dispatch(const std::vector<CandidateSource *> &sources,
                          const SourceRequest &request,
                          const std::chrono::steady_clock::time_point deadline,
                          const common::CancellationToken &cancel) const {
  const auto source_timeout = std::chrono::milliseconds(config_.retrieval.source_timeout_ms);

  std::vector<std::future<DispatchOutcome>> futures;
  futures.reserve(sources.size());
  for (auto *source : sources) {
    futures.push_back(std::async(std::launch::async, [source, &request, deadline, source_timeout,
                                                      cancel]() {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        return DispatchOutcome{
            .engine = source->engine(),
            .result = common::Result<std::vector<CandidateResult>>::failure(
                common::ErrorCode::SourceUnavailable,
                std::string(engine_to_string(source->engine())) + ": query deadline exceeded")};
      }
      return DispatchOutcome{.engine = source->engine(),
                             .result = source->fetch(request, std::min(source_timeout, remaining),
                                                     cancel)};
    }));
  }

  std::vector<DispatchOutcome> outcomes;
  outcomes.reserve(futures.size());
  for (auto &future : futures) {
    outcomes.push_back(future.get());
  }
  return outcomes;
}

bool RetrievalEngine::collect(std::vector<DispatchOutcome> outcomes, CandidateLists &lists,
                              RetrievalResponse &response) const {
  bool cancelled = false;
  for (auto &outcome : outcomes) {
    response.engines_queried.push_back(outcome.engine);
    if (outcome.result.ok()) {
      lists[outcome.engine] = SourceResult{.candidates = std::move(outcome.result.value())};
      continue;
    }
    if (outcome.result.code() == common::ErrorCode::Cancelled) {
      cancelled = true;
      continue;
    }
    lists[outcome.engine] = SourceResult{.available = false, .error = outcome.result.error()};
    response.failures.push_back(SourceFailure{
        .engine = outcome.engine, .code = outcome.result.code(), .message = outcome.result.error()});
  }
  return cancelled;
}

std::vector<std::string>
RetrievalEngine::graph_seeds(const CandidateLists &lists, const WeightProfile &profile,
                             const std::optional<FusionStrategy> strategy) const {
  std::vector<std::string> seeds;
  if (config_.retrieval.graph_seed_count == 0) {
    return seeds;
  }
  const auto preliminary = fusion_.fuse(lists, profile, strategy);
  for (const auto &result : preliminary.results) {
    if (seeds.size() >= config_.retrieval.graph_seed_count) {
      break;
    }
    seeds.push_back(result.item_id);
  }
  return seeds;
}

RetrievalResponse RetrievalEngine::retrieve(const Query &query, const RetrieveOptions &options,
                                            const common::CancellationToken &cancel) {
  const auto started = std::chrono::steady_clock::now();
  RetrievalResponse response;

  if (cancel.is_cancelled()) {
    response.cancelled = true;
    return response;
  }

  response.classification = classifier_.classify(query);
  response.profile = select_profile(response.classification, options, response.profile_fallback);
  response.strategy = options.strategy.value_or(response.profile->strategy);

  if (common::trim(query.text).empty()) {
    return response;
  }

  std::size_t limit = options.limit.value_or(config_.retrieval.default_limit);
  if (limit == 0) {
    limit = config_.retrieval.default_limit;
  }

  SourceRequest request;
  request.text = query.text;
  request.filters = query.filters;
  request.limit = limit * config_.retrieval.candidate_multiplier;
  request.depth = options.traversal_depth.value_or(
      query.traversal_depth.value_or(config_.retrieval.default_traversal_depth));
  request.use_cache = options.use_cache;

  std::vector<CandidateSource *> cheap;
  std::vector<CandidateSource *> expensive;
  for (const auto &source : sources_) {
    (guard_.is_expensive(source->engine()) ? expensive : cheap).push_back(source.get());
  }

  const auto deadline = started + std::chrono::milliseconds(config_.retrieval.query_timeout_ms);
  CandidateLists lists;
  bool cancelled = collect(dispatch(cheap, request, deadline, cancel), lists, response);

  if (!cancelled && !expensive.empty()) {
    std::vector<EngineId> remaining;
    for (auto *source : expensive) {
      remaining.push_back(source->engine());
    }

    if (guard_.should_skip(remaining, lists, response.classification)) {
      const auto primary = lists.find(guard_.primary_engine());
      observability::record_early_exit(engine_names(remaining),
                                       primary == lists.end() ? 0 : primary->second.candidates.size());
      response.engines_skipped = remaining;
    } else {
      SourceRequest seeded = request;
      seeded.seeds = graph_seeds(lists, *response.profile, options.strategy);
      if (seeded.seeds.empty() && !lists.empty()) {
        // Nothing to traverse from.
        response.engines_skipped = remaining;
      } else {
        cancelled = collect(dispatch(expensive, seeded, deadline, cancel), lists, response);
      }
    }
  }

  if (cancelled || cancel.is_cancelled()) {
    response.cancelled = true;
    response.duration = elapsed_since(started);
    return response;
  }

  auto fused = fusion_.fuse(lists, *response.profile, options.strategy);
  response.status = fused.status;
  response.profile = fused.profile;
  response.strategy = fused.strategy;
  response.profile_fallback = response.profile_fallback || fused.profile_fallback;
  response.results = std::move(fused.results);
  if (response.results.size() > limit) {
    response.results.resize(limit);
  }

  if (response.status == RetrievalStatus::Unavailable) {
    observability::record_error("retrieval", "all retrieval sources unavailable");
  }

  response.miss = recorder_->inspect(response.results, response.classification, *response.profile,
                                     MissContext{.query_text = query.text,
                                                 .engines_queried = response.engines_queried,
                                                 .status = response.status,
                                                 .cancelled = false,
                                                 .strategy = response.strategy});

  const double top_score = response.results.empty() ? 0.0 : response.results.front().score;
  metrics_.record_query(response.status, top_score, response.miss.has_value(),
                        fusion_.score_ceiling(*response.profile, response.strategy));
  response.duration = elapsed_since(started);

  observability::record_metric(observability::TopScoreMetric{.score = top_score});
  observability::record_metric(observability::MissRateMetric{.rate = metrics_.snapshot().miss_rate});
  observability::record_retrieval(std::string(label_to_string(response.classification.label)),
                                  response.profile->name,
                                  std::string(status_to_string(response.status)),
                                  response.results.size(), response.duration);
  return response;
}

common::Status RetrievalEngine::submit_feedback(const std::string &item_id,
                                                const RetrievalResponse &context,
                                                const Relevance relevance) {
  const auto it = std::find_if(context.results.begin(), context.results.end(),
                               [&](const FusedResult &result) { return result.item_id == item_id; });
  if (it == context.results.end()) {
    return common::Status::error(common::ErrorCode::UnknownItem,
                                 "item " + item_id + " was not served in this response");
  }

  Feedback feedback;
  feedback.item_id = item_id;
  feedback.contributions = it->contributions;
  feedback.rank = static_cast<std::size_t>(std::distance(context.results.begin(), it)) + 1;
  feedback.relevance = relevance;
  return submit_feedback(std::move(feedback));
}

common::Status RetrievalEngine::submit_feedback(Feedback feedback) {
  if (feedback.item_id.empty()) {
    return common::Status::error(common::ErrorCode::UnknownItem, "feedback requires an item id");
  }

  metrics_.record_feedback(feedback.rank, feedback.relevance);
  if (config_.tuner.enabled) {
    tuner_->observe(std::move(feedback));
    observability::record_metric(
        observability::PendingFeedbackMetric{.depth = tuner_->pending()});
  }
  return common::Status::success();
}

MetricsSnapshot RetrievalEngine::metrics() const {
  auto snapshot = metrics_.snapshot();
  snapshot.tuned_profile = store_->tuned_profile();
  snapshot.pending_feedback = tuner_->pending();
  return snapshot;
}

} // namespace raefusion::retrieval
